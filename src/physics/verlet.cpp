/// @file verlet.cpp
/// @brief Verlet integration and constraint relaxation

#include <newton/physics/verlet.hpp>

#include <cmath>

namespace newton_physics::verlet {

using newton_math::Vec2;

void integrate(std::vector<VerletParticle>& particles, float dt, float damping) {
    const float dt_sq = dt * dt;

    for (auto& p : particles) {
        if (p.pinned) {
            p.acceleration = newton_math::vec2::ZERO;
            continue;
        }

        const Vec2 velocity = p.displacement() * damping;
        p.previous_position = p.position;
        p.position += velocity + p.acceleration * dt_sq;
        p.acceleration = newton_math::vec2::ZERO;
    }
}

void accelerate(std::vector<VerletParticle>& particles, const Vec2& acceleration) {
    for (auto& p : particles) {
        if (!p.pinned) {
            p.acceleration += acceleration;
        }
    }
}

std::size_t relax(std::vector<VerletParticle>& particles, std::vector<VerletConstraint>& constraints) {
    std::size_t broken = 0;

    for (auto& c : constraints) {
        if (c.broken) {
            continue;
        }

        auto& a = particles[c.particle_a];
        auto& b = particles[c.particle_b];

        const Vec2 diff = b.position - a.position;
        const float dist = newton_math::length(diff);
        if (dist == 0.0f) {
            continue;
        }

        if (c.break_threshold && dist > c.rest_length * *c.break_threshold) {
            c.broken = true;
            ++broken;
            continue;
        }

        const float total_inverse_mass = a.inverse_mass + b.inverse_mass;
        if (total_inverse_mass == 0.0f) {
            continue;
        }

        const float error = (dist - c.rest_length) / dist;
        const Vec2 correction = diff * (error * c.stiffness * 0.5f);

        a.position += correction * (a.inverse_mass / total_inverse_mass);
        b.position -= correction * (b.inverse_mass / total_inverse_mass);
    }

    return broken;
}

std::size_t solve(std::vector<VerletParticle>& particles, std::vector<VerletConstraint>& constraints,
                  std::uint32_t iterations) {
    std::size_t broken = 0;
    for (std::uint32_t i = 0; i < iterations; ++i) {
        broken += relax(particles, constraints);
    }
    return broken;
}

} // namespace newton_physics::verlet
