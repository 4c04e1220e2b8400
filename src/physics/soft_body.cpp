/// @file soft_body.cpp
/// @brief Soft body construction and simulation

#include <newton/physics/soft_body.hpp>

#include <algorithm>
#include <cmath>

namespace newton_physics {

using newton_core::SimulationError;
using newton_math::Vec2;

// =============================================================================
// SoftBody
// =============================================================================

newton_core::Result<SoftBody> SoftBody::create(SoftBodyConfig config) {
    if (config.id.empty()) {
        return newton_core::Err<SoftBody>(SimulationError::invalid_config("soft body id must not be empty"));
    }

    SoftBody body;
    for (std::size_t i = 0; i < config.particles.size(); ++i) {
        const auto& p = config.particles[i];
        if (!body.m_particle_index.emplace(p.id, i).second) {
            return newton_core::Err<SoftBody>(
                SimulationError::invalid_config(config.id, "duplicate particle id '" + p.id + "'"));
        }
        if (!p.pinned && !(p.mass > 0.0f)) {
            return newton_core::Err<SoftBody>(
                SimulationError::invalid_config(config.id, "particle '" + p.id + "' needs a positive mass"));
        }
    }

    for (auto& c : config.constraints) {
        if (!body.m_particle_index.count(c.particle_a) || !body.m_particle_index.count(c.particle_b)) {
            return newton_core::Err<SoftBody>(
                SimulationError::invalid_config(config.id, "constraint '" + c.id + "' references an unknown particle"));
        }
        if (c.stiffness < 0.0f || c.stiffness > 1.0f) {
            return newton_core::Err<SoftBody>(
                SimulationError::invalid_config(config.id, "constraint '" + c.id + "' stiffness must be in [0, 1]"));
        }
        // Zero disables breaking, same as a cloth tear threshold
        if (c.break_threshold && *c.break_threshold == 0.0f) {
            c.break_threshold.reset();
        }
        if (c.break_threshold && !(std::isfinite(*c.break_threshold) && *c.break_threshold >= 1.0f)) {
            return newton_core::Err<SoftBody>(
                SimulationError::invalid_config(config.id, "constraint '" + c.id + "' break threshold must be at least 1"));
        }
    }

    body.m_config = std::move(config);
    body.reset();
    return newton_core::Ok(std::move(body));
}

std::optional<std::size_t> SoftBody::particle_index(const std::string& particle_id) const {
    auto it = m_particle_index.find(particle_id);
    if (it == m_particle_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

SoftBodyState SoftBody::state() const {
    SoftBodyState s;
    s.id = m_config.id;
    s.particles.reserve(m_particles.size());
    for (const auto& p : m_particles) {
        s.particles.push_back(ParticleState{p.id, p.position, p.displacement()});
    }
    for (const auto& c : m_constraints) {
        if (c.broken) {
            s.broken_constraints.push_back(c.id);
        }
    }
    return s;
}

void SoftBody::load_state(const SoftBodyState& state) {
    for (const auto& ps : state.particles) {
        if (auto index = particle_index(ps.id)) {
            auto& p = m_particles[*index];
            p.position = ps.position;
            p.previous_position = ps.position - ps.velocity;
            p.acceleration = newton_math::vec2::ZERO;
        }
    }

    for (auto& c : m_constraints) {
        c.broken = std::find(state.broken_constraints.begin(), state.broken_constraints.end(), c.id)
                   != state.broken_constraints.end();
    }
}

void SoftBody::reset() {
    m_particles.clear();
    m_particles.reserve(m_config.particles.size());
    for (const auto& pc : m_config.particles) {
        VerletParticle p;
        p.id = pc.id;
        p.position = pc.position;
        p.previous_position = pc.previous_position.value_or(pc.position);
        p.mass = pc.mass;
        p.pinned = pc.pinned;
        p.inverse_mass = pc.pinned ? 0.0f : 1.0f / pc.mass;
        p.radius = pc.radius;
        m_particles.push_back(std::move(p));
    }

    m_constraints.clear();
    m_constraints.reserve(m_config.constraints.size());
    for (const auto& cc : m_config.constraints) {
        VerletConstraint c;
        c.id = cc.id;
        c.particle_a = m_particle_index.at(cc.particle_a);
        c.particle_b = m_particle_index.at(cc.particle_b);
        c.rest_length = cc.rest_length.value_or(
            newton_math::distance(m_particles[c.particle_a].position, m_particles[c.particle_b].position));
        c.stiffness = cc.stiffness;
        c.break_threshold = cc.break_threshold;
        m_constraints.push_back(std::move(c));
    }
}

// =============================================================================
// SoftBodySimulator
// =============================================================================

newton_core::Result<void> SoftBodySimulator::add_soft_body(SoftBodyConfig config) {
    if (contains(config.id)) {
        return newton_core::Err(SimulationError::duplicate_id(config.id));
    }

    auto body = SoftBody::create(std::move(config));
    if (!body) {
        return newton_core::Err(body.error());
    }

    m_soft_bodies.push_back(std::move(body).value());
    return newton_core::Ok();
}

bool SoftBodySimulator::remove_soft_body(const std::string& id) {
    auto it = std::find_if(m_soft_bodies.begin(), m_soft_bodies.end(),
                           [&id](const SoftBody& b) { return b.id() == id; });
    if (it == m_soft_bodies.end()) {
        return false;
    }
    m_soft_bodies.erase(it);
    return true;
}

SoftBody* SoftBodySimulator::find(const std::string& id) {
    for (auto& body : m_soft_bodies) {
        if (body.id() == id) {
            return &body;
        }
    }
    return nullptr;
}

const SoftBody* SoftBodySimulator::find(const std::string& id) const {
    for (const auto& body : m_soft_bodies) {
        if (body.id() == id) {
            return &body;
        }
    }
    return nullptr;
}

void SoftBodySimulator::apply_acceleration(const std::string& id, const Vec2& acceleration) {
    if (auto* body = find(id)) {
        verlet::accelerate(body->particles(), acceleration);
    }
}

void SoftBodySimulator::apply_acceleration_to_all(const Vec2& acceleration) {
    for (auto& body : m_soft_bodies) {
        verlet::accelerate(body.particles(), acceleration);
    }
}

void SoftBodySimulator::integrate(float dt, float damping) {
    for (auto& body : m_soft_bodies) {
        verlet::integrate(body.particles(), dt, damping);
    }
}

std::size_t SoftBodySimulator::solve_constraints(std::uint32_t iterations) {
    std::size_t broken = 0;
    for (auto& body : m_soft_bodies) {
        broken += verlet::solve(body.particles(), body.constraints(), iterations);
    }
    return broken;
}

std::vector<SoftBodyState> SoftBodySimulator::states() const {
    std::vector<SoftBodyState> result;
    result.reserve(m_soft_bodies.size());
    for (const auto& body : m_soft_bodies) {
        result.push_back(body.state());
    }
    return result;
}

void SoftBodySimulator::load_state(const SoftBodyState& state) {
    if (auto* body = find(state.id)) {
        body->load_state(state);
    }
}

void SoftBodySimulator::reset_all() {
    for (auto& body : m_soft_bodies) {
        body.reset();
    }
}

} // namespace newton_physics
