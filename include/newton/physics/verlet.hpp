/// @file verlet.hpp
/// @brief Position-based Verlet particles and distance constraints

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace newton_physics {

// =============================================================================
// Particles and Constraints
// =============================================================================

/// Point mass integrated by position Verlet
///
/// Velocity is implicit: position - previous_position.
struct VerletParticle {
    std::string id;
    newton_math::Vec2 position{0.0f, 0.0f};
    newton_math::Vec2 previous_position{0.0f, 0.0f};
    newton_math::Vec2 acceleration{0.0f, 0.0f};
    float mass = 1.0f;
    float inverse_mass = 1.0f;      ///< Zero when pinned
    bool pinned = false;
    float radius = 1.0f;

    /// Implicit displacement over the last step
    [[nodiscard]] newton_math::Vec2 displacement() const noexcept { return position - previous_position; }
};

/// Distance constraint between two particles of the same container
struct VerletConstraint {
    std::string id;
    std::size_t particle_a = 0;
    std::size_t particle_b = 0;
    float rest_length = 0.0f;
    float stiffness = 1.0f;                 ///< [0, 1]
    bool broken = false;
    std::optional<float> break_threshold;   ///< Breaks beyond rest_length * threshold
};

// =============================================================================
// Verlet Kernel
// =============================================================================

namespace verlet {

/// Advance unpinned particles and clear accumulated acceleration
///
/// x' = x + (x - x_prev) * damping + a * dt^2
void integrate(std::vector<VerletParticle>& particles, float dt, float damping);

/// Add an acceleration to every unpinned particle
void accelerate(std::vector<VerletParticle>& particles, const newton_math::Vec2& acceleration);

/// One relaxation pass over all constraints, returns how many broke
std::size_t relax(std::vector<VerletParticle>& particles, std::vector<VerletConstraint>& constraints);

/// Run `iterations` relaxation passes, returns how many constraints broke
std::size_t solve(std::vector<VerletParticle>& particles, std::vector<VerletConstraint>& constraints,
                  std::uint32_t iterations);

} // namespace verlet

} // namespace newton_physics
