/// @file types.hpp
/// @brief Core types for newton_physics

#pragma once

#include "fwd.hpp"

#include <newton/math/vec.hpp>
#include <newton/core/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace newton_physics {

// =============================================================================
// Body Types
// =============================================================================

/// Rigidbody motion type
enum class BodyType : std::uint8_t {
    Static,         ///< Never moves, infinite mass, collides
    Dynamic,        ///< Simulated by physics
    Dead,           ///< Removed from simulation, no collision
};

/// Get body type name
[[nodiscard]] const char* to_string(BodyType type);

// =============================================================================
// Collision Response
// =============================================================================

/// How collisions are handled
enum class CollisionResponse : std::uint8_t {
    Collide,        ///< Full collision response
    Sensor,         ///< Detection only, no response
    None,           ///< No detection or response
};

/// Get collision response name
[[nodiscard]] const char* to_string(CollisionResponse response);

// =============================================================================
// Materials
// =============================================================================

/// Surface material properties
struct PhysicsMaterial {
    float restitution = 0.3f;   ///< Bounciness [0, 1]
    float friction = 0.5f;      ///< Friction coefficient [0, inf)

    /// Common material presets
    [[nodiscard]] static PhysicsMaterial default_material() { return {0.3f, 0.5f}; }
    [[nodiscard]] static PhysicsMaterial rubber() { return {0.8f, 0.9f}; }
    [[nodiscard]] static PhysicsMaterial ice() { return {0.1f, 0.05f}; }
    [[nodiscard]] static PhysicsMaterial metal() { return {0.5f, 0.3f}; }
    [[nodiscard]] static PhysicsMaterial wood() { return {0.3f, 0.6f}; }
    [[nodiscard]] static PhysicsMaterial stone() { return {0.2f, 0.7f}; }
    [[nodiscard]] static PhysicsMaterial bouncy() { return {0.95f, 0.3f}; }
    [[nodiscard]] static PhysicsMaterial sticky() { return {0.0f, 1.0f}; }

    /// Look up a preset by name ("default", "rubber", "ice", ...)
    [[nodiscard]] static std::optional<PhysicsMaterial> preset(const std::string& name);

    bool operator==(const PhysicsMaterial& other) const noexcept {
        return restitution == other.restitution && friction == other.friction;
    }
};

// =============================================================================
// Collision Filtering
// =============================================================================

/// Category/mask bitmasks plus a signed group
///
/// Two filters sharing a nonzero group always collide when the group is
/// positive and never collide when it is negative; otherwise each mask must
/// accept the other's category.
struct CollisionFilter {
    std::uint32_t category = 1;             ///< What this body is
    std::uint32_t mask = 0xFFFFFFFFu;       ///< What this body collides with
    std::int32_t group = 0;                 ///< Group override (0 = none)

    /// Check if two filters allow a collision
    [[nodiscard]] static bool should_collide(const CollisionFilter& a, const CollisionFilter& b) noexcept {
        if (a.group != 0 && a.group == b.group) {
            return a.group > 0;
        }
        return (a.mask & b.category) != 0 && (b.mask & a.category) != 0;
    }
};

// =============================================================================
// Contacts
// =============================================================================

/// Contact reported between two bodies
struct ContactInfo {
    std::string body_a;
    std::string body_b;
    newton_math::Vec2 point{0.0f, 0.0f};    ///< World contact point
    newton_math::Vec2 normal{0.0f, 0.0f};   ///< Unit normal from A towards B
    float depth = 0.0f;                     ///< Penetration depth
    float impulse = 0.0f;                   ///< Normal impulse magnitude
};

// =============================================================================
// Space Configuration
// =============================================================================

/// Space-wide simulation settings
struct PhysicsSpaceConfig {
    float time_step = 1.0f / 60.0f;                     ///< Fixed step (seconds)
    std::uint32_t velocity_iterations = 8;              ///< Collision rounds per step
    std::uint32_t position_iterations = 3;              ///< Soft body relaxation rounds per step
    newton_math::Vec2 gravity{0.0f, 980.0f};            ///< Pixels/s^2, +Y down
    bool sleep_enabled = true;
    float sleep_time_threshold = 0.5f;                  ///< Seconds below threshold before sleeping
    float sleep_velocity_threshold = 10.0f;             ///< Linear speed threshold
    float collision_slop = 0.5f;                        ///< Allowed penetration
    float collision_bias = 0.1f;                        ///< Positional correction factor
    std::uint32_t seed = 12345;
    std::uint32_t checkpoint_interval = 30;             ///< Frames between checkpoints
    float soft_body_damping = 0.98f;                    ///< Verlet velocity retention

    /// Default configuration
    [[nodiscard]] static PhysicsSpaceConfig defaults() { return PhysicsSpaceConfig{}; }

    /// Validate value ranges
    [[nodiscard]] newton_core::Result<void> validate() const;
};

} // namespace newton_physics
