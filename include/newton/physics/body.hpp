/// @file body.hpp
/// @brief Rigid bodies and the rigid body simulator

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace newton_physics {

// =============================================================================
// Body Configuration
// =============================================================================

/// Description of a rigid body as added by the caller
///
/// The kinematic fields (position, velocity, angle, angular velocity) are the
/// initial state; replays from frame 0 start from them.
struct RigidBodyConfig {
    std::string id;
    std::string layer_id;                       ///< Visual layer driven by this body

    BodyType type = BodyType::Dynamic;
    float mass = 1.0f;
    std::optional<float> moment;                ///< Computed from shape if unset

    newton_math::Vec2 position{0.0f, 0.0f};
    newton_math::Vec2 velocity{0.0f, 0.0f};
    float angle = 0.0f;                         ///< Radians
    float angular_velocity = 0.0f;

    Shape shape = CircleShape{};
    PhysicsMaterial material;
    CollisionFilter filter;
    CollisionResponse response = CollisionResponse::Collide;

    float linear_damping = 0.1f;                ///< Velocity reduction per second
    float angular_damping = 0.1f;
    bool fixed_rotation = false;

    bool can_sleep = true;

    /// Check the values the simulator relies on
    [[nodiscard]] newton_core::Result<void> validate() const;
};

/// Dynamic circle body with default material, filter and damping
[[nodiscard]] RigidBodyConfig make_circle_body(const std::string& id, const std::string& layer_id,
                                               const newton_math::Vec2& position, float radius,
                                               float mass = 1.0f);

/// Dynamic box body with default material, filter and damping
[[nodiscard]] RigidBodyConfig make_box_body(const std::string& id, const std::string& layer_id,
                                            const newton_math::Vec2& position, float width, float height,
                                            float mass = 1.0f);

/// Per-body output state
struct RigidBodyState {
    std::string id;
    newton_math::Vec2 position{0.0f, 0.0f};
    newton_math::Vec2 velocity{0.0f, 0.0f};
    float angle = 0.0f;
    float angular_velocity = 0.0f;
    bool is_sleeping = false;
};

// =============================================================================
// RigidBody
// =============================================================================

/// Simulated rigid body
class RigidBody {
public:
    explicit RigidBody(RigidBodyConfig config);

    // Identity and static properties
    [[nodiscard]] const RigidBodyConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const std::string& id() const noexcept { return m_config.id; }
    [[nodiscard]] BodyType type() const noexcept { return m_config.type; }
    [[nodiscard]] const Shape& shape() const noexcept { return m_config.shape; }
    [[nodiscard]] float mass() const noexcept { return m_config.mass; }
    [[nodiscard]] float inverse_mass() const noexcept { return m_inverse_mass; }
    [[nodiscard]] float inverse_inertia() const noexcept { return m_inverse_inertia; }
    [[nodiscard]] float moment_of_inertia() const noexcept { return m_inertia; }

    /// Static, dead, or otherwise infinite mass
    [[nodiscard]] bool is_immovable() const noexcept { return m_inverse_mass == 0.0f; }

    // Kinematic state
    [[nodiscard]] const newton_math::Vec2& position() const noexcept { return m_position; }
    [[nodiscard]] const newton_math::Vec2& velocity() const noexcept { return m_velocity; }
    [[nodiscard]] float angle() const noexcept { return m_angle; }
    [[nodiscard]] float angular_velocity() const noexcept { return m_angular_velocity; }
    [[nodiscard]] const newton_math::Vec2& force() const noexcept { return m_force; }
    [[nodiscard]] float torque() const noexcept { return m_torque; }

    void set_position(const newton_math::Vec2& p) noexcept { m_position = p; }
    void set_velocity(const newton_math::Vec2& v) noexcept { m_velocity = v; }
    void set_angle(float a) noexcept { m_angle = a; }
    void set_angular_velocity(float w) noexcept { m_angular_velocity = w; }

    // Sleep
    [[nodiscard]] bool is_sleeping() const noexcept { return m_sleeping; }
    [[nodiscard]] float sleep_time() const noexcept { return m_sleep_time; }
    void wake() noexcept {
        m_sleeping = false;
        m_sleep_time = 0.0f;
    }
    void set_sleep_state(bool sleeping, float sleep_time) noexcept {
        m_sleeping = sleeping;
        m_sleep_time = sleep_time;
    }

    /// Accumulate a force, plus torque when applied at a world point
    void apply_force(const newton_math::Vec2& force, std::optional<newton_math::Vec2> point = std::nullopt);

    /// Change velocity immediately and wake the body
    void apply_impulse(const newton_math::Vec2& impulse, std::optional<newton_math::Vec2> point = std::nullopt);

    void clear_forces() noexcept {
        m_force = newton_math::vec2::ZERO;
        m_torque = 0.0f;
    }

    /// Semi-implicit Euler step with damping and sleep bookkeeping
    void integrate(float dt, const PhysicsSpaceConfig& space);

    /// Output state
    [[nodiscard]] RigidBodyState state() const;

    /// Overwrite kinematic state (sleep timer is cleared)
    void load_state(const RigidBodyState& state);

    /// Return to the configured initial state
    void reset();

    /// Replace the configured initial kinematic state
    void set_initial_state(const newton_math::Vec2& position, const newton_math::Vec2& velocity,
                           float angle, float angular_velocity);

private:
    RigidBodyConfig m_config;

    float m_inertia = 0.0f;
    float m_inverse_mass = 0.0f;
    float m_inverse_inertia = 0.0f;

    newton_math::Vec2 m_position{0.0f, 0.0f};
    newton_math::Vec2 m_velocity{0.0f, 0.0f};
    float m_angle = 0.0f;
    float m_angular_velocity = 0.0f;

    newton_math::Vec2 m_force{0.0f, 0.0f};
    float m_torque = 0.0f;

    bool m_sleeping = false;
    float m_sleep_time = 0.0f;
};

// =============================================================================
// RigidBodySimulator
// =============================================================================

/// Owns all rigid bodies in insertion order with an id index
class RigidBodySimulator {
public:
    RigidBodySimulator() = default;

    /// Add a body; fails on invalid config or duplicate id
    [[nodiscard]] newton_core::Result<void> add_body(RigidBodyConfig config);

    /// Remove a body, returns false if it did not exist
    bool remove_body(const std::string& id);

    [[nodiscard]] RigidBody* find(const std::string& id);
    [[nodiscard]] const RigidBody* find(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const { return m_index.count(id) != 0; }

    [[nodiscard]] std::vector<RigidBody>& bodies() noexcept { return m_bodies; }
    [[nodiscard]] const std::vector<RigidBody>& bodies() const noexcept { return m_bodies; }
    [[nodiscard]] std::size_t size() const noexcept { return m_bodies.size(); }
    [[nodiscard]] std::vector<std::string> ids() const;

    /// Forward to the body; unknown ids are ignored
    void apply_force(const std::string& id, const newton_math::Vec2& force,
                     std::optional<newton_math::Vec2> point = std::nullopt);
    void apply_impulse(const std::string& id, const newton_math::Vec2& impulse,
                       std::optional<newton_math::Vec2> point = std::nullopt);

    /// Integrate every body; forces are cleared on all bodies afterwards
    void integrate(float dt, const PhysicsSpaceConfig& space);

    [[nodiscard]] std::vector<RigidBodyState> states() const;
    void load_states(const std::vector<RigidBodyState>& states);

    /// Reset every body to its configured initial state
    void reset_all();

    void clear();

private:
    void rebuild_index();

    std::vector<RigidBody> m_bodies;
    std::unordered_map<std::string, std::size_t> m_index;
};

} // namespace newton_physics
