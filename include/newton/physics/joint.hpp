/// @file joint.hpp
/// @brief Pivot joints between rigid bodies

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "collision.hpp"

#include <optional>
#include <string>
#include <vector>

namespace newton_physics {

// =============================================================================
// Joint Configuration
// =============================================================================

/// Relative angle range (radians, body B angle minus body A angle)
struct AngleLimits {
    float min = 0.0f;
    float max = 0.0f;
};

/// Drives the relative angular velocity towards a target speed
struct JointMotor {
    bool enabled = false;
    float speed = 0.0f;             ///< Target relative angular velocity
    float max_torque = 0.0f;
};

/// Pins a point on body A to a point on body B
struct PivotJointConfig {
    std::string id;
    std::string body_a;
    std::string body_b;
    newton_math::Vec2 anchor_a{0.0f, 0.0f};    ///< Local to body A
    newton_math::Vec2 anchor_b{0.0f, 0.0f};    ///< Local to body B
    bool collide_connected = false;
    std::optional<AngleLimits> limits;
    std::optional<JointMotor> motor;

    [[nodiscard]] newton_core::Result<void> validate() const;
};

// =============================================================================
// JointSystem
// =============================================================================

/// Owns pivot joints and applies them during the velocity iterations
class JointSystem {
public:
    /// Position correction applied per solve, as a fraction of the anchor gap
    static constexpr float k_position_correction = 0.2f;

    /// Angle limit bias (Baumgarte factor)
    static constexpr float k_limit_bias = 0.2f;

    /// Add a joint; both bodies must exist
    [[nodiscard]] newton_core::Result<void> add_joint(PivotJointConfig config, const RigidBodySimulator& bodies);

    bool remove_joint(const std::string& id);

    /// Drop every joint attached to a body, returns the number removed
    std::size_t remove_joints_for_body(const std::string& body_id);

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] const PivotJointConfig* find(const std::string& id) const;
    [[nodiscard]] const std::vector<PivotJointConfig>& joints() const noexcept { return m_joints; }
    [[nodiscard]] std::size_t size() const noexcept { return m_joints.size(); }

    /// Body pairs connected by a joint with collide_connected disabled
    [[nodiscard]] CollisionDetector::BodyPairSet non_colliding_pairs() const;

    /// One velocity and position pass over every joint
    void solve(RigidBodySimulator& bodies, float dt) const;

    void clear() { m_joints.clear(); }

private:
    std::vector<PivotJointConfig> m_joints;
};

} // namespace newton_physics
