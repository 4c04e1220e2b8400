/// @file ragdoll.hpp
/// @brief Ragdoll skeletons and their conversion to bodies and joints

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "body.hpp"
#include "joint.hpp"

#include <optional>
#include <string>
#include <vector>

namespace newton_physics {

// =============================================================================
// Humanoid Bone Names
// =============================================================================

namespace humanoid_bones {

inline constexpr const char* HEAD = "head";
inline constexpr const char* NECK = "neck";
inline constexpr const char* TORSO_UPPER = "torso_upper";
inline constexpr const char* TORSO_LOWER = "torso_lower";
inline constexpr const char* PELVIS = "pelvis";
inline constexpr const char* UPPER_ARM_L = "upper_arm_l";
inline constexpr const char* LOWER_ARM_L = "lower_arm_l";
inline constexpr const char* HAND_L = "hand_l";
inline constexpr const char* UPPER_ARM_R = "upper_arm_r";
inline constexpr const char* LOWER_ARM_R = "lower_arm_r";
inline constexpr const char* HAND_R = "hand_r";
inline constexpr const char* UPPER_LEG_L = "upper_leg_l";
inline constexpr const char* LOWER_LEG_L = "lower_leg_l";
inline constexpr const char* FOOT_L = "foot_l";
inline constexpr const char* UPPER_LEG_R = "upper_leg_r";
inline constexpr const char* LOWER_LEG_R = "lower_leg_r";
inline constexpr const char* FOOT_R = "foot_r";

} // namespace humanoid_bones

// =============================================================================
// Skeleton Description
// =============================================================================

struct RagdollBone {
    std::string id;
    std::string name;
    std::optional<std::string> parent;  ///< Unset for the root
    float length = 10.0f;
    float width = 5.0f;
    float mass = 1.0f;
    AngleLimits angle_limits;           ///< Relative to the parent bone
    float joint_stiffness = 0.5f;
    float joint_damping = 0.2f;
};

struct RagdollConfig {
    std::string id;
    std::string layer_id;
    newton_math::Vec2 position{0.0f, 0.0f};     ///< Start of the root bone
    float rotation = 0.0f;
    std::vector<RagdollBone> bones;
    PhysicsMaterial material{0.2f, 0.5f};
    CollisionFilter filter;
    bool self_collision = false;
    float damping = 0.1f;
};

struct RagdollBoneState {
    std::string id;
    newton_math::Vec2 position{0.0f, 0.0f};
    float angle = 0.0f;
    newton_math::Vec2 velocity{0.0f, 0.0f};
    float angular_velocity = 0.0f;
};

struct RagdollState {
    std::string id;
    std::vector<RagdollBoneState> bones;
};

// =============================================================================
// Humanoid Presets
// =============================================================================

/// Percentages of the preset scale
struct HumanoidProportions {
    float head_size = 20.0f;
    float torso_length = 50.0f;
    float arm_length = 60.0f;
    float leg_length = 80.0f;
    float shoulder_width = 40.0f;
    float hip_width = 30.0f;
};

struct HumanoidMassDistribution {
    float head = 5.0f;
    float torso = 40.0f;
    float upper_arm = 3.0f;
    float lower_arm = 2.0f;
    float hand = 1.0f;
    float upper_leg = 10.0f;
    float lower_leg = 5.0f;
    float foot = 2.0f;
};

struct HumanoidPreset {
    std::string name;
    float scale = 170.0f;
    HumanoidProportions proportions;
    HumanoidMassDistribution mass;

    [[nodiscard]] static HumanoidPreset adult();
    [[nodiscard]] static HumanoidPreset child();
    [[nodiscard]] static HumanoidPreset cartoon();

    /// Look up "adult", "child" or "cartoon"
    [[nodiscard]] static std::optional<HumanoidPreset> find(const std::string& name);
};

// =============================================================================
// RagdollBuilder
// =============================================================================

/// Fluent construction of a RagdollConfig
class RagdollBuilder {
public:
    RagdollBuilder(std::string id, std::string layer_id);

    RagdollBuilder& set_position(float x, float y);
    RagdollBuilder& set_rotation(float angle);
    RagdollBuilder& set_material(const PhysicsMaterial& material);
    RagdollBuilder& set_collision_filter(const CollisionFilter& filter);
    RagdollBuilder& set_self_collision(bool enabled);
    RagdollBuilder& set_damping(float damping);
    RagdollBuilder& add_bone(RagdollBone bone);

    /// Replace the bones with a named humanoid preset
    [[nodiscard]] newton_core::Result<void> from_preset(const std::string& name);

    /// Replace the bones with the 17-bone humanoid skeleton for a preset
    RagdollBuilder& from_custom_preset(const HumanoidPreset& preset);

    [[nodiscard]] RagdollConfig build() const { return m_config; }

private:
    RagdollConfig m_config;
};

// =============================================================================
// Conversion
// =============================================================================

/// Bodies and joints produced from a ragdoll
struct RagdollPhysics {
    std::vector<RigidBodyConfig> bodies;
    std::vector<PivotJointConfig> joints;
};

[[nodiscard]] std::string ragdoll_body_id(const std::string& ragdoll_id, const std::string& bone_id);
[[nodiscard]] std::string ragdoll_joint_id(const std::string& ragdoll_id, const std::string& bone_id);

/// Expand bones into capsule bodies and parent/child pivot joints
///
/// Each bone starts at its parent's distal end and inherits the parent's
/// angle; the root starts at the ragdoll position and rotation. Bodies are
/// centered at bone midpoints. Fails when a parent is missing, a bone id
/// repeats or the hierarchy has a cycle.
[[nodiscard]] newton_core::Result<RagdollPhysics> convert_ragdoll_to_physics(const RagdollConfig& config);

/// Read bone states from the ragdoll's bodies; missing bodies are skipped
[[nodiscard]] RagdollState extract_ragdoll_state(const std::string& ragdoll_id,
                                                 const std::vector<RagdollBone>& bones,
                                                 const RigidBodySimulator& bodies);

} // namespace newton_physics
