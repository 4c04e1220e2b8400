/// @file ragdoll.cpp
/// @brief Ragdoll presets, builder and conversion

#include <newton/physics/ragdoll.hpp>

#include <cmath>
#include <unordered_map>

namespace newton_physics {

using newton_core::SimulationError;
using newton_math::Vec2;
using newton_math::consts::PI;

// =============================================================================
// HumanoidPreset
// =============================================================================

HumanoidPreset HumanoidPreset::adult() {
    return HumanoidPreset{
        "Adult Human",
        170.0f,
        {20.0f, 50.0f, 60.0f, 80.0f, 40.0f, 30.0f},
        {5.0f, 40.0f, 3.0f, 2.0f, 1.0f, 10.0f, 5.0f, 2.0f},
    };
}

HumanoidPreset HumanoidPreset::child() {
    return HumanoidPreset{
        "Child",
        100.0f,
        {18.0f, 35.0f, 40.0f, 50.0f, 25.0f, 20.0f},
        {8.0f, 35.0f, 3.0f, 2.0f, 1.0f, 8.0f, 4.0f, 2.0f},
    };
}

HumanoidPreset HumanoidPreset::cartoon() {
    return HumanoidPreset{
        "Cartoon Character",
        150.0f,
        {35.0f, 40.0f, 45.0f, 55.0f, 35.0f, 25.0f},
        {15.0f, 30.0f, 4.0f, 3.0f, 2.0f, 8.0f, 4.0f, 2.0f},
    };
}

std::optional<HumanoidPreset> HumanoidPreset::find(const std::string& name) {
    if (name == "adult") return adult();
    if (name == "child") return child();
    if (name == "cartoon") return cartoon();
    return std::nullopt;
}

// =============================================================================
// RagdollBuilder
// =============================================================================

RagdollBuilder::RagdollBuilder(std::string id, std::string layer_id) {
    m_config.id = std::move(id);
    m_config.layer_id = std::move(layer_id);
}

RagdollBuilder& RagdollBuilder::set_position(float x, float y) {
    m_config.position = Vec2(x, y);
    return *this;
}

RagdollBuilder& RagdollBuilder::set_rotation(float angle) {
    m_config.rotation = angle;
    return *this;
}

RagdollBuilder& RagdollBuilder::set_material(const PhysicsMaterial& material) {
    m_config.material = material;
    return *this;
}

RagdollBuilder& RagdollBuilder::set_collision_filter(const CollisionFilter& filter) {
    m_config.filter = filter;
    return *this;
}

RagdollBuilder& RagdollBuilder::set_self_collision(bool enabled) {
    m_config.self_collision = enabled;
    return *this;
}

RagdollBuilder& RagdollBuilder::set_damping(float damping) {
    m_config.damping = damping;
    return *this;
}

RagdollBuilder& RagdollBuilder::add_bone(RagdollBone bone) {
    m_config.bones.push_back(std::move(bone));
    return *this;
}

newton_core::Result<void> RagdollBuilder::from_preset(const std::string& name) {
    auto preset = HumanoidPreset::find(name);
    if (!preset) {
        return newton_core::Err(SimulationError::unknown_preset(name));
    }
    from_custom_preset(*preset);
    return newton_core::Ok();
}

RagdollBuilder& RagdollBuilder::from_custom_preset(const HumanoidPreset& preset) {
    namespace hb = humanoid_bones;

    const auto& p = preset.proportions;
    const auto& m = preset.mass;
    const float s = preset.scale / 100.0f;

    auto bone = [this](const char* id, const char* name, std::optional<std::string> parent,
                       float length, float width, float mass,
                       float min_angle, float max_angle, float stiffness, float damping) {
        RagdollBone b;
        b.id = id;
        b.name = name;
        b.parent = std::move(parent);
        b.length = length;
        b.width = width;
        b.mass = mass;
        b.angle_limits = AngleLimits{min_angle, max_angle};
        b.joint_stiffness = stiffness;
        b.joint_damping = damping;
        m_config.bones.push_back(std::move(b));
    };

    m_config.bones.clear();

    // Spine
    bone(hb::PELVIS, "Pelvis", std::nullopt,
         p.hip_width * s, p.hip_width * s * 0.5f, m.torso * 0.2f,
         -PI * 0.1f, PI * 0.1f, 0.8f, 0.3f);
    bone(hb::TORSO_LOWER, "Lower Torso", hb::PELVIS,
         p.torso_length * s * 0.4f, p.shoulder_width * s * 0.6f, m.torso * 0.3f,
         -PI * 0.15f, PI * 0.15f, 0.7f, 0.3f);
    bone(hb::TORSO_UPPER, "Upper Torso", hb::TORSO_LOWER,
         p.torso_length * s * 0.4f, p.shoulder_width * s, m.torso * 0.4f,
         -PI * 0.2f, PI * 0.2f, 0.7f, 0.3f);
    bone(hb::NECK, "Neck", hb::TORSO_UPPER,
         p.head_size * s * 0.3f, p.head_size * s * 0.3f, m.head * 0.1f,
         -PI * 0.25f, PI * 0.25f, 0.5f, 0.2f);
    bone(hb::HEAD, "Head", hb::NECK,
         p.head_size * s, p.head_size * s * 0.8f, m.head * 0.9f,
         -PI * 0.3f, PI * 0.3f, 0.5f, 0.2f);

    // Left arm
    bone(hb::UPPER_ARM_L, "Upper Arm Left", hb::TORSO_UPPER,
         p.arm_length * s * 0.45f, p.arm_length * s * 0.15f, m.upper_arm,
         -PI * 0.9f, PI * 0.1f, 0.4f, 0.2f);
    bone(hb::LOWER_ARM_L, "Lower Arm Left", hb::UPPER_ARM_L,
         p.arm_length * s * 0.4f, p.arm_length * s * 0.12f, m.lower_arm,
         0.0f, PI * 0.8f, 0.4f, 0.2f);
    bone(hb::HAND_L, "Hand Left", hb::LOWER_ARM_L,
         p.arm_length * s * 0.15f, p.arm_length * s * 0.1f, m.hand,
         -PI * 0.3f, PI * 0.3f, 0.3f, 0.1f);

    // Right arm
    bone(hb::UPPER_ARM_R, "Upper Arm Right", hb::TORSO_UPPER,
         p.arm_length * s * 0.45f, p.arm_length * s * 0.15f, m.upper_arm,
         -PI * 0.1f, PI * 0.9f, 0.4f, 0.2f);
    bone(hb::LOWER_ARM_R, "Lower Arm Right", hb::UPPER_ARM_R,
         p.arm_length * s * 0.4f, p.arm_length * s * 0.12f, m.lower_arm,
         -PI * 0.8f, 0.0f, 0.4f, 0.2f);
    bone(hb::HAND_R, "Hand Right", hb::LOWER_ARM_R,
         p.arm_length * s * 0.15f, p.arm_length * s * 0.1f, m.hand,
         -PI * 0.3f, PI * 0.3f, 0.3f, 0.1f);

    // Left leg
    bone(hb::UPPER_LEG_L, "Upper Leg Left", hb::PELVIS,
         p.leg_length * s * 0.45f, p.leg_length * s * 0.15f, m.upper_leg,
         -PI * 0.3f, PI * 0.5f, 0.5f, 0.3f);
    bone(hb::LOWER_LEG_L, "Lower Leg Left", hb::UPPER_LEG_L,
         p.leg_length * s * 0.4f, p.leg_length * s * 0.12f, m.lower_leg,
         -PI * 0.7f, 0.0f, 0.5f, 0.3f);
    bone(hb::FOOT_L, "Foot Left", hb::LOWER_LEG_L,
         p.leg_length * s * 0.15f, p.leg_length * s * 0.08f, m.foot,
         -PI * 0.2f, PI * 0.3f, 0.4f, 0.2f);

    // Right leg
    bone(hb::UPPER_LEG_R, "Upper Leg Right", hb::PELVIS,
         p.leg_length * s * 0.45f, p.leg_length * s * 0.15f, m.upper_leg,
         -PI * 0.5f, PI * 0.3f, 0.5f, 0.3f);
    bone(hb::LOWER_LEG_R, "Lower Leg Right", hb::UPPER_LEG_R,
         p.leg_length * s * 0.4f, p.leg_length * s * 0.12f, m.lower_leg,
         0.0f, PI * 0.7f, 0.5f, 0.3f);
    bone(hb::FOOT_R, "Foot Right", hb::LOWER_LEG_R,
         p.leg_length * s * 0.15f, p.leg_length * s * 0.08f, m.foot,
         -PI * 0.3f, PI * 0.2f, 0.4f, 0.2f);

    return *this;
}

// =============================================================================
// Conversion
// =============================================================================

std::string ragdoll_body_id(const std::string& ragdoll_id, const std::string& bone_id) {
    return ragdoll_id + "_" + bone_id;
}

std::string ragdoll_joint_id(const std::string& ragdoll_id, const std::string& bone_id) {
    return ragdoll_id + "_joint_" + bone_id;
}

namespace {

struct BonePlacement {
    Vec2 start{0.0f, 0.0f};
    float angle = 0.0f;
};

/// Place every bone root-to-leaf; the result is indexed like config.bones
newton_core::Result<std::vector<BonePlacement>> place_bones(
    const RagdollConfig& config, const std::unordered_map<std::string, std::size_t>& index) {
    const std::size_t count = config.bones.size();

    std::vector<std::vector<std::size_t>> children(count);
    std::vector<std::size_t> order;
    order.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const auto& bone = config.bones[i];
        if (!bone.parent) {
            order.push_back(i);
            continue;
        }
        auto it = index.find(*bone.parent);
        if (it == index.end()) {
            return newton_core::Err<std::vector<BonePlacement>>(
                SimulationError::missing_parent_bone(bone.id, *bone.parent));
        }
        children[it->second].push_back(i);
    }

    std::vector<BonePlacement> placements(count);
    for (auto root : order) {
        placements[root].start = config.position;
        placements[root].angle = config.rotation;
    }

    // Breadth-first from the roots; a child is visited after its parent
    for (std::size_t cursor = 0; cursor < order.size(); ++cursor) {
        const std::size_t parent = order[cursor];
        const auto& parent_bone = config.bones[parent];
        const float a = placements[parent].angle;
        const Vec2 distal = placements[parent].start + Vec2(std::cos(a), std::sin(a)) * parent_bone.length;

        for (auto child : children[parent]) {
            placements[child].start = distal;
            placements[child].angle = a;
            order.push_back(child);
        }
    }

    if (order.size() != count) {
        return newton_core::Err<std::vector<BonePlacement>>(
            SimulationError::invalid_config(config.id, "bone hierarchy has a cycle"));
    }

    return newton_core::Ok(std::move(placements));
}

} // anonymous namespace

newton_core::Result<RagdollPhysics> convert_ragdoll_to_physics(const RagdollConfig& config) {
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < config.bones.size(); ++i) {
        if (!index.emplace(config.bones[i].id, i).second) {
            return newton_core::Err<RagdollPhysics>(
                SimulationError::invalid_config(config.id, "duplicate bone id '" + config.bones[i].id + "'"));
        }
    }

    auto placements = place_bones(config, index);
    if (!placements) {
        return newton_core::Err<RagdollPhysics>(placements.error());
    }

    RagdollPhysics result;
    result.bodies.reserve(config.bones.size());

    for (std::size_t i = 0; i < config.bones.size(); ++i) {
        const auto& bone = config.bones[i];
        const BonePlacement& placement = (*placements)[i];

        const float angle = placement.angle;
        const Vec2 center = placement.start + Vec2(std::cos(angle), std::sin(angle)) * (bone.length * 0.5f);

        RigidBodyConfig body;
        body.id = ragdoll_body_id(config.id, bone.id);
        body.layer_id = config.layer_id;
        body.type = BodyType::Dynamic;
        body.mass = bone.mass;
        body.position = center;
        body.angle = angle;
        body.shape = CapsuleShape{bone.width * 0.5f, bone.length};
        body.material = config.material;
        body.filter = config.filter;
        if (!config.self_collision) {
            body.filter.group = -1;
        }
        body.response = CollisionResponse::Collide;
        body.linear_damping = config.damping;
        body.angular_damping = config.damping * 2.0f;
        body.can_sleep = true;
        result.bodies.push_back(std::move(body));
    }

    for (const auto& bone : config.bones) {
        if (!bone.parent) {
            continue;
        }

        const RagdollBone& parent = config.bones[index.at(*bone.parent)];

        PivotJointConfig joint;
        joint.id = ragdoll_joint_id(config.id, bone.id);
        joint.body_a = ragdoll_body_id(config.id, parent.id);
        joint.body_b = ragdoll_body_id(config.id, bone.id);
        joint.anchor_a = Vec2(parent.length * 0.5f, 0.0f);
        joint.anchor_b = Vec2(-bone.length * 0.5f, 0.0f);
        joint.collide_connected = config.self_collision;
        joint.limits = bone.angle_limits;
        joint.motor = JointMotor{
            bone.joint_stiffness > 0.0f,
            0.0f,
            bone.joint_stiffness * bone.mass * 100.0f,
        };
        result.joints.push_back(std::move(joint));
    }

    return newton_core::Ok(std::move(result));
}

RagdollState extract_ragdoll_state(const std::string& ragdoll_id, const std::vector<RagdollBone>& bones,
                                   const RigidBodySimulator& bodies) {
    RagdollState state;
    state.id = ragdoll_id;

    for (const auto& bone : bones) {
        const RigidBody* body = bodies.find(ragdoll_body_id(ragdoll_id, bone.id));
        if (!body) {
            continue;
        }

        RagdollBoneState bs;
        bs.id = bone.id;
        bs.position = body->position();
        bs.angle = body->angle();
        bs.velocity = body->velocity();
        bs.angular_velocity = body->angular_velocity();
        state.bones.push_back(std::move(bs));
    }

    return state;
}

} // namespace newton_physics
