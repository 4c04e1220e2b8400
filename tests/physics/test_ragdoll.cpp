// newton_physics ragdoll builder and conversion tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <newton/physics/ragdoll.hpp>
#include <newton/math/constants.hpp>
#include <algorithm>

using namespace newton_physics;
using newton_math::Vec2;
using Catch::Matchers::WithinAbs;

namespace hb = humanoid_bones;

namespace {

RagdollBone make_bone(const std::string& id, std::optional<std::string> parent, float length) {
    RagdollBone bone;
    bone.id = id;
    bone.name = id;
    bone.parent = std::move(parent);
    bone.length = length;
    return bone;
}

const RigidBodyConfig* find_body(const RagdollPhysics& physics, const std::string& id) {
    auto it = std::find_if(physics.bodies.begin(), physics.bodies.end(),
                           [&id](const RigidBodyConfig& b) { return b.id == id; });
    return it != physics.bodies.end() ? &*it : nullptr;
}

const PivotJointConfig* find_joint(const RagdollPhysics& physics, const std::string& id) {
    auto it = std::find_if(physics.joints.begin(), physics.joints.end(),
                           [&id](const PivotJointConfig& j) { return j.id == id; });
    return it != physics.joints.end() ? &*it : nullptr;
}

} // anonymous namespace

// =============================================================================
// Preset Tests
// =============================================================================

TEST_CASE("Humanoid presets", "[physics][ragdoll]") {
    SECTION("lookup") {
        REQUIRE(HumanoidPreset::find("adult").has_value());
        REQUIRE(HumanoidPreset::find("child")->scale == 100.0f);
        REQUIRE(HumanoidPreset::find("cartoon")->proportions.head_size == 35.0f);
        REQUIRE_FALSE(HumanoidPreset::find("giant").has_value());
    }

    SECTION("unknown preset is an error") {
        RagdollBuilder builder("hero", "hero_layer");
        auto result = builder.from_preset("giant");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == newton_core::ErrorCode::NotFound);
        REQUIRE(result.error().as<newton_core::SimulationError>()->kind
                == newton_core::SimulationError::Kind::UnknownPreset);
    }
}

// =============================================================================
// Builder Tests
// =============================================================================

TEST_CASE("RagdollBuilder", "[physics][ragdoll]") {
    RagdollBuilder builder("hero", "hero_layer");
    builder.set_position(200.0f, 100.0f)
           .set_rotation(0.25f)
           .set_material(PhysicsMaterial::rubber())
           .set_self_collision(true)
           .set_damping(0.3f);

    SECTION("settings are carried into the config") {
        auto config = builder.build();
        REQUIRE(config.id == "hero");
        REQUIRE(config.layer_id == "hero_layer");
        REQUIRE(config.position == Vec2(200.0f, 100.0f));
        REQUIRE(config.rotation == 0.25f);
        REQUIRE(config.material == PhysicsMaterial::rubber());
        REQUIRE(config.self_collision);
        REQUIRE(config.damping == 0.3f);
        REQUIRE(config.bones.empty());
    }

    SECTION("adult preset has 17 bones") {
        REQUIRE(builder.from_preset("adult").is_ok());
        auto config = builder.build();
        REQUIRE(config.bones.size() == 17);
        REQUIRE(config.bones[0].id == hb::PELVIS);
        REQUIRE_FALSE(config.bones[0].parent.has_value());

        const auto roots = std::count_if(config.bones.begin(), config.bones.end(),
                                         [](const RagdollBone& b) { return !b.parent; });
        REQUIRE(roots == 1);

        // Pelvis length is the hip width scaled by 170%
        REQUIRE_THAT(config.bones[0].length, WithinAbs(51.0f, 1e-4f));
    }

    SECTION("preset replaces custom bones") {
        builder.add_bone(make_bone("tail", std::nullopt, 5.0f));
        builder.from_custom_preset(HumanoidPreset::child());
        auto config = builder.build();
        REQUIRE(config.bones.size() == 17);
        REQUIRE(std::none_of(config.bones.begin(), config.bones.end(),
                             [](const RagdollBone& b) { return b.id == "tail"; }));
    }
}

// =============================================================================
// Conversion Tests
// =============================================================================

TEST_CASE("Ragdoll conversion from preset", "[physics][ragdoll]") {
    RagdollBuilder builder("hero", "hero_layer");
    builder.set_position(200.0f, 100.0f);
    REQUIRE(builder.from_preset("adult").is_ok());
    const auto config = builder.build();

    auto physics = convert_ragdoll_to_physics(config);
    REQUIRE(physics.is_ok());

    SECTION("one capsule per bone and one joint per non-root bone") {
        REQUIRE(physics->bodies.size() == 17);
        REQUIRE(physics->joints.size() == 16);

        for (const auto& body : physics->bodies) {
            REQUIRE(std::holds_alternative<CapsuleShape>(body.shape));
            REQUIRE(body.layer_id == "hero_layer");
            REQUIRE(body.type == BodyType::Dynamic);
            REQUIRE(body.validate().is_ok());
        }
    }

    SECTION("body ids and placement") {
        const auto* pelvis = find_body(*physics, ragdoll_body_id("hero", hb::PELVIS));
        REQUIRE(pelvis != nullptr);
        REQUIRE(pelvis->id == "hero_pelvis");
        REQUIRE(approx_equal(pelvis->position, Vec2(225.5f, 100.0f), 1e-3f));

        const auto* lower = find_body(*physics, ragdoll_body_id("hero", hb::TORSO_LOWER));
        REQUIRE(lower != nullptr);
        REQUIRE(approx_equal(lower->position, Vec2(200.0f + 51.0f + 17.0f, 100.0f), 1e-3f));

        const auto& capsule = std::get<CapsuleShape>(lower->shape);
        REQUIRE_THAT(capsule.length, WithinAbs(34.0f, 1e-3f));
        REQUIRE_THAT(capsule.radius, WithinAbs(config.bones[1].width * 0.5f, 1e-5f));
    }

    SECTION("joint anchors sit at the bone ends") {
        const auto* joint = find_joint(*physics, ragdoll_joint_id("hero", hb::TORSO_LOWER));
        REQUIRE(joint != nullptr);
        REQUIRE(joint->id == "hero_joint_torso_lower");
        REQUIRE(joint->body_a == "hero_pelvis");
        REQUIRE(joint->body_b == "hero_torso_lower");
        REQUIRE(approx_equal(joint->anchor_a, Vec2(25.5f, 0.0f), 1e-3f));
        REQUIRE(approx_equal(joint->anchor_b, Vec2(-17.0f, 0.0f), 1e-3f));
        REQUIRE(joint->limits.has_value());
        REQUIRE(joint->motor.has_value());
        REQUIRE(joint->motor->enabled);
        REQUIRE_FALSE(joint->collide_connected);
    }

    SECTION("every joint anchors parent end to child start") {
        for (const auto& bone : config.bones) {
            if (!bone.parent) {
                continue;
            }
            const auto* joint = find_joint(*physics, ragdoll_joint_id("hero", bone.id));
            REQUIRE(joint != nullptr);

            auto parent = std::find_if(config.bones.begin(), config.bones.end(),
                                       [&bone](const RagdollBone& b) { return b.id == *bone.parent; });
            REQUIRE(approx_equal(joint->anchor_a, Vec2(parent->length * 0.5f, 0.0f), 1e-4f));
            REQUIRE(approx_equal(joint->anchor_b, Vec2(-bone.length * 0.5f, 0.0f), 1e-4f));
        }
    }

    SECTION("self collision off puts bones in a negative group") {
        for (const auto& body : physics->bodies) {
            REQUIRE(body.filter.group == -1);
        }
    }
}

TEST_CASE("Ragdoll conversion follows rotation", "[physics][ragdoll]") {
    RagdollBuilder builder("arm", "");
    builder.set_rotation(newton_math::consts::FRAC_PI_2)
           .add_bone(make_bone("upper", std::nullopt, 20.0f))
           .add_bone(make_bone("lower", std::string("upper"), 10.0f));

    auto physics = convert_ragdoll_to_physics(builder.build());
    REQUIRE(physics.is_ok());
    REQUIRE(approx_equal(physics->bodies[0].position, Vec2(0.0f, 10.0f), 1e-4f));
    REQUIRE(approx_equal(physics->bodies[1].position, Vec2(0.0f, 25.0f), 1e-4f));
    REQUIRE_THAT(physics->bodies[1].angle, WithinAbs(newton_math::consts::FRAC_PI_2, 1e-6f));
}

TEST_CASE("Ragdoll conversion errors", "[physics][ragdoll]") {
    RagdollBuilder builder("broken", "");

    SECTION("missing parent bone") {
        builder.add_bone(make_bone("root", std::nullopt, 10.0f))
               .add_bone(make_bone("forearm", std::string("upper_arm"), 10.0f));
        auto result = convert_ragdoll_to_physics(builder.build());
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<newton_core::SimulationError>()->kind
                == newton_core::SimulationError::Kind::MissingParentBone);
    }

    SECTION("duplicate bone id") {
        builder.add_bone(make_bone("root", std::nullopt, 10.0f))
               .add_bone(make_bone("root", std::nullopt, 10.0f));
        REQUIRE(convert_ragdoll_to_physics(builder.build()).is_err());
    }

    SECTION("cycle") {
        builder.add_bone(make_bone("a", std::string("b"), 10.0f))
               .add_bone(make_bone("b", std::string("a"), 10.0f));
        auto result = convert_ragdoll_to_physics(builder.build());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == newton_core::ErrorCode::ValidationError);
    }
}

TEST_CASE("extract_ragdoll_state", "[physics][ragdoll]") {
    RagdollBuilder builder("hero", "");
    REQUIRE(builder.from_preset("cartoon").is_ok());
    const auto config = builder.build();
    auto physics = convert_ragdoll_to_physics(config).value();

    RigidBodySimulator bodies;
    for (const auto& body : physics.bodies) {
        REQUIRE(bodies.add_body(body).is_ok());
    }
    bodies.find("hero_head")->set_velocity(Vec2(3.0f, -1.0f));

    auto state = extract_ragdoll_state("hero", config.bones, bodies);
    REQUIRE(state.id == "hero");
    REQUIRE(state.bones.size() == 17);
    REQUIRE(state.bones[4].id == hb::HEAD);
    REQUIRE(state.bones[4].velocity == Vec2(3.0f, -1.0f));

    SECTION("missing bodies are skipped") {
        bodies.remove_body("hero_foot_r");
        REQUIRE(extract_ragdoll_state("hero", config.bones, bodies).bones.size() == 16);
    }
}
