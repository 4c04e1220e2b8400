// newton_physics pivot joint tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <newton/physics/joint.hpp>
#include <newton/physics/body.hpp>

using namespace newton_physics;
using newton_math::Vec2;
using Catch::Matchers::WithinAbs;

namespace {

RigidBodySimulator make_pair(Vec2 b_position) {
    RigidBodySimulator bodies;

    auto anchor = make_circle_body("anchor", "", Vec2(0.0f, 0.0f), 5.0f);
    anchor.type = BodyType::Static;
    bodies.add_body(anchor).unwrap();
    bodies.add_body(make_circle_body("bob", "", b_position, 5.0f)).unwrap();

    return bodies;
}

PivotJointConfig make_joint(const std::string& id, Vec2 anchor_b) {
    PivotJointConfig joint;
    joint.id = id;
    joint.body_a = "anchor";
    joint.body_b = "bob";
    joint.anchor_b = anchor_b;
    return joint;
}

} // anonymous namespace

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("PivotJointConfig validation", "[physics][joint]") {
    auto joint = make_joint("pin", Vec2(0.0f, 0.0f));
    REQUIRE(joint.validate().is_ok());

    SECTION("empty id") {
        joint.id.clear();
        REQUIRE(joint.validate().is_err());
    }

    SECTION("self joint") {
        joint.body_b = joint.body_a;
        REQUIRE(joint.validate().is_err());
    }

    SECTION("inverted limits") {
        joint.limits = AngleLimits{0.5f, -0.5f};
        REQUIRE(joint.validate().is_err());
    }

    SECTION("negative motor torque") {
        joint.motor = JointMotor{true, 1.0f, -10.0f};
        REQUIRE(joint.validate().is_err());
    }
}

TEST_CASE("JointSystem storage", "[physics][joint]") {
    auto bodies = make_pair(Vec2(20.0f, 0.0f));
    JointSystem joints;

    REQUIRE(joints.add_joint(make_joint("pin", Vec2(-20.0f, 0.0f)), bodies).is_ok());
    REQUIRE(joints.contains("pin"));
    REQUIRE(joints.find("pin")->body_b == "bob");

    SECTION("duplicate id") {
        auto result = joints.add_joint(make_joint("pin", Vec2(0.0f, 0.0f)), bodies);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == newton_core::ErrorCode::AlreadyExists);
    }

    SECTION("unknown body") {
        auto joint = make_joint("other", Vec2(0.0f, 0.0f));
        joint.body_b = "ghost";
        auto result = joints.add_joint(joint, bodies);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == newton_core::ErrorCode::NotFound);
    }

    SECTION("non-colliding pairs are ordered") {
        auto pairs = joints.non_colliding_pairs();
        REQUIRE(pairs.size() == 1);
        REQUIRE(pairs.count({"anchor", "bob"}) == 1);
    }

    SECTION("collide_connected pairs are not excluded") {
        auto joint = make_joint("loose", Vec2(0.0f, 0.0f));
        joint.collide_connected = true;
        REQUIRE(joints.add_joint(joint, bodies).is_ok());
        REQUIRE(joints.non_colliding_pairs().size() == 1);
    }

    SECTION("remove joints for a body") {
        REQUIRE(joints.add_joint(make_joint("second", Vec2(0.0f, 0.0f)), bodies).is_ok());
        REQUIRE(joints.remove_joints_for_body("bob") == 2);
        REQUIRE(joints.size() == 0);
    }

    SECTION("remove by id") {
        REQUIRE(joints.remove_joint("pin"));
        REQUIRE_FALSE(joints.remove_joint("pin"));
    }
}

// =============================================================================
// Solver Tests
// =============================================================================

TEST_CASE("JointSystem pulls anchors together", "[physics][joint][solve]") {
    auto bodies = make_pair(Vec2(30.0f, 0.0f));
    JointSystem joints;
    REQUIRE(joints.add_joint(make_joint("pin", Vec2(-20.0f, 0.0f)), bodies).is_ok());

    const float dt = 1.0f / 60.0f;

    joints.solve(bodies, dt);
    REQUIRE_THAT(bodies.find("bob")->position().x, WithinAbs(28.0f, 1e-4f));
    REQUIRE(bodies.find("anchor")->position() == Vec2(0.0f, 0.0f));

    for (int i = 0; i < 100; ++i) {
        joints.solve(bodies, dt);
    }
    REQUIRE_THAT(bodies.find("bob")->position().x, WithinAbs(20.0f, 1e-2f));
}

TEST_CASE("JointSystem removes anchor point velocity", "[physics][joint][solve]") {
    auto bodies = make_pair(Vec2(20.0f, 0.0f));
    JointSystem joints;
    REQUIRE(joints.add_joint(make_joint("pin", Vec2(-20.0f, 0.0f)), bodies).is_ok());

    RigidBody* bob = bodies.find("bob");
    bob->set_velocity(Vec2(5.0f, 3.0f));

    joints.solve(bodies, 1.0f / 60.0f);

    const Vec2 r_b = newton_math::rotate(Vec2(-20.0f, 0.0f), bob->angle());
    const Vec2 point_velocity = bob->velocity() + newton_math::perpendicular(r_b) * bob->angular_velocity();
    REQUIRE_THAT(point_velocity.x, WithinAbs(0.0f, 1e-3f));
    REQUIRE_THAT(point_velocity.y, WithinAbs(0.0f, 1e-3f));

    // The tangential part turns into a swing around the pin
    REQUIRE(bob->angular_velocity() != 0.0f);
}

TEST_CASE("JointSystem angle limits and motor", "[physics][joint][solve]") {
    auto bodies = make_pair(Vec2(0.0f, 0.0f));
    JointSystem joints;
    const float dt = 1.0f / 60.0f;

    SECTION("limit pushes back past max") {
        auto joint = make_joint("pin", Vec2(0.0f, 0.0f));
        joint.limits = AngleLimits{-0.5f, 0.5f};
        REQUIRE(joints.add_joint(joint, bodies).is_ok());

        bodies.find("bob")->set_angle(1.0f);
        joints.solve(bodies, dt);
        REQUIRE(bodies.find("bob")->angular_velocity() < 0.0f);
    }

    SECTION("limit pushes back past min") {
        auto joint = make_joint("pin", Vec2(0.0f, 0.0f));
        joint.limits = AngleLimits{-0.5f, 0.5f};
        REQUIRE(joints.add_joint(joint, bodies).is_ok());

        bodies.find("bob")->set_angle(-1.0f);
        joints.solve(bodies, dt);
        REQUIRE(bodies.find("bob")->angular_velocity() > 0.0f);
    }

    SECTION("inside the limits nothing changes") {
        auto joint = make_joint("pin", Vec2(0.0f, 0.0f));
        joint.limits = AngleLimits{-0.5f, 0.5f};
        REQUIRE(joints.add_joint(joint, bodies).is_ok());

        bodies.find("bob")->set_angle(0.2f);
        bodies.find("bob")->set_angular_velocity(0.3f);
        joints.solve(bodies, dt);
        REQUIRE_THAT(bodies.find("bob")->angular_velocity(), WithinAbs(0.3f, 1e-6f));
    }

    SECTION("motor reaches its speed with enough torque") {
        auto joint = make_joint("pin", Vec2(0.0f, 0.0f));
        joint.motor = JointMotor{true, 2.0f, 1e6f};
        REQUIRE(joints.add_joint(joint, bodies).is_ok());

        joints.solve(bodies, dt);
        REQUIRE_THAT(bodies.find("bob")->angular_velocity(), WithinAbs(2.0f, 1e-4f));
    }

    SECTION("motor torque is clamped") {
        auto joint = make_joint("pin", Vec2(0.0f, 0.0f));
        joint.motor = JointMotor{true, 2.0f, 0.6f};
        REQUIRE(joints.add_joint(joint, bodies).is_ok());

        joints.solve(bodies, dt);
        const float expected = bodies.find("bob")->inverse_inertia() * 0.6f * dt;
        REQUIRE_THAT(bodies.find("bob")->angular_velocity(), WithinAbs(expected, 1e-6f));
    }
}

TEST_CASE("JointSystem skips fully anchored joints", "[physics][joint][solve]") {
    auto bodies = make_pair(Vec2(30.0f, 0.0f));
    JointSystem joints;
    REQUIRE(joints.add_joint(make_joint("pin", Vec2(-20.0f, 0.0f)), bodies).is_ok());

    bodies.find("bob")->set_sleep_state(true, 1.0f);
    joints.solve(bodies, 1.0f / 60.0f);
    REQUIRE(bodies.find("bob")->position() == Vec2(30.0f, 0.0f));
}
