// newton_physics collision detection and resolution tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <newton/physics/collision.hpp>
#include <newton/physics/body.hpp>
#include <newton/math/constants.hpp>

using namespace newton_physics;
using newton_math::Vec2;
using Catch::Matchers::WithinAbs;

namespace {

RigidBodyConfig ball(const std::string& id, Vec2 position, Vec2 velocity, float restitution) {
    auto config = make_circle_body(id, "", position, 10.0f, 1.0f);
    config.velocity = velocity;
    config.material = PhysicsMaterial{restitution, 0.0f};
    return config;
}

} // anonymous namespace

// =============================================================================
// Narrow Phase Tests
// =============================================================================

TEST_CASE("Circle vs circle", "[physics][collision][narrow]") {
    SECTION("overlapping") {
        auto m = narrow_phase::circle_vs_circle(Vec2(0.0f, 0.0f), 10.0f, Vec2(15.0f, 0.0f), 10.0f);
        REQUIRE(m.has_value());
        REQUIRE(approx_equal(m->normal, Vec2(1.0f, 0.0f)));
        REQUIRE_THAT(m->depth, WithinAbs(5.0f, 1e-5f));
        REQUIRE(approx_equal(m->point, Vec2(10.0f, 0.0f)));
    }

    SECTION("touching is not a contact") {
        REQUIRE_FALSE(narrow_phase::circle_vs_circle(Vec2(0.0f, 0.0f), 10.0f, Vec2(20.0f, 0.0f), 10.0f));
    }

    SECTION("separated") {
        REQUIRE_FALSE(narrow_phase::circle_vs_circle(Vec2(0.0f, 0.0f), 5.0f, Vec2(0.0f, 30.0f), 5.0f));
    }

    SECTION("coincident centers use the X axis") {
        auto m = narrow_phase::circle_vs_circle(Vec2(3.0f, 3.0f), 4.0f, Vec2(3.0f, 3.0f), 6.0f);
        REQUIRE(m.has_value());
        REQUIRE(m->normal == Vec2(1.0f, 0.0f));
        REQUIRE_THAT(m->depth, WithinAbs(10.0f, 1e-5f));
    }
}

TEST_CASE("Circle vs box", "[physics][collision][narrow]") {
    SECTION("circle above the box") {
        auto m = narrow_phase::circle_vs_box(Vec2(0.0f, -14.0f), 5.0f, Vec2(0.0f, 0.0f), 0.0f, 20.0f, 10.0f);
        REQUIRE(m.has_value());
        REQUIRE(approx_equal(m->normal, Vec2(0.0f, 1.0f), 1e-5f));
        REQUIRE_THAT(m->depth, WithinAbs(1.0f, 1e-5f));
        REQUIRE(approx_equal(m->point, Vec2(0.0f, -9.0f), 1e-5f));
    }

    SECTION("circle left of the box") {
        auto m = narrow_phase::circle_vs_box(Vec2(-22.0f, 0.0f), 5.0f, Vec2(0.0f, 0.0f), 0.0f, 20.0f, 10.0f);
        REQUIRE(m.has_value());
        REQUIRE(approx_equal(m->normal, Vec2(1.0f, 0.0f), 1e-5f));
        REQUIRE_THAT(m->depth, WithinAbs(3.0f, 1e-5f));
    }

    SECTION("no overlap") {
        REQUIRE_FALSE(narrow_phase::circle_vs_box(Vec2(0.0f, -20.0f), 5.0f, Vec2(0.0f, 0.0f), 0.0f, 20.0f, 10.0f));
    }

    SECTION("center inside the box") {
        auto m = narrow_phase::circle_vs_box(Vec2(0.0f, -8.0f), 5.0f, Vec2(0.0f, 0.0f), 0.0f, 20.0f, 10.0f);
        REQUIRE(m.has_value());
        REQUIRE(approx_equal(m->normal, Vec2(0.0f, 1.0f), 1e-5f));
        REQUIRE_THAT(m->depth, WithinAbs(7.0f, 1e-5f));
    }

    SECTION("rotated box") {
        // A quarter turn swaps the half extents in world space
        auto m = narrow_phase::circle_vs_box(Vec2(0.0f, -22.0f), 5.0f, Vec2(0.0f, 0.0f),
                                             newton_math::consts::FRAC_PI_2, 20.0f, 10.0f);
        REQUIRE(m.has_value());
        REQUIRE(approx_equal(m->normal, Vec2(0.0f, 1.0f), 1e-4f));
        REQUIRE_THAT(m->depth, WithinAbs(3.0f, 1e-4f));
    }
}

TEST_CASE("Box vs box", "[physics][collision][narrow]") {
    SECTION("smaller overlap on X") {
        auto m = narrow_phase::box_vs_box(Vec2(0.0f, 0.0f), 10.0f, 10.0f, Vec2(18.0f, 1.0f), 10.0f, 10.0f);
        REQUIRE(m.has_value());
        REQUIRE(m->normal == Vec2(1.0f, 0.0f));
        REQUIRE_THAT(m->depth, WithinAbs(2.0f, 1e-5f));
        REQUIRE(approx_equal(m->point, Vec2(10.0f, 0.0f)));
    }

    SECTION("smaller overlap on Y towards negative") {
        auto m = narrow_phase::box_vs_box(Vec2(0.0f, 0.0f), 10.0f, 10.0f, Vec2(2.0f, -17.0f), 10.0f, 10.0f);
        REQUIRE(m.has_value());
        REQUIRE(m->normal == Vec2(0.0f, -1.0f));
        REQUIRE_THAT(m->depth, WithinAbs(3.0f, 1e-5f));
    }

    SECTION("separated on one axis") {
        REQUIRE_FALSE(narrow_phase::box_vs_box(Vec2(0.0f, 0.0f), 10.0f, 10.0f, Vec2(5.0f, 25.0f), 10.0f, 10.0f));
    }
}

// =============================================================================
// CollisionDetector Tests
// =============================================================================

TEST_CASE("CollisionDetector pair rules", "[physics][collision]") {
    auto a_config = make_circle_body("a", "", Vec2(0.0f, 0.0f), 10.0f);
    auto b_config = make_circle_body("b", "", Vec2(15.0f, 0.0f), 10.0f);

    SECTION("two dynamic bodies") {
        REQUIRE(CollisionDetector::can_collide(RigidBody(a_config), RigidBody(b_config)));
    }

    SECTION("two static bodies never collide") {
        a_config.type = BodyType::Static;
        b_config.type = BodyType::Static;
        REQUIRE_FALSE(CollisionDetector::can_collide(RigidBody(a_config), RigidBody(b_config)));
    }

    SECTION("dead bodies never collide") {
        b_config.type = BodyType::Dead;
        REQUIRE_FALSE(CollisionDetector::can_collide(RigidBody(a_config), RigidBody(b_config)));
    }

    SECTION("response None opts out") {
        a_config.response = CollisionResponse::None;
        REQUIRE_FALSE(CollisionDetector::can_collide(RigidBody(a_config), RigidBody(b_config)));
    }

    SECTION("filters are honored") {
        a_config.filter.group = -2;
        b_config.filter.group = -2;
        REQUIRE_FALSE(CollisionDetector::can_collide(RigidBody(a_config), RigidBody(b_config)));
    }
}

TEST_CASE("CollisionDetector detect", "[physics][collision]") {
    std::vector<RigidBody> bodies;
    bodies.emplace_back(make_circle_body("a", "", Vec2(0.0f, 0.0f), 10.0f));
    bodies.emplace_back(make_circle_body("b", "", Vec2(15.0f, 0.0f), 10.0f));
    bodies.emplace_back(make_circle_body("c", "", Vec2(200.0f, 0.0f), 10.0f));
    bodies.emplace_back(make_box_body("d", "", Vec2(0.0f, 14.0f), 40.0f, 10.0f));

    CollisionDetector detector;

    SECTION("finds overlapping pairs in list order") {
        auto pairs = detector.detect(bodies);
        REQUIRE(pairs.size() == 3);
        REQUIRE(pairs[0].body_a == 0);
        REQUIRE(pairs[0].body_b == 1);
        REQUIRE(pairs[1].body_a == 0);
        REQUIRE(pairs[1].body_b == 3);
        REQUIRE(pairs[2].body_a == 1);
        REQUIRE(pairs[2].body_b == 3);
    }

    SECTION("normal points from the first body to the second") {
        auto pairs = detector.detect(bodies);
        REQUIRE(approx_equal(pairs[1].manifold.normal, Vec2(0.0f, 1.0f), 1e-5f));
    }

    SECTION("box first flips the circle-box normal") {
        auto m = CollisionDetector::test_pair(bodies[3], bodies[0]);
        REQUIRE(m.has_value());
        REQUIRE(approx_equal(m->normal, Vec2(0.0f, -1.0f), 1e-5f));
    }

    SECTION("excluded pairs are skipped regardless of order") {
        detector.set_excluded_pairs({{"a", "b"}});
        auto pairs = detector.detect(bodies);
        REQUIRE(pairs.size() == 2);
        for (const auto& pair : pairs) {
            REQUIRE_FALSE((pair.body_a == 0 && pair.body_b == 1));
        }
    }

    SECTION("capsules fall back to nominal radius") {
        auto config = make_circle_body("cap", "", Vec2(200.0f, 12.0f), 10.0f);
        config.shape = CapsuleShape{3.0f, 30.0f};
        RigidBody capsule(config);
        auto m = CollisionDetector::test_pair(bodies[2], capsule);
        REQUIRE(m.has_value());
        REQUIRE_THAT(m->depth, WithinAbs(1.0f, 1e-5f));
    }
}

// =============================================================================
// CollisionResolver Tests
// =============================================================================

TEST_CASE("CollisionResolver elastic collision swaps velocities", "[physics][collision][resolve]") {
    std::vector<RigidBody> bodies;
    bodies.emplace_back(ball("a", Vec2(0.0f, 0.0f), Vec2(5.0f, 0.0f), 1.0f));
    bodies.emplace_back(ball("b", Vec2(15.0f, 0.0f), Vec2(-5.0f, 0.0f), 1.0f));

    CollisionDetector detector;
    CollisionResolver resolver;
    auto space = PhysicsSpaceConfig::defaults();

    auto pairs = detector.detect(bodies);
    REQUIRE(pairs.size() == 1);

    auto contacts = resolver.resolve_all(pairs, bodies, space);
    REQUIRE(contacts.size() == 1);
    REQUIRE(contacts[0].body_a == "a");
    REQUIRE(contacts[0].body_b == "b");
    REQUIRE_THAT(contacts[0].impulse, WithinAbs(10.0f, 1e-4f));

    REQUIRE_THAT(bodies[0].velocity().x, WithinAbs(-5.0f, 1e-4f));
    REQUIRE_THAT(bodies[1].velocity().x, WithinAbs(5.0f, 1e-4f));

    // Positional correction pushed the pair apart symmetrically
    REQUIRE(bodies[0].position().x < 0.0f);
    REQUIRE(bodies[1].position().x > 15.0f);
}

TEST_CASE("CollisionResolver inelastic collision shares velocity", "[physics][collision][resolve]") {
    std::vector<RigidBody> bodies;
    bodies.emplace_back(ball("a", Vec2(0.0f, 0.0f), Vec2(10.0f, 0.0f), 0.0f));
    bodies.emplace_back(ball("b", Vec2(15.0f, 0.0f), Vec2(0.0f, 0.0f), 0.0f));

    CollisionDetector detector;
    CollisionResolver resolver;
    auto contacts = resolver.resolve_all(detector.detect(bodies), bodies, PhysicsSpaceConfig::defaults());

    REQUIRE(contacts.size() == 1);
    REQUIRE_THAT(bodies[0].velocity().x, WithinAbs(5.0f, 1e-4f));
    REQUIRE_THAT(bodies[1].velocity().x, WithinAbs(5.0f, 1e-4f));
}

TEST_CASE("CollisionResolver special cases", "[physics][collision][resolve]") {
    CollisionDetector detector;
    CollisionResolver resolver;
    const auto space = PhysicsSpaceConfig::defaults();

    SECTION("separating bodies produce no contact") {
        std::vector<RigidBody> bodies;
        bodies.emplace_back(ball("a", Vec2(0.0f, 0.0f), Vec2(-5.0f, 0.0f), 1.0f));
        bodies.emplace_back(ball("b", Vec2(15.0f, 0.0f), Vec2(5.0f, 0.0f), 1.0f));

        auto contacts = resolver.resolve_all(detector.detect(bodies), bodies, space);
        REQUIRE(contacts.empty());
        REQUIRE(bodies[0].velocity().x == -5.0f);
    }

    SECTION("static body absorbs nothing") {
        std::vector<RigidBody> bodies;
        auto floor = make_box_body("floor", "", Vec2(0.0f, 20.0f), 100.0f, 20.0f);
        floor.type = BodyType::Static;
        floor.material = PhysicsMaterial{0.0f, 0.0f};
        bodies.emplace_back(floor);
        bodies.emplace_back(ball("ball", Vec2(0.0f, 1.0f), Vec2(0.0f, 50.0f), 0.0f));

        auto contacts = resolver.resolve_all(detector.detect(bodies), bodies, space);
        REQUIRE(contacts.size() == 1);
        REQUIRE(bodies[0].position() == Vec2(0.0f, 20.0f));
        REQUIRE_THAT(bodies[1].velocity().y, WithinAbs(0.0f, 1e-4f));
        REQUIRE(bodies[1].position().y < 1.0f);
    }

    SECTION("sensors report without responding") {
        std::vector<RigidBody> bodies;
        auto trigger = ball("trigger", Vec2(0.0f, 0.0f), Vec2(0.0f, 0.0f), 1.0f);
        trigger.response = CollisionResponse::Sensor;
        bodies.emplace_back(trigger);
        bodies.emplace_back(ball("b", Vec2(15.0f, 0.0f), Vec2(-5.0f, 0.0f), 1.0f));

        auto contacts = resolver.resolve_all(detector.detect(bodies), bodies, space);
        REQUIRE(contacts.size() == 1);
        REQUIRE(bodies[1].velocity().x == -5.0f);
        REQUIRE(bodies[1].position().x == 15.0f);
    }

    SECTION("friction slows sliding") {
        std::vector<RigidBody> bodies;
        auto floor = make_box_body("floor", "", Vec2(0.0f, 20.0f), 400.0f, 20.0f);
        floor.type = BodyType::Static;
        floor.material = PhysicsMaterial{0.0f, 1.0f};
        bodies.emplace_back(floor);

        auto slider = ball("slider", Vec2(0.0f, 1.0f), Vec2(20.0f, 10.0f), 0.0f);
        slider.material = PhysicsMaterial{0.0f, 1.0f};
        slider.fixed_rotation = true;
        bodies.emplace_back(slider);

        resolver.resolve_all(detector.detect(bodies), bodies, space);
        REQUIRE(bodies[1].velocity().x < 20.0f);
        REQUIRE(bodies[1].velocity().x >= 0.0f);
    }
}
