// newton_physics keyframe export tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <newton/physics/engine.hpp>
#include <newton/math/constants.hpp>
#include <limits>
#include <string>

using namespace newton_physics;
using newton_math::Vec2;
using newton_core::ErrorCode;
using Catch::Matchers::WithinAbs;

namespace {

ExportedKeyframe vec_key(int frame, float x, float y) {
    return ExportedKeyframe{frame, Vec2(x, y), KeyframeInterpolation::Linear};
}

ExportedKeyframe scalar_key(int frame, float value) {
    return ExportedKeyframe{frame, value, KeyframeInterpolation::Linear};
}

std::vector<int> frames_of(const std::vector<ExportedKeyframe>& keyframes) {
    std::vector<int> frames;
    for (const auto& k : keyframes) {
        frames.push_back(k.frame);
    }
    return frames;
}

PhysicsSpaceConfig weightless() {
    auto config = PhysicsSpaceConfig::defaults();
    config.gravity = Vec2(0.0f, 0.0f);
    return config;
}

} // anonymous namespace

// =============================================================================
// Options
// =============================================================================

TEST_CASE("KeyframeExportOptions defaults", "[physics][keyframe]") {
    KeyframeExportOptions options;
    REQUIRE(options.start_frame == 0);
    REQUIRE(options.end_frame == 0);
    REQUIRE(options.frame_step == 1);
    REQUIRE(options.properties.size() == 2);
    REQUIRE(options.interpolation == KeyframeInterpolation::Linear);
    REQUIRE_FALSE(options.simplify);
    REQUIRE(options.simplify_tolerance == 0.5f);
    REQUIRE(options.validate().is_ok());
}

TEST_CASE("KeyframeExportOptions validation", "[physics][keyframe]") {
    KeyframeExportOptions options;
    options.end_frame = 10;

    SECTION("negative start") {
        options.start_frame = -1;
        auto result = options.validate();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("reversed range") {
        options.start_frame = 20;
        REQUIRE(options.validate().error().code() == ErrorCode::ValidationError);
    }

    SECTION("zero step") {
        options.frame_step = 0;
        REQUIRE(options.validate().error().code() == ErrorCode::ValidationError);
    }

    SECTION("negative tolerance") {
        options.simplify_tolerance = -0.1f;
        REQUIRE(options.validate().error().code() == ErrorCode::ValidationError);
    }

    SECTION("single frame range") {
        options.start_frame = 10;
        REQUIRE(options.validate().is_ok());
    }

    SECTION("range that would step past the last int frame") {
        options.end_frame = std::numeric_limits<int>::max() - 2;
        options.frame_step = 5;
        REQUIRE(options.validate().error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Keyframe names", "[physics][keyframe]") {
    REQUIRE(std::string(to_string(KeyframeProperty::Position)) == "transform.position");
    REQUIRE(std::string(to_string(KeyframeProperty::Rotation)) == "transform.rotation.z");
    REQUIRE(std::string(to_string(KeyframeInterpolation::Linear)) == "linear");
    REQUIRE(std::string(to_string(KeyframeInterpolation::Bezier)) == "bezier");
}

// =============================================================================
// Simplification
// =============================================================================

TEST_CASE("simplify_keyframes vectors", "[physics][keyframe][simplify]") {
    SECTION("short series are untouched") {
        std::vector<ExportedKeyframe> keys{vec_key(0, 0.0f, 0.0f), vec_key(1, 50.0f, 50.0f)};
        REQUIRE(simplify_keyframes(keys, 0.5f).size() == 2);
        REQUIRE(simplify_keyframes({}, 0.5f).empty());
    }

    SECTION("straight line collapses to its ends") {
        std::vector<ExportedKeyframe> keys{vec_key(0, 0.0f, 0.0f), vec_key(1, 1.0f, 1.0f),
                                           vec_key(2, 2.0f, 2.0f), vec_key(3, 3.0f, 3.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 3});
    }

    SECTION("corners are kept") {
        std::vector<ExportedKeyframe> keys{vec_key(0, 0.0f, 0.0f), vec_key(1, 10.0f, 0.0f),
                                           vec_key(2, 10.0f, 10.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 1, 2});
    }

    SECTION("deviation within tolerance is dropped") {
        std::vector<ExportedKeyframe> keys{vec_key(0, 0.0f, 0.0f), vec_key(1, 5.0f, 0.4f),
                                           vec_key(2, 10.0f, 0.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 2});
        REQUIRE(frames_of(simplify_keyframes(keys, 0.1f)) == std::vector<int>{0, 1, 2});
    }

    SECTION("out and back is kept") {
        std::vector<ExportedKeyframe> keys{vec_key(0, 0.0f, 0.0f), vec_key(1, 5.0f, 0.0f),
                                           vec_key(2, 0.0f, 0.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 1, 2});
    }

    SECTION("resting body collapses") {
        std::vector<ExportedKeyframe> keys{vec_key(0, 3.0f, 4.0f), vec_key(1, 3.0f, 4.0f),
                                           vec_key(2, 3.0f, 4.0f), vec_key(3, 3.0f, 4.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 3});
    }
}

TEST_CASE("simplify_keyframes scalars", "[physics][keyframe][simplify]") {
    SECTION("linear ramp collapses") {
        std::vector<ExportedKeyframe> keys{scalar_key(0, 0.0f), scalar_key(1, 1.0f),
                                           scalar_key(2, 2.0f), scalar_key(3, 3.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 3});
    }

    SECTION("ramp into a hold keeps the knee") {
        std::vector<ExportedKeyframe> keys{scalar_key(0, 0.0f), scalar_key(1, 1.0f), scalar_key(2, 2.0f),
                                           scalar_key(3, 3.0f), scalar_key(4, 3.0f), scalar_key(5, 3.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 3, 5});
    }

    SECTION("interpolation respects frame spacing") {
        std::vector<ExportedKeyframe> keys{scalar_key(0, 0.0f), scalar_key(10, 10.0f), scalar_key(40, 40.0f)};
        REQUIRE(frames_of(simplify_keyframes(keys, 0.5f)) == std::vector<int>{0, 40});
    }

    SECTION("values are preserved") {
        std::vector<ExportedKeyframe> keys{scalar_key(0, 0.0f), scalar_key(1, 90.0f), scalar_key(2, 0.0f)};
        auto simplified = simplify_keyframes(keys, 0.5f);
        REQUIRE(simplified.size() == 3);
        REQUIRE(std::get<float>(simplified[1].value) == 90.0f);
    }
}

// =============================================================================
// Engine Export
// =============================================================================

TEST_CASE("PhysicsEngine export_keyframes", "[physics][keyframe][engine]") {
    PhysicsEngine engine;

    auto floor = make_box_body("floor", "", Vec2(0.0f, 500.0f), 1000.0f, 20.0f);
    floor.type = BodyType::Static;
    engine.add_rigid_body(floor).unwrap();
    engine.add_rigid_body(make_circle_body("ball", "ball_layer", Vec2(0.0f, 0.0f), 10.0f)).unwrap();
    engine.add_rigid_body(make_box_body("crate", "crate_layer", Vec2(100.0f, 0.0f), 20.0f, 20.0f)).unwrap();

    KeyframeExportOptions options;
    options.start_frame = 0;
    options.end_frame = 10;
    options.frame_step = 5;

    auto tracks = engine.export_keyframes(options);
    REQUIRE(tracks.is_ok());

    SECTION("one track per property for every body in insertion order") {
        REQUIRE(tracks->size() == 6);
        REQUIRE((*tracks)[0].layer_id.empty());
        REQUIRE((*tracks)[0].property == "transform.position");
        REQUIRE((*tracks)[1].layer_id.empty());
        REQUIRE((*tracks)[2].layer_id == "ball_layer");
        REQUIRE((*tracks)[2].property == "transform.position");
        REQUIRE((*tracks)[3].layer_id == "ball_layer");
        REQUIRE((*tracks)[3].property == "transform.rotation.z");
        REQUIRE((*tracks)[4].layer_id == "crate_layer");
        REQUIRE((*tracks)[5].layer_id == "crate_layer");
    }

    SECTION("bodies without a layer are exported too") {
        const Vec2 floor_position = std::get<Vec2>((*tracks)[0].keyframes.back().value);
        REQUIRE(floor_position == Vec2(0.0f, 500.0f));
    }

    SECTION("samples the requested frames") {
        for (const auto& track : *tracks) {
            REQUIRE(frames_of(track.keyframes) == std::vector<int>{0, 5, 10});
            for (const auto& key : track.keyframes) {
                REQUIRE(key.interpolation == KeyframeInterpolation::Linear);
            }
        }
    }

    SECTION("positions match evaluated frames") {
        auto state = engine.evaluate_frame(5);
        const Vec2 ball = std::get<Vec2>((*tracks)[2].keyframes[1].value);
        REQUIRE(ball == state->rigid_bodies[1].position);
    }

    SECTION("errors are reported") {
        options.end_frame = -5;
        REQUIRE(engine.export_keyframes(options).is_err());
    }
}

TEST_CASE("PhysicsEngine export_keyframes rotation", "[physics][keyframe][engine]") {
    PhysicsEngine engine(weightless());

    auto wheel = make_circle_body("wheel", "wheel_layer", Vec2(0.0f, 0.0f), 10.0f);
    wheel.angular_velocity = newton_math::consts::PI;
    wheel.angular_damping = 0.0f;
    engine.add_rigid_body(wheel).unwrap();

    KeyframeExportOptions options;
    options.start_frame = 59;
    options.end_frame = 59;
    options.properties = {KeyframeProperty::Rotation};
    options.interpolation = KeyframeInterpolation::Bezier;

    auto tracks = engine.export_keyframes(options);
    REQUIRE(tracks->size() == 1);

    const auto& track = (*tracks)[0];
    REQUIRE(track.property == "transform.rotation.z");
    REQUIRE(track.keyframes.size() == 1);
    REQUIRE(track.keyframes[0].interpolation == KeyframeInterpolation::Bezier);

    // Sixty steps at half a turn per second
    REQUIRE_THAT(std::get<float>(track.keyframes[0].value), WithinAbs(180.0f, 0.05f));
}

TEST_CASE("PhysicsEngine export_keyframes simplification", "[physics][keyframe][engine]") {
    PhysicsEngine engine(weightless());

    auto puck = make_circle_body("puck", "puck_layer", Vec2(0.0f, 0.0f), 10.0f);
    puck.velocity = Vec2(60.0f, 30.0f);
    puck.linear_damping = 0.0f;
    engine.add_rigid_body(puck).unwrap();

    KeyframeExportOptions options;
    options.end_frame = 60;
    options.simplify = true;

    auto tracks = engine.export_keyframes(options);
    REQUIRE(tracks->size() == 2);

    const auto& position = (*tracks)[0];
    REQUIRE(frames_of(position.keyframes) == std::vector<int>{0, 60});
    REQUIRE_THAT(std::get<Vec2>(position.keyframes[1].value).x, WithinAbs(61.0f, 1e-3f));

    const auto& rotation = (*tracks)[1];
    REQUIRE(frames_of(rotation.keyframes) == std::vector<int>{0, 60});
}

TEST_CASE("PhysicsEngine export keeps evaluation deterministic", "[physics][keyframe][engine]") {
    PhysicsEngine engine;
    engine.add_rigid_body(make_circle_body("ball", "ball_layer", Vec2(0.0f, 0.0f), 10.0f)).unwrap();

    const Vec2 before = engine.evaluate_frame(45)->rigid_bodies[0].position;

    KeyframeExportOptions options;
    options.end_frame = 90;
    REQUIRE(engine.export_keyframes(options).is_ok());

    REQUIRE(engine.evaluate_frame(45)->rigid_bodies[0].position == before);
}
