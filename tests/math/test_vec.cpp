// newton_math vector tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <newton/math/math.hpp>

using namespace newton_math;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Vec2 Tests
// =============================================================================

TEST_CASE("Vec2 constants", "[math][vec2]") {
    REQUIRE(vec2::ZERO == Vec2(0.0f, 0.0f));
    REQUIRE(vec2::ONE == Vec2(1.0f, 1.0f));
    REQUIRE(vec2::X == Vec2(1.0f, 0.0f));
    REQUIRE(vec2::Y == Vec2(0.0f, 1.0f));
    REQUIRE(vec2::DOWN == Vec2(0.0f, 1.0f));
    REQUIRE(vec2::UP == Vec2(0.0f, -1.0f));
}

TEST_CASE("Vec2 operations", "[math][vec2]") {
    Vec2 a(3.0f, 4.0f);
    Vec2 b(1.0f, 2.0f);

    SECTION("basic arithmetic") {
        REQUIRE(a + b == Vec2(4.0f, 6.0f));
        REQUIRE(a - b == Vec2(2.0f, 2.0f));
        REQUIRE(a * 2.0f == Vec2(6.0f, 8.0f));
        REQUIRE(a / 2.0f == Vec2(1.5f, 2.0f));
    }

    SECTION("dot product") {
        REQUIRE_THAT(dot(a, b), WithinAbs(11.0f, 1e-6f));
        REQUIRE_THAT(dot(vec2::X, vec2::Y), WithinAbs(0.0f, 1e-6f));
    }

    SECTION("length and distance") {
        REQUIRE_THAT(length(a), WithinAbs(5.0f, 1e-6f));
        REQUIRE_THAT(length_squared(a), WithinAbs(25.0f, 1e-6f));
        REQUIRE_THAT(distance(a, b), WithinAbs(std::sqrt(8.0f), 1e-6f));
        REQUIRE_THAT(distance_squared(a, b), WithinAbs(8.0f, 1e-6f));
    }

    SECTION("cross product") {
        REQUIRE_THAT(cross(vec2::X, vec2::Y), WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(cross(vec2::Y, vec2::X), WithinAbs(-1.0f, 1e-6f));
        REQUIRE_THAT(cross(a, a), WithinAbs(0.0f, 1e-6f));
    }

    SECTION("perpendicular") {
        Vec2 p = perpendicular(a);
        REQUIRE(p == Vec2(-4.0f, 3.0f));
        REQUIRE_THAT(dot(a, p), WithinAbs(0.0f, 1e-6f));
    }
}

TEST_CASE("Vec2 normalize_or_zero", "[math][vec2]") {
    SECTION("unit result") {
        Vec2 n = normalize_or_zero(Vec2(3.0f, 4.0f));
        REQUIRE_THAT(n.x, WithinAbs(0.6f, 1e-6f));
        REQUIRE_THAT(n.y, WithinAbs(0.8f, 1e-6f));
        REQUIRE_THAT(length(n), WithinAbs(1.0f, 1e-6f));
    }

    SECTION("zero vector stays zero") {
        REQUIRE(normalize_or_zero(vec2::ZERO) == vec2::ZERO);
    }

    SECTION("tiny vector becomes zero") {
        REQUIRE(normalize_or_zero(Vec2(1e-8f, 0.0f)) == vec2::ZERO);
    }
}

TEST_CASE("Vec2 rotate", "[math][vec2]") {
    SECTION("quarter turn") {
        Vec2 r = rotate(vec2::X, consts::FRAC_PI_2);
        REQUIRE(approx_equal(r, vec2::Y, 1e-6f));
    }

    SECTION("half turn") {
        Vec2 r = rotate(Vec2(2.0f, 1.0f), consts::PI);
        REQUIRE(approx_equal(r, Vec2(-2.0f, -1.0f), 1e-5f));
    }

    SECTION("preserves length") {
        Vec2 v(3.0f, -7.0f);
        REQUIRE_THAT(length(rotate(v, 1.234f)), WithinAbs(length(v), 1e-5f));
    }
}

TEST_CASE("Vec2 lerp", "[math][vec2]") {
    Vec2 a(0.0f, 10.0f);
    Vec2 b(10.0f, 20.0f);

    REQUIRE(lerp(a, b, 0.0f) == a);
    REQUIRE(lerp(a, b, 1.0f) == b);
    REQUIRE(approx_equal(lerp(a, b, 0.25f), Vec2(2.5f, 12.5f)));
    REQUIRE_THAT(lerp(2.0f, 4.0f, 0.5f), WithinAbs(3.0f, 1e-6f));
}

TEST_CASE("Vec2 utilities", "[math][vec2]") {
    REQUIRE(splat2(3.0f) == Vec2(3.0f, 3.0f));

    auto arr = to_array(Vec2(1.5f, -2.5f));
    REQUIRE(arr[0] == 1.5f);
    REQUIRE(arr[1] == -2.5f);

    REQUIRE(approx_equal(Vec2(1.0f, 1.0f), Vec2(1.0f + 1e-7f, 1.0f)));
    REQUIRE_FALSE(approx_equal(Vec2(1.0f, 1.0f), Vec2(1.1f, 1.0f)));
}
