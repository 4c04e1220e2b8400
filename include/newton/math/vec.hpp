#pragma once

/// @file vec.hpp
/// @brief 2D vector kernel for newton_math
///
/// Arithmetic (add, subtract, scale) comes from GLM's operators; this header
/// adds the planar operations the simulation needs on top of them.

#include "types.hpp"
#include <array>
#include <cmath>

namespace newton_math {

// =============================================================================
// Core Vector Operations (GLM wrappers)
// =============================================================================

/// Dot product of two vectors
[[nodiscard]] inline float dot(const Vec2& a, const Vec2& b) noexcept {
    return glm::dot(a, b);
}

/// Length of a vector
[[nodiscard]] inline float length(const Vec2& v) noexcept {
    return glm::length(v);
}

/// Squared length of a vector
[[nodiscard]] inline float length_squared(const Vec2& v) noexcept {
    return glm::length2(v);
}

/// Distance between two points
[[nodiscard]] inline float distance(const Vec2& a, const Vec2& b) noexcept {
    return glm::length(b - a);
}

/// Squared distance between two points
[[nodiscard]] inline float distance_squared(const Vec2& a, const Vec2& b) noexcept {
    return glm::length2(b - a);
}

// =============================================================================
// Vec2 Utilities
// =============================================================================

/// Create a Vec2 with all components equal to v
[[nodiscard]] inline Vec2 splat2(float v) noexcept {
    return Vec2(v, v);
}

/// 2D cross product (z component of the 3D cross product)
[[nodiscard]] inline float cross(const Vec2& a, const Vec2& b) noexcept {
    return a.x * b.y - a.y * b.x;
}

/// Get perpendicular vector (rotated 90 degrees counter-clockwise)
[[nodiscard]] inline Vec2 perpendicular(const Vec2& v) noexcept {
    return Vec2(-v.y, v.x);
}

/// Normalize vector, returning zero if length is too small
[[nodiscard]] inline Vec2 normalize_or_zero(const Vec2& v) noexcept {
    const float len_sq = glm::length2(v);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec2::ZERO;
    }
    return v * (1.0f / std::sqrt(len_sq));
}

/// Rotate vector by angle (radians, counter-clockwise in a Y-up frame)
[[nodiscard]] inline Vec2 rotate(const Vec2& v, float angle) noexcept {
    const float c = std::cos(angle);
    const float s = std::sin(angle);
    return Vec2(v.x * c - v.y * s, v.x * s + v.y * c);
}

/// Linear interpolation
[[nodiscard]] inline Vec2 lerp(const Vec2& a, const Vec2& b, float t) noexcept {
    return a + (b - a) * t;
}

/// Scalar linear interpolation
[[nodiscard]] inline float lerp(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

/// Convert Vec2 to array
[[nodiscard]] inline std::array<float, 2> to_array(const Vec2& v) noexcept {
    return {v.x, v.y};
}

/// Check if two vectors are approximately equal
[[nodiscard]] inline bool approx_equal(const Vec2& a, const Vec2& b, float epsilon = consts::EPSILON) noexcept {
    return std::abs(a.x - b.x) <= epsilon && std::abs(a.y - b.y) <= epsilon;
}

} // namespace newton_math
