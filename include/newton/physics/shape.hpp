/// @file shape.hpp
/// @brief Collision shapes for newton_physics

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <variant>

namespace newton_physics {

// =============================================================================
// Shape Types
// =============================================================================

/// Disk centered on the body origin
struct CircleShape {
    float radius = 10.0f;
};

/// Rectangle centered on the body origin, rotated with the body
struct BoxShape {
    float width = 20.0f;
    float height = 20.0f;
};

/// Segment of `length` along the body's local X axis with rounded ends
struct CapsuleShape {
    float radius = 5.0f;
    float length = 20.0f;
};

/// Collision shape (tagged union)
using Shape = std::variant<CircleShape, BoxShape, CapsuleShape>;

/// Shape kind for dispatch and diagnostics
enum class ShapeKind : std::uint8_t {
    Circle,
    Box,
    Capsule,
};

/// Get kind of a shape
[[nodiscard]] ShapeKind shape_kind(const Shape& shape) noexcept;

/// Get shape kind name
[[nodiscard]] const char* to_string(ShapeKind kind);

/// Radius used when a shape pair has no dedicated narrow-phase test
[[nodiscard]] float nominal_radius(const Shape& shape) noexcept;

/// Analytic moment of inertia about the center for the given mass
///
/// Disk: m r^2 / 2. Box: m (w^2 + h^2) / 12. Capsule: the mass is split
/// between a rectangular core and the two end caps by area fraction.
[[nodiscard]] float compute_moment_of_inertia(const Shape& shape, float mass) noexcept;

} // namespace newton_physics
