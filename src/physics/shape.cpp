/// @file shape.cpp
/// @brief Collision shape helpers

#include <newton/physics/shape.hpp>
#include <newton/core/overloaded.hpp>
#include <newton/math/constants.hpp>

#include <algorithm>

namespace newton_physics {

using newton_core::Overloaded;

ShapeKind shape_kind(const Shape& shape) noexcept {
    return std::visit(Overloaded{
        [](const CircleShape&) { return ShapeKind::Circle; },
        [](const BoxShape&) { return ShapeKind::Box; },
        [](const CapsuleShape&) { return ShapeKind::Capsule; },
    }, shape);
}

const char* to_string(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Circle: return "Circle";
        case ShapeKind::Box: return "Box";
        case ShapeKind::Capsule: return "Capsule";
    }
    return "Unknown";
}

float nominal_radius(const Shape& shape) noexcept {
    return std::visit(Overloaded{
        [](const CircleShape& c) { return c.radius; },
        [](const BoxShape& b) { return 0.5f * std::min(b.width, b.height); },
        [](const CapsuleShape& c) { return c.radius; },
    }, shape);
}

float compute_moment_of_inertia(const Shape& shape, float mass) noexcept {
    return std::visit(Overloaded{
        [mass](const CircleShape& c) {
            return mass * c.radius * c.radius / 2.0f;
        },
        [mass](const BoxShape& b) {
            return mass * (b.width * b.width + b.height * b.height) / 12.0f;
        },
        [mass](const CapsuleShape& c) {
            const float r = c.radius;
            const float l = c.length;
            const float core_mass = mass * l / (l + newton_math::consts::PI * r);
            const float cap_mass = mass - core_mass;
            const float core_inertia = core_mass * (l * l + 4.0f * r * r) / 12.0f;
            const float cap_inertia = cap_mass * r * r / 2.0f;
            return core_inertia + cap_inertia;
        },
    }, shape);
}

} // namespace newton_physics
