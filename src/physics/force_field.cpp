/// @file force_field.cpp
/// @brief Force field evaluation

#include <newton/physics/force_field.hpp>
#include <newton/core/overloaded.hpp>
#include <newton/physics/body.hpp>

#include <algorithm>
#include <cmath>

namespace newton_physics {

using newton_core::Overloaded;
using newton_math::Vec2;

namespace {

/// Half of the body's vertical extent, used for the submerged ratio
float vertical_half_extent(const Shape& shape) {
    if (const auto* box = std::get_if<BoxShape>(&shape)) {
        return box->height * 0.5f;
    }
    return nominal_radius(shape);
}

} // anonymous namespace

const char* to_string(Falloff falloff) {
    switch (falloff) {
        case Falloff::Constant: return "constant";
        case Falloff::Linear: return "linear";
        case Falloff::Quadratic: return "quadratic";
    }
    return "unknown";
}

const char* to_string(ForceFieldKind kind) {
    switch (kind) {
        case ForceFieldKind::Gravity: return "gravity";
        case ForceFieldKind::Wind: return "wind";
        case ForceFieldKind::Attraction: return "attraction";
        case ForceFieldKind::Explosion: return "explosion";
        case ForceFieldKind::Buoyancy: return "buoyancy";
        case ForceFieldKind::Vortex: return "vortex";
        case ForceFieldKind::Drag: return "drag";
    }
    return "unknown";
}

// =============================================================================
// ForceField
// =============================================================================

ForceFieldKind ForceField::kind() const noexcept {
    return static_cast<ForceFieldKind>(params.index());
}

bool ForceField::is_active(int frame) const noexcept {
    if (!enabled || frame < start_frame) {
        return false;
    }
    return end_frame < 0 || frame <= end_frame;
}

bool ForceField::affects(const std::string& body_id) const {
    if (affected_bodies.empty()) {
        return true;
    }
    return std::find(affected_bodies.begin(), affected_bodies.end(), body_id) != affected_bodies.end();
}

ForceField make_gravity_field(const std::string& id, const Vec2& gravity) {
    ForceField field;
    field.id = id;
    field.params = GravityField{AnimatableProperty<Vec2>::constant(gravity)};
    return field;
}

// =============================================================================
// ForceFieldProcessor
// =============================================================================

ForceFieldProcessor::ForceFieldProcessor()
    : m_evaluator(std::make_shared<StaticPropertyEvaluator>())
{}

void ForceFieldProcessor::set_evaluator(std::shared_ptr<const IPropertyEvaluator> evaluator) {
    if (evaluator) {
        m_evaluator = std::move(evaluator);
    } else {
        m_evaluator = std::make_shared<StaticPropertyEvaluator>();
    }
}

void ForceFieldProcessor::process(int frame, std::vector<RigidBody>& bodies) const {
    for (const auto& field : m_fields) {
        if (!field.is_active(frame)) {
            continue;
        }

        for (auto& body : bodies) {
            if (body.is_immovable() || !field.affects(body.id())) {
                continue;
            }

            if (auto force = compute_force(field, body, frame)) {
                body.apply_force(*force);
            }
        }
    }
}

std::optional<Vec2> ForceFieldProcessor::compute_force(const ForceField& field, RigidBody& body, int frame) const {
    const IPropertyEvaluator& eval = *m_evaluator;
    const Vec2 pos = body.position();
    const float mass = body.mass();

    return std::visit(Overloaded{
        [&](const GravityField& f) -> std::optional<Vec2> {
            return eval.evaluate(f.gravity, frame) * mass;
        },

        [&](const WindField& f) -> std::optional<Vec2> {
            const Vec2 direction = eval.evaluate(f.direction, frame);
            const float turbulence = eval.evaluate(f.turbulence, frame);
            const float t = static_cast<float>(frame) * 0.1f;
            const Vec2 noise{
                std::sin(pos.x * f.frequency + t + f.seed) * turbulence,
                std::cos(pos.y * f.frequency + t + f.seed * 2.0f) * turbulence,
            };
            return direction + noise;
        },

        [&](const AttractionField& f) -> std::optional<Vec2> {
            const Vec2 center = eval.evaluate(f.position, frame);
            const float strength = eval.evaluate(f.strength, frame);
            const Vec2 diff = center - pos;
            const float dist = newton_math::length(diff);

            if ((f.radius > 0.0f && dist > f.radius) || dist < 1.0f) {
                return std::nullopt;
            }

            float magnitude = strength;
            switch (f.falloff) {
                case Falloff::Linear:
                    magnitude = f.radius > 0.0f ? strength * (f.radius - dist) / f.radius : strength;
                    break;
                case Falloff::Quadratic:
                    magnitude = strength / (dist * dist);
                    break;
                case Falloff::Constant:
                    break;
            }

            return (diff / dist) * magnitude * mass;
        },

        [&](const ExplosionField& f) -> std::optional<Vec2> {
            if (frame != f.trigger_frame) {
                return std::nullopt;
            }

            const Vec2 diff = pos - f.position;
            const float dist = newton_math::length(diff);
            if (dist > f.radius || dist < 1.0f) {
                return std::nullopt;
            }

            const float falloff = 1.0f - dist / f.radius;
            body.apply_impulse((diff / dist) * (f.strength * falloff));
            return std::nullopt;
        },

        [&](const BuoyancyField& f) -> std::optional<Vec2> {
            const float surface = eval.evaluate(f.surface_level, frame);
            const float depth = pos.y - surface;
            if (depth <= 0.0f) {
                return std::nullopt;
            }

            const float extent = vertical_half_extent(body.shape()) * 2.0f;
            const float ratio = extent > 0.0f ? std::min(1.0f, depth / extent) : 1.0f;
            const Vec2 velocity = body.velocity();

            body.set_angular_velocity(body.angular_velocity()
                                      - f.angular_drag * body.angular_velocity() * ratio);

            return Vec2(
                -f.linear_drag * velocity.x * ratio,
                -f.density * ratio * mass * k_buoyancy_gravity - f.linear_drag * velocity.y * ratio);
        },

        [&](const VortexField& f) -> std::optional<Vec2> {
            const Vec2 center = eval.evaluate(f.position, frame);
            const float strength = eval.evaluate(f.strength, frame);
            const Vec2 diff = pos - center;
            const float dist = newton_math::length(diff);

            if (dist > f.radius || dist < 1.0f) {
                return std::nullopt;
            }

            const float falloff = 1.0f - dist / f.radius;
            const Vec2 radial = diff / dist;
            const Vec2 tangent = newton_math::perpendicular(radial);

            return tangent * (strength * falloff * mass) - radial * (f.inward_force * falloff * mass);
        },

        [&](const DragField& f) -> std::optional<Vec2> {
            const Vec2 velocity = body.velocity();
            const float speed = newton_math::length(velocity);
            if (speed < 0.01f) {
                return std::nullopt;
            }

            const float magnitude = f.linear * speed + f.quadratic * speed * speed;
            return -(velocity / speed) * magnitude;
        },
    }, field.params);
}

} // namespace newton_physics
