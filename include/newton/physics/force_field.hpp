/// @file force_field.hpp
/// @brief Animated force fields applied to rigid bodies

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace newton_physics {

class RigidBody;

// =============================================================================
// Animatable Properties
// =============================================================================

/// A value that an animation system may drive per frame
///
/// `value` is the static fallback used when nothing drives the property.
template<typename T>
struct AnimatableProperty {
    std::string id;
    T value{};

    [[nodiscard]] static AnimatableProperty constant(T v) { return AnimatableProperty{{}, v}; }
};

/// Resolves animatable properties at a frame
class IPropertyEvaluator {
public:
    virtual ~IPropertyEvaluator() = default;

    [[nodiscard]] virtual float evaluate(const AnimatableProperty<float>& property, int frame) const = 0;
    [[nodiscard]] virtual newton_math::Vec2 evaluate(const AnimatableProperty<newton_math::Vec2>& property,
                                                     int frame) const = 0;
};

/// Returns every property's static value
class StaticPropertyEvaluator final : public IPropertyEvaluator {
public:
    [[nodiscard]] float evaluate(const AnimatableProperty<float>& property, int) const override {
        return property.value;
    }
    [[nodiscard]] newton_math::Vec2 evaluate(const AnimatableProperty<newton_math::Vec2>& property,
                                             int) const override {
        return property.value;
    }
};

// =============================================================================
// Field Parameters
// =============================================================================

/// Distance falloff for attraction fields
enum class Falloff : std::uint8_t {
    Constant,
    Linear,
    Quadratic,
};

[[nodiscard]] const char* to_string(Falloff falloff);

/// Uniform acceleration scaled by body mass
struct GravityField {
    AnimatableProperty<newton_math::Vec2> gravity;
};

/// Directional force plus position/time dependent turbulence (not mass scaled)
struct WindField {
    AnimatableProperty<newton_math::Vec2> direction;
    AnimatableProperty<float> turbulence;
    float frequency = 0.01f;
    float seed = 0.0f;
};

/// Pull towards a point; negative strength repels
struct AttractionField {
    AnimatableProperty<newton_math::Vec2> position;
    AnimatableProperty<float> strength;
    float radius = 0.0f;            ///< Zero means unlimited
    Falloff falloff = Falloff::Linear;
};

/// One-shot radial impulse on `trigger_frame`
struct ExplosionField {
    newton_math::Vec2 position{0.0f, 0.0f};
    float strength = 0.0f;
    float radius = 100.0f;
    int trigger_frame = 0;
};

/// Upward force below a surface line (+Y is down)
struct BuoyancyField {
    AnimatableProperty<float> surface_level;
    float density = 1.0f;
    float linear_drag = 0.0f;
    float angular_drag = 0.0f;
};

/// Swirl around a point with optional inward pull
struct VortexField {
    AnimatableProperty<newton_math::Vec2> position;
    AnimatableProperty<float> strength;
    float radius = 100.0f;
    float inward_force = 0.0f;
};

/// Resistance opposing velocity
struct DragField {
    float linear = 0.0f;
    float quadratic = 0.0f;
};

using ForceFieldParams = std::variant<
    GravityField,
    WindField,
    AttractionField,
    ExplosionField,
    BuoyancyField,
    VortexField,
    DragField>;

enum class ForceFieldKind : std::uint8_t {
    Gravity,
    Wind,
    Attraction,
    Explosion,
    Buoyancy,
    Vortex,
    Drag,
};

[[nodiscard]] const char* to_string(ForceFieldKind kind);

// =============================================================================
// ForceField
// =============================================================================

struct ForceField {
    std::string id;
    bool enabled = true;
    int start_frame = 0;
    int end_frame = -1;                         ///< Negative means open ended
    std::vector<std::string> affected_bodies;   ///< Empty means all bodies
    ForceFieldParams params = GravityField{};

    [[nodiscard]] ForceFieldKind kind() const noexcept;

    /// Enabled and inside the frame window
    [[nodiscard]] bool is_active(int frame) const noexcept;

    [[nodiscard]] bool affects(const std::string& body_id) const;
};

/// Gravity field with a constant vector
[[nodiscard]] ForceField make_gravity_field(const std::string& id, const newton_math::Vec2& gravity);

// =============================================================================
// ForceFieldProcessor
// =============================================================================

/// Applies active fields to movable rigid bodies each frame
class ForceFieldProcessor {
public:
    /// Water is treated as this many units of gravity per unit density
    static constexpr float k_buoyancy_gravity = 980.0f;

    ForceFieldProcessor();

    void set_fields(std::vector<ForceField> fields) { m_fields = std::move(fields); }
    [[nodiscard]] const std::vector<ForceField>& fields() const noexcept { return m_fields; }

    /// Replace the property evaluator; null restores static values
    void set_evaluator(std::shared_ptr<const IPropertyEvaluator> evaluator);

    /// Apply every active field to every affected body
    void process(int frame, std::vector<RigidBody>& bodies) const;

    /// Force a field exerts on a body at a frame
    ///
    /// Explosion and buoyancy also act on the body directly (impulse, angular drag).
    std::optional<newton_math::Vec2> compute_force(const ForceField& field, RigidBody& body, int frame) const;

private:
    std::vector<ForceField> m_fields;
    std::shared_ptr<const IPropertyEvaluator> m_evaluator;
};

} // namespace newton_physics
