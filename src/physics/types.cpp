/// @file types.cpp
/// @brief Implementation of core physics types

#include <newton/physics/types.hpp>

#include <cmath>

namespace newton_physics {

// =============================================================================
// Enum to_string
// =============================================================================

const char* to_string(BodyType type) {
    switch (type) {
        case BodyType::Static: return "Static";
        case BodyType::Dynamic: return "Dynamic";
        case BodyType::Dead: return "Dead";
    }
    return "Unknown";
}

const char* to_string(CollisionResponse response) {
    switch (response) {
        case CollisionResponse::Collide: return "Collide";
        case CollisionResponse::Sensor: return "Sensor";
        case CollisionResponse::None: return "None";
    }
    return "Unknown";
}

// =============================================================================
// PhysicsMaterial
// =============================================================================

std::optional<PhysicsMaterial> PhysicsMaterial::preset(const std::string& name) {
    if (name == "default") return default_material();
    if (name == "rubber") return rubber();
    if (name == "ice") return ice();
    if (name == "metal") return metal();
    if (name == "wood") return wood();
    if (name == "stone") return stone();
    if (name == "bouncy") return bouncy();
    if (name == "sticky") return sticky();
    return std::nullopt;
}

// =============================================================================
// PhysicsSpaceConfig
// =============================================================================

newton_core::Result<void> PhysicsSpaceConfig::validate() const {
    using newton_core::SimulationError;

    if (!(time_step > 0.0f) || !std::isfinite(time_step)) {
        return newton_core::Err(SimulationError::invalid_config("time_step must be positive"));
    }
    if (velocity_iterations == 0) {
        return newton_core::Err(SimulationError::invalid_config("velocity_iterations must be at least 1"));
    }
    if (position_iterations == 0) {
        return newton_core::Err(SimulationError::invalid_config("position_iterations must be at least 1"));
    }
    if (checkpoint_interval == 0) {
        return newton_core::Err(SimulationError::invalid_config("checkpoint_interval must be at least 1"));
    }
    if (collision_slop < 0.0f || collision_bias < 0.0f) {
        return newton_core::Err(SimulationError::invalid_config("collision slop and bias must not be negative"));
    }
    if (sleep_time_threshold < 0.0f || sleep_velocity_threshold < 0.0f) {
        return newton_core::Err(SimulationError::invalid_config("sleep thresholds must not be negative"));
    }
    if (soft_body_damping < 0.0f || soft_body_damping > 1.0f) {
        return newton_core::Err(SimulationError::invalid_config("soft_body_damping must be in [0, 1]"));
    }
    return newton_core::Ok();
}

} // namespace newton_physics
