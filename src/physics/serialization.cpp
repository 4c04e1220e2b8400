/// @file serialization.cpp
/// @brief JSON serialization implementation

#include <newton/physics/serialization.hpp>
#include <newton/core/overloaded.hpp>
#include <newton/physics/engine.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <variant>

namespace newton_physics {

using newton_core::Overloaded;
using newton_core::Error;
using newton_core::ErrorCode;
using newton_math::Vec2;

namespace {

nlohmann::json vec2_to_json(const Vec2& v) {
    return nlohmann::json{{"x", v.x}, {"y", v.y}};
}

Error wrong_type(const std::string& key, const char* expected) {
    return Error(ErrorCode::ValidationError, "space config '" + key + "' must be " + expected);
}

/// Readers leave `out` untouched when the key is absent
std::optional<Error> read_float(const nlohmann::json& j, const std::string& key, float& out) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (!j[key].is_number()) {
        return wrong_type(key, "a number");
    }
    out = j[key].get<float>();
    return std::nullopt;
}

std::optional<Error> read_uint(const nlohmann::json& j, const std::string& key, std::uint32_t& out) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    const auto& value = j[key];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0 ||
        value.get<std::int64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return wrong_type(key, "a non-negative integer");
    }
    out = value.get<std::uint32_t>();
    return std::nullopt;
}

std::optional<Error> read_bool(const nlohmann::json& j, const std::string& key, bool& out) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (!j[key].is_boolean()) {
        return wrong_type(key, "a boolean");
    }
    out = j[key].get<bool>();
    return std::nullopt;
}

/// Accepts {"x": .., "y": ..} or [x, y]
std::optional<Error> read_vec2(const nlohmann::json& j, const std::string& key, Vec2& out) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    const auto& value = j[key];
    if (value.is_object() && value.contains("x") && value.contains("y") &&
        value["x"].is_number() && value["y"].is_number()) {
        out = Vec2(value["x"].get<float>(), value["y"].get<float>());
        return std::nullopt;
    }
    if (value.is_array() && value.size() == 2 && value[0].is_number() && value[1].is_number()) {
        out = Vec2(value[0].get<float>(), value[1].get<float>());
        return std::nullopt;
    }
    return wrong_type(key, "a vector {x, y}");
}

} // anonymous namespace

// =============================================================================
// Space Configuration
// =============================================================================

newton_core::Result<PhysicsSpaceConfig> space_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return newton_core::Err<PhysicsSpaceConfig>(
            Error(ErrorCode::ValidationError, "space config must be a JSON object"));
    }

    PhysicsSpaceConfig config = PhysicsSpaceConfig::defaults();

    const std::optional<Error> errors[] = {
        read_float(j, "time_step", config.time_step),
        read_uint(j, "velocity_iterations", config.velocity_iterations),
        read_uint(j, "position_iterations", config.position_iterations),
        read_vec2(j, "gravity", config.gravity),
        read_bool(j, "sleep_enabled", config.sleep_enabled),
        read_float(j, "sleep_time_threshold", config.sleep_time_threshold),
        read_float(j, "sleep_velocity_threshold", config.sleep_velocity_threshold),
        read_float(j, "collision_slop", config.collision_slop),
        read_float(j, "collision_bias", config.collision_bias),
        read_uint(j, "seed", config.seed),
        read_uint(j, "checkpoint_interval", config.checkpoint_interval),
        read_float(j, "soft_body_damping", config.soft_body_damping),
    };
    for (const auto& error : errors) {
        if (error) {
            return newton_core::Err<PhysicsSpaceConfig>(*error);
        }
    }

    if (auto valid = config.validate(); !valid) {
        return newton_core::Err<PhysicsSpaceConfig>(valid.error());
    }
    return newton_core::Ok(std::move(config));
}

newton_core::Result<PhysicsSpaceConfig> space_config_from_json_string(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        return space_config_from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return newton_core::Err<PhysicsSpaceConfig>(
            Error(ErrorCode::ParseError, std::string("JSON parse error: ") + e.what()));
    }
}

nlohmann::json to_json(const PhysicsSpaceConfig& config) {
    nlohmann::json j;
    j["time_step"] = config.time_step;
    j["velocity_iterations"] = config.velocity_iterations;
    j["position_iterations"] = config.position_iterations;
    j["gravity"] = vec2_to_json(config.gravity);
    j["sleep_enabled"] = config.sleep_enabled;
    j["sleep_time_threshold"] = config.sleep_time_threshold;
    j["sleep_velocity_threshold"] = config.sleep_velocity_threshold;
    j["collision_slop"] = config.collision_slop;
    j["collision_bias"] = config.collision_bias;
    j["seed"] = config.seed;
    j["checkpoint_interval"] = config.checkpoint_interval;
    j["soft_body_damping"] = config.soft_body_damping;
    return j;
}

// =============================================================================
// Simulation State
// =============================================================================

nlohmann::json to_json(const PhysicsSimulationState& state) {
    nlohmann::json j;
    j["frame"] = state.frame;

    j["rigid_bodies"] = nlohmann::json::array();
    for (const auto& body : state.rigid_bodies) {
        j["rigid_bodies"].push_back({
            {"id", body.id},
            {"position", vec2_to_json(body.position)},
            {"velocity", vec2_to_json(body.velocity)},
            {"angle", body.angle},
            {"angular_velocity", body.angular_velocity},
            {"is_sleeping", body.is_sleeping},
        });
    }

    j["soft_bodies"] = nlohmann::json::array();
    for (const auto& soft_body : state.soft_bodies) {
        nlohmann::json particles = nlohmann::json::array();
        for (const auto& p : soft_body.particles) {
            particles.push_back({
                {"id", p.id},
                {"position", vec2_to_json(p.position)},
                {"velocity", vec2_to_json(p.velocity)},
            });
        }
        j["soft_bodies"].push_back({
            {"id", soft_body.id},
            {"particles", std::move(particles)},
            {"broken_constraints", soft_body.broken_constraints},
        });
    }

    j["cloths"] = nlohmann::json::array();
    for (const auto& cloth : state.cloths) {
        nlohmann::json positions = nlohmann::json::array();
        for (const auto& p : cloth.positions) {
            positions.push_back(vec2_to_json(p));
        }
        nlohmann::json torn = nlohmann::json::array();
        for (const auto& t : cloth.torn) {
            torn.push_back({{"row", t.row}, {"col", t.col}, {"kind", to_string(t.kind)}});
        }
        j["cloths"].push_back({
            {"id", cloth.id},
            {"width", cloth.width},
            {"height", cloth.height},
            {"positions", std::move(positions)},
            {"torn", std::move(torn)},
        });
    }

    j["ragdolls"] = nlohmann::json::array();
    for (const auto& ragdoll : state.ragdolls) {
        nlohmann::json bones = nlohmann::json::array();
        for (const auto& bone : ragdoll.bones) {
            bones.push_back({
                {"id", bone.id},
                {"position", vec2_to_json(bone.position)},
                {"angle", bone.angle},
                {"velocity", vec2_to_json(bone.velocity)},
                {"angular_velocity", bone.angular_velocity},
            });
        }
        j["ragdolls"].push_back({{"id", ragdoll.id}, {"bones", std::move(bones)}});
    }

    j["contacts"] = nlohmann::json::array();
    for (const auto& contact : state.contacts) {
        j["contacts"].push_back({
            {"body_a", contact.body_a},
            {"body_b", contact.body_b},
            {"point", vec2_to_json(contact.point)},
            {"normal", vec2_to_json(contact.normal)},
            {"depth", contact.depth},
            {"impulse", contact.impulse},
        });
    }

    return j;
}

// =============================================================================
// Keyframes
// =============================================================================

nlohmann::json to_json(const std::vector<ExportedKeyframes>& tracks) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& track : tracks) {
        nlohmann::json keyframes = nlohmann::json::array();
        for (const auto& keyframe : track.keyframes) {
            nlohmann::json value = std::visit(Overloaded{
                [](float v) { return nlohmann::json(v); },
                [](const Vec2& v) { return vec2_to_json(v); },
            }, keyframe.value);

            keyframes.push_back({
                {"frame", keyframe.frame},
                {"value", std::move(value)},
                {"interpolation", to_string(keyframe.interpolation)},
            });
        }
        j.push_back({
            {"layer_id", track.layer_id},
            {"property", track.property},
            {"keyframes", std::move(keyframes)},
        });
    }
    return j;
}

} // namespace newton_physics
