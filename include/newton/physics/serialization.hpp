/// @file serialization.hpp
/// @brief JSON documents for space configuration, simulation state and keyframes

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "keyframe_export.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace newton_physics {

// =============================================================================
// Space Configuration
// =============================================================================

/// Read a configuration object; absent keys keep their defaults
///
/// Fails with ValidationError when a present key has the wrong type or the
/// result does not validate.
[[nodiscard]] newton_core::Result<PhysicsSpaceConfig> space_config_from_json(const nlohmann::json& j);

/// Parse a configuration document; malformed text fails with ParseError
[[nodiscard]] newton_core::Result<PhysicsSpaceConfig> space_config_from_json_string(const std::string& text);

[[nodiscard]] nlohmann::json to_json(const PhysicsSpaceConfig& config);

// =============================================================================
// Output
// =============================================================================

[[nodiscard]] nlohmann::json to_json(const PhysicsSimulationState& state);

/// Keyframe tracks in the layout the compositor imports
[[nodiscard]] nlohmann::json to_json(const std::vector<ExportedKeyframes>& tracks);

} // namespace newton_physics
