/// @file keyframe_export.hpp
/// @brief Baking simulated transforms into animation keyframes

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace newton_physics {

// =============================================================================
// Export Options
// =============================================================================

/// Layer transform channel driven by a body
enum class KeyframeProperty : std::uint8_t {
    Position,       ///< transform.position, Vec2
    Rotation,       ///< transform.rotation.z, degrees
};

/// Get property path ("transform.position", "transform.rotation.z")
[[nodiscard]] const char* to_string(KeyframeProperty property);

enum class KeyframeInterpolation : std::uint8_t {
    Linear,
    Bezier,
};

/// Get interpolation name ("linear", "bezier")
[[nodiscard]] const char* to_string(KeyframeInterpolation interpolation);

struct KeyframeExportOptions {
    int start_frame = 0;
    int end_frame = 0;                          ///< Inclusive
    int frame_step = 1;
    std::vector<KeyframeProperty> properties{KeyframeProperty::Position, KeyframeProperty::Rotation};
    KeyframeInterpolation interpolation = KeyframeInterpolation::Linear;
    bool simplify = false;
    float simplify_tolerance = 0.5f;

    /// Range must be non-negative and ordered, step at least 1
    [[nodiscard]] newton_core::Result<void> validate() const;
};

// =============================================================================
// Exported Keyframes
// =============================================================================

using KeyframeValue = std::variant<float, newton_math::Vec2>;

struct ExportedKeyframe {
    int frame = 0;
    KeyframeValue value = 0.0f;
    KeyframeInterpolation interpolation = KeyframeInterpolation::Linear;
};

/// One animated property of one layer
struct ExportedKeyframes {
    std::string layer_id;
    std::string property;
    std::vector<ExportedKeyframe> keyframes;
};

/// Drop samples that the neighbouring kept samples already describe
///
/// Walks the series keeping the first and last samples. A vector sample is
/// kept when its distance to the segment from the last kept sample to the
/// next sample exceeds `tolerance`; a scalar sample is kept when it differs
/// from the frame-weighted interpolation of those two samples by more than
/// `tolerance`.
[[nodiscard]] std::vector<ExportedKeyframe> simplify_keyframes(const std::vector<ExportedKeyframe>& keyframes,
                                                               float tolerance);

} // namespace newton_physics
