/// @file keyframe_export.cpp
/// @brief Keyframe export options and series simplification

#include <newton/physics/keyframe_export.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace newton_physics {

using newton_core::SimulationError;
using newton_math::Vec2;

const char* to_string(KeyframeProperty property) {
    switch (property) {
        case KeyframeProperty::Position: return "transform.position";
        case KeyframeProperty::Rotation: return "transform.rotation.z";
    }
    return "unknown";
}

const char* to_string(KeyframeInterpolation interpolation) {
    switch (interpolation) {
        case KeyframeInterpolation::Linear: return "linear";
        case KeyframeInterpolation::Bezier: return "bezier";
    }
    return "unknown";
}

newton_core::Result<void> KeyframeExportOptions::validate() const {
    if (start_frame < 0) {
        return newton_core::Err(SimulationError::invalid_frame(start_frame));
    }
    if (end_frame < start_frame) {
        return newton_core::Err(SimulationError::invalid_config(
            "export range ends before it starts (" + std::to_string(start_frame) + ".." +
            std::to_string(end_frame) + ")"));
    }
    if (frame_step < 1) {
        return newton_core::Err(SimulationError::invalid_config("frame step must be at least 1"));
    }
    if (end_frame > std::numeric_limits<int>::max() - frame_step) {
        return newton_core::Err(SimulationError::invalid_frame(end_frame));
    }
    if (simplify_tolerance < 0.0f) {
        return newton_core::Err(SimulationError::invalid_config("simplify tolerance must not be negative"));
    }
    return newton_core::Ok();
}

namespace {

float distance_to_segment(const Vec2& point, const Vec2& start, const Vec2& end) {
    const Vec2 segment = end - start;
    const float length_sq = newton_math::length_squared(segment);
    const float t = std::clamp(newton_math::dot(point - start, segment) / length_sq, 0.0f, 1.0f);
    return newton_math::distance(point, start + segment * t);
}

bool deviates(const ExportedKeyframe& kept, const ExportedKeyframe& current, const ExportedKeyframe& next,
              float tolerance) {
    if (const auto* c = std::get_if<Vec2>(&current.value)) {
        const auto* p = std::get_if<Vec2>(&kept.value);
        const auto* n = std::get_if<Vec2>(&next.value);
        if (!p || !n) {
            return true;
        }
        // Degenerate segment: measure against the kept point itself
        if (newton_math::length_squared(*n - *p) <= 0.0f) {
            return newton_math::distance(*c, *p) > tolerance;
        }
        return distance_to_segment(*c, *p, *n) > tolerance;
    }

    const auto* p = std::get_if<float>(&kept.value);
    const auto* n = std::get_if<float>(&next.value);
    if (!p || !n) {
        return true;
    }
    const int span = next.frame - kept.frame;
    const float t = span > 0 ? static_cast<float>(current.frame - kept.frame) / static_cast<float>(span) : 0.0f;
    const float expected = *p + (*n - *p) * t;
    return std::abs(std::get<float>(current.value) - expected) > tolerance;
}

} // anonymous namespace

std::vector<ExportedKeyframe> simplify_keyframes(const std::vector<ExportedKeyframe>& keyframes, float tolerance) {
    if (keyframes.size() <= 2) {
        return keyframes;
    }

    std::vector<ExportedKeyframe> simplified;
    simplified.push_back(keyframes.front());
    std::size_t last_kept = 0;

    for (std::size_t i = 1; i + 1 < keyframes.size(); ++i) {
        if (deviates(keyframes[last_kept], keyframes[i], keyframes[i + 1], tolerance)) {
            simplified.push_back(keyframes[i]);
            last_kept = i;
        }
    }

    simplified.push_back(keyframes.back());
    return simplified;
}

} // namespace newton_physics
