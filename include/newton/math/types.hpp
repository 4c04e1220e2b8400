#pragma once

/// @file types.hpp
/// @brief Core type definitions for newton_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"
#include "constants.hpp"

namespace newton_math {

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec2 {
    inline constexpr Vec2 ZERO  = Vec2(0.0f, 0.0f);
    inline constexpr Vec2 ONE   = Vec2(1.0f, 1.0f);
    inline constexpr Vec2 X     = Vec2(1.0f, 0.0f);
    inline constexpr Vec2 Y     = Vec2(0.0f, 1.0f);
    inline constexpr Vec2 NEG_X = Vec2(-1.0f, 0.0f);
    inline constexpr Vec2 NEG_Y = Vec2(0.0f, -1.0f);

    // Screen space: +Y points down
    inline constexpr Vec2 DOWN  = Y;
    inline constexpr Vec2 UP    = NEG_Y;
}

} // namespace newton_math
