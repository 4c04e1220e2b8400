#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for newton_math types

#include <glm/fwd.hpp>

namespace newton_math {

// =============================================================================
// Vector Types (GLM aliases)
// =============================================================================
using Vec2 = glm::vec2;

} // namespace newton_math
