#pragma once

/// @file constants.hpp
/// @brief Mathematical constants for newton_math

namespace newton_math {

/// Mathematical constants
namespace consts {

/// Pi (π)
inline constexpr float PI = 3.14159265358979323846f;

/// Half Pi (π/2)
inline constexpr float FRAC_PI_2 = 1.57079632679489661923f;

/// Square root of two
inline constexpr float SQRT_2 = 1.41421356237309504880f;

/// Degrees to radians conversion factor
inline constexpr float DEG_TO_RAD = PI / 180.0f;

/// Radians to degrees conversion factor
inline constexpr float RAD_TO_DEG = 180.0f / PI;

/// Small epsilon for floating point comparisons
inline constexpr float EPSILON = 1e-6f;

} // namespace consts

} // namespace newton_math
