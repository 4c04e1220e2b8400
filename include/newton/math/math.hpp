#pragma once

/// @file math.hpp
/// @brief Main include header for newton_math

#include "fwd.hpp"
#include "constants.hpp"
#include "types.hpp"
#include "vec.hpp"
