#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for newton_core module

#include <cstdint>

namespace newton_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct SimulationError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace newton_core
