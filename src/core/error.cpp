/// @file error.cpp
/// @brief Error handling implementation for newton_core
///
/// The error system is primarily template-based and header-only.
/// This file provides error formatting and the explicit instantiations
/// of the Result types used across the simulation modules.

#include <newton/core/error.hpp>
#include <sstream>

namespace newton_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

const char* simulation_error_kind_name(SimulationError::Kind kind) {
    switch (kind) {
        case SimulationError::Kind::Disposed: return "Disposed";
        case SimulationError::Kind::DuplicateId: return "DuplicateId";
        case SimulationError::Kind::UnknownEntity: return "UnknownEntity";
        case SimulationError::Kind::MissingParentBone: return "MissingParentBone";
        case SimulationError::Kind::UnknownPreset: return "UnknownPreset";
        case SimulationError::Kind::InvalidFrame: return "InvalidFrame";
        case SimulationError::Kind::InvalidConfig: return "InvalidConfig";
        default: return "Unknown";
    }
}

namespace detail {

/// Format simulation error with entity context
std::string format_simulation_error(const SimulationError& err) {
    std::ostringstream oss;
    oss << "[SimulationError:" << simulation_error_kind_name(err.kind) << "] " << err.message;

    if (!err.entity_id.empty()) {
        oss << " (entity: " << err.entity_id << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with its code and entity
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, SimulationError>) {
            oss << detail::format_simulation_error(err);
        }
    }, error.variant());

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;

} // namespace newton_core
