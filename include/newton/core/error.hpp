#pragma once

/// @file error.hpp
/// @brief Error handling types for newton_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <stdexcept>

namespace newton_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    ParseError,
    ValidationError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Simulation setup and lifecycle errors
struct SimulationError {
    enum class Kind : std::uint8_t {
        Disposed,           // Engine used after dispose()
        DuplicateId,        // Entity id already present
        UnknownEntity,      // Referenced entity does not exist
        MissingParentBone,  // Ragdoll bone names a parent that is not in the config
        UnknownPreset,      // Named preset does not exist
        InvalidFrame,       // Frame index outside the simulated range
        InvalidConfig,      // Configuration value out of range
    };

    Kind kind;
    std::string message;
    std::string entity_id;

    [[nodiscard]] static SimulationError disposed() {
        return SimulationError{Kind::Disposed, "Physics engine has been disposed", {}};
    }

    [[nodiscard]] static SimulationError duplicate_id(const std::string& id) {
        return SimulationError{Kind::DuplicateId, "Entity already exists: " + id, id};
    }

    [[nodiscard]] static SimulationError unknown_entity(const std::string& id) {
        return SimulationError{Kind::UnknownEntity, "Unknown entity: " + id, id};
    }

    [[nodiscard]] static SimulationError missing_parent_bone(const std::string& bone, const std::string& parent) {
        return SimulationError{Kind::MissingParentBone,
            "Parent bone '" + parent + "' of bone '" + bone + "' not found", bone};
    }

    [[nodiscard]] static SimulationError unknown_preset(const std::string& name) {
        return SimulationError{Kind::UnknownPreset, "Unknown preset: " + name, name};
    }

    [[nodiscard]] static SimulationError invalid_frame(int frame) {
        return SimulationError{Kind::InvalidFrame, "Invalid frame: " + std::to_string(frame), {}};
    }

    [[nodiscard]] static SimulationError invalid_config(const std::string& reason) {
        return SimulationError{Kind::InvalidConfig, "Invalid configuration: " + reason, {}};
    }

    [[nodiscard]] static SimulationError invalid_config(const std::string& id, const std::string& reason) {
        return SimulationError{Kind::InvalidConfig, "'" + id + "': " + reason, id};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        SimulationError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(SimulationError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

private:
    static ErrorCode to_error_code(SimulationError::Kind kind) {
        switch (kind) {
            case SimulationError::Kind::Disposed: return ErrorCode::InvalidState;
            case SimulationError::Kind::DuplicateId: return ErrorCode::AlreadyExists;
            case SimulationError::Kind::UnknownEntity: return ErrorCode::NotFound;
            case SimulationError::Kind::MissingParentBone: return ErrorCode::ValidationError;
            case SimulationError::Kind::UnknownPreset: return ErrorCode::NotFound;
            case SimulationError::Kind::InvalidFrame: return ErrorCode::InvalidArgument;
            case SimulationError::Kind::InvalidConfig: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return std::move(*m_value);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with its code and entity
std::string build_error_chain(const Error& error);

/// Get simulation error kind name
[[nodiscard]] const char* simulation_error_kind_name(SimulationError::Kind kind);

} // namespace newton_core
