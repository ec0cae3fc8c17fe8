#pragma once

/// @file error.hpp
/// @brief Error handling types for forge_core

#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace forge_core {

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
    IOError,
    ParseError,
    ValidationError,
    CryptoError,
    PermissionDenied,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::CryptoError: return "CryptoError";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Release pipeline errors
struct ReleaseError {
    enum class Kind : std::uint8_t {
        InvalidName,       // Addon name has a forbidden character
        LocationNotFound,  // Addon not present in any first-class location
        KeyReadFailure,    // Persisted private key exists but cannot be read
        PackingFailure,    // Packer failed for one addon
        SigningFailure,    // Signer failed for one archive
        IoFailure,         // Directory creation or file copy failed
        ConfigError,       // Project file missing or malformed
    };

    Kind kind;
    std::string message;
    std::string subject;  // Addon name, key name or path the error is about

    [[nodiscard]] static ReleaseError invalid_name(const std::string& name) {
        return ReleaseError{Kind::InvalidName, "Invalid addon name: " + name, name};
    }

    [[nodiscard]] static ReleaseError location_not_found(const std::string& name) {
        return ReleaseError{Kind::LocationNotFound, "Addon not found in any location: " + name, name};
    }

    [[nodiscard]] static ReleaseError key_read_failure(const std::string& path, const std::string& reason) {
        return ReleaseError{Kind::KeyReadFailure,
            "Failed to read private key '" + path + "': " + reason, path};
    }

    [[nodiscard]] static ReleaseError packing_failure(const std::string& addon, const std::string& reason) {
        return ReleaseError{Kind::PackingFailure, "Packing '" + addon + "' failed: " + reason, addon};
    }

    [[nodiscard]] static ReleaseError signing_failure(const std::string& archive, const std::string& reason) {
        return ReleaseError{Kind::SigningFailure, "Signing '" + archive + "' failed: " + reason, archive};
    }

    [[nodiscard]] static ReleaseError io_failure(const std::string& path, const std::string& reason) {
        return ReleaseError{Kind::IoFailure, "IO failure on '" + path + "': " + reason, path};
    }

    [[nodiscard]] static ReleaseError config_error(const std::string& path, const std::string& reason) {
        return ReleaseError{Kind::ConfigError, "Project config '" + path + "': " + reason, path};
    }
};

/// Get release error kind name
[[nodiscard]] inline const char* release_error_kind_name(ReleaseError::Kind kind) {
    switch (kind) {
        case ReleaseError::Kind::InvalidName: return "InvalidName";
        case ReleaseError::Kind::LocationNotFound: return "LocationNotFound";
        case ReleaseError::Kind::KeyReadFailure: return "KeyReadFailure";
        case ReleaseError::Kind::PackingFailure: return "PackingFailure";
        case ReleaseError::Kind::SigningFailure: return "SigningFailure";
        case ReleaseError::Kind::IoFailure: return "IoFailure";
        case ReleaseError::Kind::ConfigError: return "ConfigError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ReleaseError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ReleaseError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

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

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Check for a specific release error kind
    [[nodiscard]] bool is_release_error(ReleaseError::Kind kind) const {
        const auto* err = as<ReleaseError>();
        return err != nullptr && err->kind == kind;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// Get all context values
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(ReleaseError::Kind kind) {
        switch (kind) {
            case ReleaseError::Kind::InvalidName: return ErrorCode::ValidationError;
            case ReleaseError::Kind::LocationNotFound: return ErrorCode::NotFound;
            case ReleaseError::Kind::KeyReadFailure: return ErrorCode::CryptoError;
            case ReleaseError::Kind::PackingFailure: return ErrorCode::InvalidState;
            case ReleaseError::Kind::SigningFailure: return ErrorCode::CryptoError;
            case ReleaseError::Kind::IoFailure: return ErrorCode::IOError;
            case ReleaseError::Kind::ConfigError: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

template<typename T, typename E = Error>
class Result;

/// Result type carrying either a value or an error
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

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

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
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
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

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

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
            throw std::runtime_error("Result contains error");
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

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace forge_core
