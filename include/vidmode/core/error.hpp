#pragma once

/// @file error.hpp
/// @brief Error handling types for vidmode_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace vidmode_core {

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
    NotSupported,
    Busy,
    PlatformError,
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
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::Busy: return "Busy";
        case ErrorCode::PlatformError: return "PlatformError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Device and mode discovery errors
struct DiscoveryError {
    enum class Kind : std::uint8_t {
        EnumerationFailed,  // Online device list could not be read
        NoDesktopMode,      // Device has no usable current mode
    };

    Kind kind;
    std::string message;
    std::string operation;   // Platform call that failed
    std::string status;      // Platform status name
    std::uint32_t device = 0;

    /// Factory methods
    [[nodiscard]] static DiscoveryError enumeration_failed(const std::string& op, const std::string& status_name) {
        return DiscoveryError{Kind::EnumerationFailed, op + ": " + status_name, op, status_name, 0};
    }

    [[nodiscard]] static DiscoveryError no_desktop_mode(std::uint32_t device_id) {
        return DiscoveryError{Kind::NoDesktopMode,
            "Display " + std::to_string(device_id) + " has no usable desktop mode", {}, {}, device_id};
    }
};

/// Exclusive capture errors
struct CaptureError {
    enum class Kind : std::uint8_t {
        CaptureFailed,  // Platform refused the capture request
    };

    Kind kind;
    std::string message;
    std::string operation;
    std::string status;
    std::uint32_t device = 0;

    [[nodiscard]] static CaptureError capture_failed(const std::string& op, const std::string& status_name,
                                                     std::uint32_t device_id) {
        return CaptureError{Kind::CaptureFailed, op + ": " + status_name, op, status_name, device_id};
    }
};

/// Mode application errors
struct ApplyError {
    enum class Kind : std::uint8_t {
        ApplyFailed,   // Every candidate was rejected by the platform
        NoCandidates,  // Mode holds no native descriptor to apply
    };

    Kind kind;
    std::string message;
    std::string operation;
    std::string status;
    std::uint32_t device = 0;

    [[nodiscard]] static ApplyError apply_failed(const std::string& op, const std::string& status_name,
                                                 std::uint32_t device_id) {
        return ApplyError{Kind::ApplyFailed, op + ": " + status_name, op, status_name, device_id};
    }

    [[nodiscard]] static ApplyError no_candidates(const std::string& mode, std::uint32_t device_id) {
        return ApplyError{Kind::NoCandidates, "Mode " + mode + " has no native candidates", {}, {}, device_id};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,  // Config file missing
        ParseFailed,   // Config file malformed
        InvalidValue,  // Value out of range or wrong type
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Failed to parse " + path + ": " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key_name, const std::string& value) {
        return ConfigError{Kind::InvalidValue, "Invalid value for " + key_name + ": " + value, key_name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        DiscoveryError,
        CaptureError,
        ApplyError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(DiscoveryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(CaptureError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ApplyError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(DiscoveryError::Kind kind) {
        switch (kind) {
            case DiscoveryError::Kind::EnumerationFailed: return ErrorCode::PlatformError;
            case DiscoveryError::Kind::NoDesktopMode: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(CaptureError::Kind kind) {
        switch (kind) {
            case CaptureError::Kind::CaptureFailed: return ErrorCode::Busy;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ApplyError::Kind kind) {
        switch (kind) {
            case ApplyError::Kind::ApplyFailed: return ErrorCode::PlatformError;
            case ApplyError::Kind::NoCandidates: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
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

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

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

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

// =============================================================================
// Last Error Slot
// =============================================================================

/// Process-wide "last error" slot.
///
/// Every failing boundary call in discovery and switching stores its error
/// here before returning. Callers read it immediately after a failed call;
/// the next failure overwrites it. Successful calls leave it untouched.
void set_last_error(const Error& error);

/// Get the last recorded error message (empty if none)
[[nodiscard]] std::string last_error();

/// Get the last recorded error (nullopt if none)
[[nodiscard]] std::optional<Error> last_error_value();

/// Clear the last error slot
void clear_last_error();

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of capture errors
std::uint64_t capture_error_count();

/// Get count of apply errors
std::uint64_t apply_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace vidmode_core
