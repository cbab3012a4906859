#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for fsmon
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Registration-time failures are returned to the caller through this type;
 * steady-state failures are logged and never reach the caller.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace fsmon {

/**
 * @brief Error codes for fsmon operations
 */
enum class ErrorCode {
    Success = 0,

    // Pattern errors (100-199)
    InvalidPattern = 100,

    // Watch errors (200-299)
    WatchLimitExceeded = 200,
    WatchCreationFailed = 201,
    NotRunning = 202,
    MonitorDisabled = 203,

    // Path errors (300-399)
    FileNotFound = 300,
    NotADirectory = 301,
    NotASymlink = 302,
    CircularSymlink = 303,
    PermissionDenied = 304,

    // Configuration errors (600-699)
    ConfigError = 600,
    InvalidConfig = 601,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidPattern: return "Invalid pattern";
        case ErrorCode::WatchLimitExceeded: return "Watch limit exceeded";
        case ErrorCode::WatchCreationFailed: return "Watch creation failed";
        case ErrorCode::NotRunning: return "Monitor not running";
        case ErrorCode::MonitorDisabled: return "Monitor disabled";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::NotADirectory: return "Not a directory";
        case ErrorCode::NotASymlink: return "Not a symlink";
        case ErrorCode::CircularSymlink: return "Circular symlink";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * auto handle = monitor.register_listener(listener);
 * if (!handle) {
 *     FSMON_LOG_ERROR("App", handle.error().message);
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return !error_.has_value(); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return error_.has_value(); }

    /// Get error (throws if success)
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a success result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace fsmon
