#pragma once

/**
 * @file result.hpp
 * @brief Error handling types shared by every unbox module
 *
 * Fallible operations return Result<T>. Callers check isOk() before
 * value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto files = unbox::list_files_recursive("/work/project");
 * if (files.isErr()) {
 *     std::cerr << files.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace unbox {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error codes for unbox operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    IO_ERROR,

    // Source resolution and transport
    INVALID_SOURCE,
    SOURCE_NOT_FOUND,
    CONNECTIVITY_ERROR,
    INTEGRITY_MISMATCH,

    // Box configuration
    CONFIG_PARSE_ERROR,
    CONFIG_MISMATCH,
    PATH_TRAVERSAL,

    // Interaction
    PROMPT_ABORTED,
    INVALID_CHOICE,

    // Hooks
    HOOK_FAILED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::INVALID_SOURCE: return "INVALID_SOURCE";
        case ErrorCode::SOURCE_NOT_FOUND: return "SOURCE_NOT_FOUND";
        case ErrorCode::CONNECTIVITY_ERROR: return "CONNECTIVITY_ERROR";
        case ErrorCode::INTEGRITY_MISMATCH: return "INTEGRITY_MISMATCH";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISMATCH: return "CONFIG_MISMATCH";
        case ErrorCode::PATH_TRAVERSAL: return "PATH_TRAVERSAL";
        case ErrorCode::PROMPT_ABORTED: return "PROMPT_ABORTED";
        case ErrorCode::INVALID_CHOICE: return "INVALID_CHOICE";
        case ErrorCode::HOOK_FAILED: return "HOOK_FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace unbox
