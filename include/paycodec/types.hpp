#pragma once

#include <optional>
#include <string>
#include <utility>

namespace paycodec {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Data ends before a declared structure is complete
    TRUNCATED,
    // Tag or field id absent from the registry
    UNKNOWN_IDENTIFIER,
    // Input is not in the expected representation
    MALFORMED_INPUT,
    // Request is well formed but not supported (indefinite length, constructed edit)
    UNSUPPORTED_OPERATION,
    // Path or key does not resolve
    NOT_FOUND,
    // Tag length cap, long-form length cap, nesting depth or field maximum
    LIMIT_EXCEEDED,
};

// Canonical lowercase snake_case key for an error code
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::TRUNCATED: return "truncated";
        case ErrorCode::UNKNOWN_IDENTIFIER: return "unknown_identifier";
        case ErrorCode::MALFORMED_INPUT: return "malformed_input";
        case ErrorCode::UNSUPPORTED_OPERATION: return "unsupported_operation";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::LIMIT_EXCEEDED: return "limit_exceeded";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

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
 * @brief Result type for fallible write operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Decoders never fail as a whole and report through their own result
 * structs; operations that produce new data (encode, edit) return a
 * Result and never hand back partial output.
 * Check isOk() before accessing value(), or isErr() before error().
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

} // namespace paycodec
