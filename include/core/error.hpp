#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <utility>

namespace sqlpool {

/**
 * @brief Error categories for the pool and its connections
 */
enum class ErrorCategory {
    NONE,
    POOL_EXHAUSTED,             // No connection became available within connect timeout
    COLLATION_WITHOUT_CHARSET,  // Collation configured without a charset
    CONNECTION_NOT_IN_POOL,     // Connection destroyed or never pooled
    REQUEST_TIMEOUT,            // Operation exceeded the per-request deadline
    DRIVER_ERROR,               // Reported by the server or client library (carries a code)
    END_OF_STREAM,              // Result set exhausted (expected during iteration)
    INTERNAL_ERROR              // Any other non-driver failure
};

[[nodiscard]] constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                      return "none";
        case ErrorCategory::POOL_EXHAUSTED:            return "pool_exhausted";
        case ErrorCategory::COLLATION_WITHOUT_CHARSET: return "collation_without_charset";
        case ErrorCategory::CONNECTION_NOT_IN_POOL:    return "connection_not_in_pool";
        case ErrorCategory::REQUEST_TIMEOUT:           return "request_timeout";
        case ErrorCategory::DRIVER_ERROR:              return "driver_error";
        case ErrorCategory::END_OF_STREAM:             return "end_of_stream";
        case ErrorCategory::INTERNAL_ERROR:            return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Error value propagated unchanged from the failing call to the caller
 *
 * `code` is the numeric driver code (mysql_errno) and is only meaningful
 * for DRIVER_ERROR.
 */
struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    uint32_t code = 0;
    std::string message;

    static Error driver(uint32_t code, std::string message) {
        return Error{ErrorCategory::DRIVER_ERROR, code, std::move(message)};
    }

    static Error end_of_stream() {
        return Error{ErrorCategory::END_OF_STREAM, 0, "end of stream"};
    }

    [[nodiscard]] std::string to_string() const {
        if (category == ErrorCategory::DRIVER_ERROR) {
            return std::format("Error {}: {}", code, message);
        }
        return std::format("{}: {}", error_category_to_string(category), message);
    }

    bool operator==(const Error&) const = default;
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message, uint32_t code = 0) {
        return error(Error{category, code, std::move(message)});
    }

    static Result error(Error err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& error() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }
    uint32_t error_code() const { return error_.code; }

private:
    bool success_ = false;
    std::optional<T> value_;
    Error error_;
};

/**
 * @brief Result of an operation with no value
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCategory category, std::string message, uint32_t code = 0) {
        return error(Error{category, code, std::move(message)});
    }

    static Result error(Error err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const Error& error() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }
    uint32_t error_code() const { return error_.code; }

private:
    bool success_ = false;
    Error error_;
};

using Status = Result<void>;

} // namespace sqlpool
