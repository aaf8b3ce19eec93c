#pragma once

#include <optional>
#include <string>

namespace sqlorm {

/**
 * @brief Error categories surfaced to callers of database operations
 *
 * Filter and value compilation never produces an error; malformed input
 * degrades to NULL or a best-effort predicate instead.
 */
enum class ErrorCategory {
    NONE,
    POOL_UNAVAILABLE,   // no pool, pool drained, or health check failed
    ACQUIRE_TIMEOUT,    // bounded wait for a connection elapsed (retryable)
    DRIVER_ERROR,       // statement rejected or failed by the driver
    DECODE_ERROR,       // row value could not be converted into a document
    ROW_NOT_FOUND
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::POOL_UNAVAILABLE: return "pool_unavailable";
        case ErrorCategory::ACQUIRE_TIMEOUT: return "acquire_timeout";
        case ErrorCategory::DRIVER_ERROR: return "driver_error";
        case ErrorCategory::DECODE_ERROR: return "decode_error";
        case ErrorCategory::ROW_NOT_FOUND: return "row_not_found";
        default: return "unknown";
    }
}

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

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Carry the error of another result into this result type
     */
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace sqlorm
