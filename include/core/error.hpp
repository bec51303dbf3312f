#pragma once

#include <optional>
#include <string>
#include <utility>

namespace tracestore {

/**
 * @brief Error categories surfaced by the read path
 */
enum class ErrorCategory {
    NONE,
    INVALID_REQUEST,
    STORAGE_ERROR,
    CANCELLED,
    INTERNAL_ERROR
};

inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:            return "none";
        case ErrorCategory::INVALID_REQUEST: return "invalid_request";
        case ErrorCategory::STORAGE_ERROR:   return "storage_error";
        case ErrorCategory::CANCELLED:       return "cancelled";
        case ErrorCategory::INTERNAL_ERROR:  return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 *
 * An error may still carry a value: batch operations report whatever they
 * materialized before the failure (see partial()). error_message() holds the
 * underlying message verbatim; context() names the operation and its inputs.
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

    static Result error(ErrorCategory category, std::string message, std::string context = {}) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        r.context_ = std::move(context);
        return r;
    }

    static Result partial(T value, ErrorCategory category, std::string message,
                          std::string context = {}) {
        Result r = error(category, std::move(message), std::move(context));
        r.value_ = std::move(value);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }
    bool has_value() const { return value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }
    const std::string& context() const { return context_; }

    /// "context: message" (or just the message when no context was recorded)
    std::string describe() const {
        if (context_.empty()) return error_message_;
        return context_ + ": " + error_message_;
    }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
    std::string context_;
};

} // namespace tracestore
