#pragma once

#include <string>
#include <optional>

namespace tpccgw {

/**
 * @brief Error categories surfaced by the gateway
 *
 * Every failure that leaves a component is tagged with exactly one of these.
 */
enum class ErrorCategory {
    NONE,
    CONNECTIVITY,           // backend unreachable or connection dropped
    TRANSLATION,            // placeholder/parameter mismatch
    CONSTRAINT_VIOLATION,   // backend rejected a write (PK, NOT NULL, type)
    NOT_FOUND,              // required entity missing
    TRANSIENT,              // serialization failure / deadlock, retryable
    INVALID_INPUT,          // caller-supplied value rejected before execution
    EXECUTION_ERROR,        // any other backend failure
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::CONNECTIVITY: return "connectivity";
        case ErrorCategory::TRANSLATION: return "translation";
        case ErrorCategory::CONSTRAINT_VIOLATION: return "constraint_violation";
        case ErrorCategory::NOT_FOUND: return "not_found";
        case ErrorCategory::TRANSIENT: return "transient";
        case ErrorCategory::INVALID_INPUT: return "invalid_input";
        case ErrorCategory::EXECUTION_ERROR: return "execution_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
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

} // namespace tpccgw
