#pragma once

#include <string>
#include <optional>

namespace litesync {

/**
 * @brief Error categories for the coordinator
 *
 * POOL_EXHAUSTED and REPLICA_UNAVAILABLE are transient; POOL_CLOSED means
 * the coordinator is shutting down. Write-rate excess is not an error.
 */
enum class ErrorCategory {
    NONE,
    POOL_EXHAUSTED,
    POOL_CLOSED,
    REPLICA_UNAVAILABLE,
    BACKUP_FAILED,
    STORE_ERROR,
    INVALID_RECORD,
    CONFIG_ERROR
};

inline constexpr const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::POOL_EXHAUSTED:      return "pool_exhausted";
        case ErrorCategory::POOL_CLOSED:         return "pool_closed";
        case ErrorCategory::REPLICA_UNAVAILABLE: return "replica_unavailable";
        case ErrorCategory::BACKUP_FAILED:       return "backup_failed";
        case ErrorCategory::STORE_ERROR:         return "store_error";
        case ErrorCategory::INVALID_RECORD:      return "invalid_record";
        case ErrorCategory::CONFIG_ERROR:        return "config_error";
    }
    return "unknown";
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

/**
 * @brief Result for operations with no value
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
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

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace litesync
