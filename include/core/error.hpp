#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace pgsession {

/**
 * @brief Failure categories of a development session
 *
 * Fatal categories abort session startup. PROCESS_EXITED_UNEXPECTEDLY,
 * ENGINE_EXECUTION_ERROR and SEED_FAILURE are reported where they are
 * detected and never unwind the session.
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    INITIALIZATION_FAILURE,
    PROCESS_START_FAILURE,
    PROCESS_EXITED_UNEXPECTEDLY,
    READINESS_TIMEOUT,
    GATEWAY_BIND_FAILURE,
    ENGINE_EXECUTION_ERROR,
    SEED_FAILURE
};

[[nodiscard]] constexpr const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                        return "None";
        case ErrorCategory::CONFIG_ERROR:                return "ConfigError";
        case ErrorCategory::INITIALIZATION_FAILURE:      return "InitializationFailure";
        case ErrorCategory::PROCESS_START_FAILURE:       return "ProcessStartFailure";
        case ErrorCategory::PROCESS_EXITED_UNEXPECTEDLY: return "ProcessExitedUnexpectedly";
        case ErrorCategory::READINESS_TIMEOUT:           return "ReadinessTimeout";
        case ErrorCategory::GATEWAY_BIND_FAILURE:        return "GatewayBindFailure";
        case ErrorCategory::ENGINE_EXECUTION_ERROR:      return "EngineExecutionError";
        case ErrorCategory::SEED_FAILURE:                return "SeedFailure";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_fatal(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CONFIG_ERROR:
        case ErrorCategory::INITIALIZATION_FAILURE:
        case ErrorCategory::PROCESS_START_FAILURE:
        case ErrorCategory::READINESS_TIMEOUT:
        case ErrorCategory::GATEWAY_BIND_FAILURE:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Exception raised for session failures
 *
 * The optional code carries a SQLSTATE when the failure originated in a
 * database engine that reported one.
 */
class SessionError : public std::runtime_error {
public:
    SessionError(ErrorCategory category, const std::string& message,
                 std::optional<std::string> code = std::nullopt)
        : std::runtime_error(message),
          category_(category),
          code_(std::move(code)) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }
    [[nodiscard]] const std::optional<std::string>& code() const { return code_; }

private:
    ErrorCategory category_;
    std::optional<std::string> code_;
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

} // namespace pgsession
