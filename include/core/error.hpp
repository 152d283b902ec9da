#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace authguard {

/**
 * @brief Rejection categories for a validated request
 *
 * Every category except NONE is an ordinary auth failure and maps to an
 * "unauthorized" response at the transport layer.
 */
enum class ErrorCategory {
    NONE,
    MISSING_FIELD,
    MALFORMED,
    INVALID_REQUEST_SHAPE,
    INVALID_SIGNATURE,
    EXPIRED,
    NOT_YET_VALID,
    CLAIM_MISMATCH,
    INVALID_CREDENTIAL
};

[[nodiscard]] inline constexpr std::string_view to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                  return "none";
        case ErrorCategory::MISSING_FIELD:         return "missing_field";
        case ErrorCategory::MALFORMED:             return "malformed";
        case ErrorCategory::INVALID_REQUEST_SHAPE: return "invalid_request_shape";
        case ErrorCategory::INVALID_SIGNATURE:     return "invalid_signature";
        case ErrorCategory::EXPIRED:               return "expired";
        case ErrorCategory::NOT_YET_VALID:         return "not_yet_valid";
        case ErrorCategory::CLAIM_MISMATCH:        return "claim_mismatch";
        case ErrorCategory::INVALID_CREDENTIAL:    return "invalid_credential";
    }
    return "unknown";
}

struct AuthError {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;    // Human-readable, safe to embed in a 401 body
};

/**
 * @brief Misconfiguration or wiring fault (programmer error)
 *
 * Thrown when a mode is built from incomplete field templates or is asked to
 * validate a request shape it cannot handle. Never reported as "unauthorized".
 */
class ConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
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
        r.error_.category = category;
        r.error_.message = std::move(message);
        return r;
    }

    static Result error(AuthError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }
    const AuthError& failure() const { return error_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    AuthError error_;
};

/**
 * @brief Valueless outcome of a validation step
 */
class Status {
public:
    static Status ok() {
        Status s;
        s.success_ = true;
        return s;
    }

    static Status error(ErrorCategory category, std::string message) {
        Status s;
        s.error_.category = category;
        s.error_.message = std::move(message);
        return s;
    }

    static Status error(AuthError err) {
        Status s;
        s.error_ = std::move(err);
        return s;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }
    const AuthError& failure() const { return error_; }

private:
    bool success_ = false;
    AuthError error_;
};

} // namespace authguard
