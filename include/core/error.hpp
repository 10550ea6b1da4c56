#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace secplane {

/**
 * @brief Error categories surfaced by the control plane
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,         // Malformed input, rejected before any side effect
    DECRYPTION_FAILURE,       // Tampered ciphertext, bad tag or unknown key
    NOT_ENCRYPTED,            // Value is not an encrypted envelope
    PERSISTENCE_UNAVAILABLE,  // Storage outage or bounded call timed out
    AUTHENTICATION_FAILURE,   // Bad MFA or backup code
    AUTHORIZATION_FAILURE,    // Cross-tenant access attempt
    NOT_FOUND,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                    return "none";
        case ErrorCategory::VALIDATION_ERROR:        return "validation_error";
        case ErrorCategory::DECRYPTION_FAILURE:      return "decryption_failure";
        case ErrorCategory::NOT_ENCRYPTED:           return "not_encrypted";
        case ErrorCategory::PERSISTENCE_UNAVAILABLE: return "persistence_unavailable";
        case ErrorCategory::AUTHENTICATION_FAILURE:  return "authentication_failure";
        case ErrorCategory::AUTHORIZATION_FAILURE:   return "authorization_failure";
        case ErrorCategory::NOT_FOUND:               return "not_found";
        case ErrorCategory::INTERNAL_ERROR:          return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Exception carrying an ErrorCategory
 *
 * Thrown by the crypto layer (fail closed) and by store implementations.
 * Services convert it into a Result at their public boundary.
 */
class SecurityError : public std::runtime_error {
public:
    SecurityError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
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

    static Result from_exception(const SecurityError& e) {
        return error(e.category(), e.what());
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

    static Result from_exception(const SecurityError& e) {
        return error(e.category(), e.what());
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

} // namespace secplane
