#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace secplane {

using TimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Severity
// ============================================================================

enum class Severity : uint8_t {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

inline const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW:      return "LOW";
        case Severity::MEDIUM:   return "MEDIUM";
        case Severity::HIGH:     return "HIGH";
        case Severity::CRITICAL: return "CRITICAL";
    }
    return "LOW";
}

inline std::optional<Severity> severity_from_string(std::string_view s) {
    if (s == "LOW") return Severity::LOW;
    if (s == "MEDIUM") return Severity::MEDIUM;
    if (s == "HIGH") return Severity::HIGH;
    if (s == "CRITICAL") return Severity::CRITICAL;
    return std::nullopt;
}

// ============================================================================
// Audit Event Types
// ============================================================================

enum class AuditEventType : uint8_t {
    // Authentication
    LOGIN,
    LOGOUT,
    LOGIN_FAILED,
    PASSWORD_CHANGED,
    PASSWORD_RESET,
    MFA_SETUP_STARTED,
    MFA_ENABLED,
    MFA_DISABLED,
    MFA_VERIFIED,
    MFA_FAILED,
    BACKUP_CODE_USED,
    MFA_BACKUP_CODES_REGENERATED,

    // Authorization
    ACCESS_DENIED,
    PERMISSION_GRANTED,
    PERMISSION_REVOKED,

    // Data
    DATA_CREATED,
    DATA_UPDATED,
    DATA_DELETED,
    DATA_VIEWED,
    DATA_EXPORTED,

    // Security
    SUSPICIOUS_ACTIVITY,
    IP_BLOCKED,
    IP_UNBLOCKED,
    ACCOUNT_LOCKED,
    ACCOUNT_UNLOCKED,
    TOKEN_EXPIRED,
    TOKEN_REVOKED,

    // Administration
    SETTINGS_CHANGED,
    RETENTION_CHANGED,
    USER_CREATED,
    USER_UPDATED,
    USER_DELETED,
    ROLE_CHANGED
};

namespace detail {

inline constexpr std::array<std::pair<AuditEventType, std::string_view>, 33> kEventTypeNames = {{
    {AuditEventType::LOGIN,                        "LOGIN"},
    {AuditEventType::LOGOUT,                       "LOGOUT"},
    {AuditEventType::LOGIN_FAILED,                 "LOGIN_FAILED"},
    {AuditEventType::PASSWORD_CHANGED,             "PASSWORD_CHANGED"},
    {AuditEventType::PASSWORD_RESET,               "PASSWORD_RESET"},
    {AuditEventType::MFA_SETUP_STARTED,            "MFA_SETUP_STARTED"},
    {AuditEventType::MFA_ENABLED,                  "MFA_ENABLED"},
    {AuditEventType::MFA_DISABLED,                 "MFA_DISABLED"},
    {AuditEventType::MFA_VERIFIED,                 "MFA_VERIFIED"},
    {AuditEventType::MFA_FAILED,                   "MFA_FAILED"},
    {AuditEventType::BACKUP_CODE_USED,             "BACKUP_CODE_USED"},
    {AuditEventType::MFA_BACKUP_CODES_REGENERATED, "MFA_BACKUP_CODES_REGENERATED"},
    {AuditEventType::ACCESS_DENIED,                "ACCESS_DENIED"},
    {AuditEventType::PERMISSION_GRANTED,           "PERMISSION_GRANTED"},
    {AuditEventType::PERMISSION_REVOKED,           "PERMISSION_REVOKED"},
    {AuditEventType::DATA_CREATED,                 "DATA_CREATED"},
    {AuditEventType::DATA_UPDATED,                 "DATA_UPDATED"},
    {AuditEventType::DATA_DELETED,                 "DATA_DELETED"},
    {AuditEventType::DATA_VIEWED,                  "DATA_VIEWED"},
    {AuditEventType::DATA_EXPORTED,                "DATA_EXPORTED"},
    {AuditEventType::SUSPICIOUS_ACTIVITY,          "SUSPICIOUS_ACTIVITY"},
    {AuditEventType::IP_BLOCKED,                   "IP_BLOCKED"},
    {AuditEventType::IP_UNBLOCKED,                 "IP_UNBLOCKED"},
    {AuditEventType::ACCOUNT_LOCKED,               "ACCOUNT_LOCKED"},
    {AuditEventType::ACCOUNT_UNLOCKED,             "ACCOUNT_UNLOCKED"},
    {AuditEventType::TOKEN_EXPIRED,                "TOKEN_EXPIRED"},
    {AuditEventType::TOKEN_REVOKED,                "TOKEN_REVOKED"},
    {AuditEventType::SETTINGS_CHANGED,             "SETTINGS_CHANGED"},
    {AuditEventType::RETENTION_CHANGED,            "RETENTION_CHANGED"},
    {AuditEventType::USER_CREATED,                 "USER_CREATED"},
    {AuditEventType::USER_UPDATED,                 "USER_UPDATED"},
    {AuditEventType::USER_DELETED,                 "USER_DELETED"},
    {AuditEventType::ROLE_CHANGED,                 "ROLE_CHANGED"},
}};

} // namespace detail

inline const char* event_type_to_string(AuditEventType type) {
    for (const auto& [t, name] : detail::kEventTypeNames) {
        if (t == type) return name.data();
    }
    return "UNKNOWN";
}

inline std::optional<AuditEventType> event_type_from_string(std::string_view s) {
    for (const auto& [t, name] : detail::kEventTypeNames) {
        if (name == s) return t;
    }
    return std::nullopt;
}

// ============================================================================
// Request Context (supplied by the surrounding request pipeline)
// ============================================================================

struct RequestContext {
    std::string user_id;                // Empty for unauthenticated callers
    std::string organization_id;
    std::string source_address;
    std::string user_agent;
    std::unordered_map<std::string, std::string> headers;  // Lowercased names
    std::string path;
    std::string query;
    std::string body;
    bool failed_authentication = false; // This request is a failed login

    /// Key for the activity window: the user id, or the address when anonymous
    [[nodiscard]] std::string identity() const {
        return user_id.empty() ? "anon:" + source_address : user_id;
    }

    [[nodiscard]] bool has_header(const std::string& lowercase_name) const {
        return headers.contains(lowercase_name);
    }
};

// ============================================================================
// Caller (authenticated identity for administrative and read operations)
// ============================================================================

struct Caller {
    std::string user_id;
    std::string organization_id;        // Tenant boundary for every read
    std::string source_address;
};

// ============================================================================
// Threat Decision
// ============================================================================

inline constexpr int kMaxDisplayScore = 100;

struct Decision {
    bool allow = true;
    int score = 0;                      // Raw additive score, may exceed 100
    std::vector<std::string> reasons;   // Internal only, never sent to the client
    std::string client_message;         // Generic text safe to return to the caller
    bool fail_open = false;             // Scoring errored and the request was let through

    [[nodiscard]] int display_score() const {
        return std::min(score, kMaxDisplayScore);
    }
};

} // namespace secplane
