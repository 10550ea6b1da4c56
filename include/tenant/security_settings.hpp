#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace secplane {

/**
 * @brief Organization-level security policy
 *
 * Defaults apply to organizations without a stored row and whenever
 * the row cannot be loaded.
 */
struct OrgSecuritySettings {
    std::string organization_id;

    bool enforce_mfa = false;
    bool threat_detection_enabled = true;
    int threat_score_threshold = 75;
    int failed_login_threshold = 5;

    bool audit_logging_enabled = true;
    int audit_retention_days = 365;

    bool ip_allowlist_enabled = false;
    std::vector<std::string> allowed_addresses;     // Exact addresses or CIDR ranges
    bool allow_loopback = true;

    int password_min_length = 12;
    int session_timeout_minutes = 1440;
};

/// Identity-side counts the control plane does not own
struct UserSecuritySummary {
    uint64_t total_users = 0;
    uint64_t mfa_enabled_users = 0;
    uint64_t active_sessions = 0;
    uint64_t stale_sessions = 0;    // Subset of active_sessions older than the stale threshold
};

} // namespace secplane
