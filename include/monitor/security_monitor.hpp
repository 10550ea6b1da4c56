#pragma once

#include "audit/audit_log_service.hpp"
#include "core/error.hpp"
#include "core/task_executor.hpp"
#include "core/types.hpp"
#include "db/isecurity_store.hpp"
#include "security/ip_denylist.hpp"
#include "tenant/settings_manager.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace secplane {

enum class Timeframe : uint8_t {
    DAY,
    WEEK,
    MONTH
};

inline const char* timeframe_to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::DAY:   return "day";
        case Timeframe::WEEK:  return "week";
        case Timeframe::MONTH: return "month";
    }
    return "day";
}

inline std::optional<Timeframe> timeframe_from_string(std::string_view s) {
    if (s == "day") return Timeframe::DAY;
    if (s == "week") return Timeframe::WEEK;
    if (s == "month") return Timeframe::MONTH;
    return std::nullopt;
}

inline std::chrono::hours timeframe_duration(Timeframe tf) {
    switch (tf) {
        case Timeframe::DAY:   return std::chrono::hours(24);
        case Timeframe::WEEK:  return std::chrono::hours(24 * 7);
        case Timeframe::MONTH: return std::chrono::hours(24 * 30);
    }
    return std::chrono::hours(24);
}

struct DailyCount {
    std::string date;       // YYYY-MM-DD (UTC)
    uint64_t count = 0;
};

struct IdentityCount {
    std::string identity;
    uint64_t count = 0;
};

struct Vulnerability {
    std::string type;
    Severity severity = Severity::LOW;
    std::string description;
    std::string recommendation;
};

struct SecurityDashboard {
    std::string organization_id;
    Timeframe timeframe = Timeframe::DAY;
    std::string generated_at;

    uint64_t failed_logins = 0;
    uint64_t suspicious_activity = 0;               // Includes automatic blocks
    uint64_t blocked_addresses = 0;
    uint64_t active_sessions = 0;
    uint64_t total_users = 0;
    uint64_t mfa_enabled_users = 0;
    double mfa_adoption_pct = 0.0;

    std::vector<DailyCount> failed_login_trend;     // Oldest day first
    std::vector<IdentityCount> risky_users;         // Most failed logins first
    std::vector<AuditEvent> recent_critical;        // Newest first
    size_t vulnerability_count = 0;
};

struct SecurityReport {
    std::string organization_id;
    std::string period_start;
    std::string period_end;
    std::string generated_at;

    uint64_t total_events = 0;
    std::map<std::string, uint64_t> events_by_type;
    std::map<std::string, uint64_t> events_by_severity;
    std::vector<IdentityCount> top_identities;
    std::vector<Vulnerability> vulnerabilities;
};

/**
 * @brief Read-only security overview of one organization
 *
 * Every read is scoped to the caller's organization. A caller asking
 * for another organization gets AUTHORIZATION_FAILURE and a HIGH
 * ACCESS_DENIED event in its own trail; storage errors are returned
 * rather than rendered as empty results.
 */
class SecurityMonitor {
public:
    struct Config {
        size_t risky_user_limit = 5;
        size_t recent_alert_limit = 10;
        size_t top_identity_limit = 10;
        int trend_days = 7;
        int recommended_password_length = 12;
        std::chrono::milliseconds read_timeout{5000};
    };

    SecurityMonitor(std::shared_ptr<ISecurityStore> store,
                    std::shared_ptr<TaskExecutor> executor,
                    std::shared_ptr<IpDenylist> denylist,
                    std::shared_ptr<SettingsManager> settings,
                    std::shared_ptr<AuditLogService> audit,
                    const Config& config);

    [[nodiscard]] Result<SecurityDashboard> dashboard(const Caller& caller,
                                                      const std::string& organization_id,
                                                      Timeframe timeframe);

    [[nodiscard]] Result<std::vector<Vulnerability>> vulnerabilities(const Caller& caller,
                                                                     const std::string& organization_id);

    /// Aggregates over [start, end)
    [[nodiscard]] Result<SecurityReport> report(const Caller& caller,
                                                const std::string& organization_id,
                                                TimePoint start, TimePoint end);

    /// Checklist over settings and identity counts
    [[nodiscard]] std::vector<Vulnerability> assess(const OrgSecuritySettings& settings,
                                                    const UserSecuritySummary& users) const;

    // JSON serialization
    [[nodiscard]] static std::string dashboard_to_json(const SecurityDashboard& dashboard);
    [[nodiscard]] static std::string vulnerabilities_to_json(const std::vector<Vulnerability>& list);
    [[nodiscard]] static std::string report_to_json(const SecurityReport& report);

private:
    [[nodiscard]] Result<void> authorize(const Caller& caller, const std::string& organization_id,
                                         const char* operation);

    [[nodiscard]] std::vector<AuditEvent> list_events(const AuditFilter& filter);
    [[nodiscard]] UserSecuritySummary user_summary(const std::string& organization_id);

    /// Highest counts first, ties by identity, truncated to limit
    [[nodiscard]] static std::vector<IdentityCount> rank(const std::map<std::string, uint64_t>& counts,
                                                         size_t limit);

    std::shared_ptr<ISecurityStore> store_;
    std::shared_ptr<TaskExecutor> executor_;
    std::shared_ptr<IpDenylist> denylist_;
    std::shared_ptr<SettingsManager> settings_;
    std::shared_ptr<AuditLogService> audit_;
    Config config_;
};

} // namespace secplane
