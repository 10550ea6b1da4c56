#include "monitor/security_monitor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace secplane {

namespace {

std::string identity_of(const AuditEvent& e) {
    if (e.actor_user_id && !e.actor_user_id->empty()) return *e.actor_user_id;
    return "anon:" + e.source_address;
}

// Suspicious requests plus the ones scoring high enough to be blocked outright
bool is_suspicious(const AuditEvent& e) {
    if (e.event_type == AuditEventType::SUSPICIOUS_ACTIVITY) return true;
    if (e.event_type != AuditEventType::IP_BLOCKED || !e.metadata.is_object()) return false;

    auto meta = e.metadata;
    auto& obj = meta.get_object();
    const auto it = obj.find("automatic");
    return it != obj.end() && it->second.is_boolean() && it->second.get<bool>();
}

double percentage(uint64_t part, uint64_t whole) {
    if (whole == 0) return 0.0;
    return 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

std::string identity_counts_to_json(const std::vector<IdentityCount>& counts) {
    std::string json = "[";
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) json += ",";
        json += std::format("{{\"identity\":\"{}\",\"count\":{}}}",
                            utils::escape_json(counts[i].identity), counts[i].count);
    }
    json += "]";
    return json;
}

std::string counts_map_to_json(const std::map<std::string, uint64_t>& counts) {
    std::string json = "{";
    bool first = true;
    for (const auto& [key, count] : counts) {
        if (!first) json += ",";
        first = false;
        json += std::format("\"{}\":{}", utils::escape_json(key), count);
    }
    json += "}";
    return json;
}

} // anonymous namespace

SecurityMonitor::SecurityMonitor(std::shared_ptr<ISecurityStore> store,
                                 std::shared_ptr<TaskExecutor> executor,
                                 std::shared_ptr<IpDenylist> denylist,
                                 std::shared_ptr<SettingsManager> settings,
                                 std::shared_ptr<AuditLogService> audit,
                                 const Config& config)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      denylist_(std::move(denylist)),
      settings_(std::move(settings)),
      audit_(std::move(audit)),
      config_(config) {}

// ============================================================================
// Helpers
// ============================================================================

Result<void> SecurityMonitor::authorize(const Caller& caller, const std::string& organization_id,
                                        const char* operation) {
    if (caller.organization_id.empty() || organization_id.empty()) {
        return Result<void>::error(ErrorCategory::VALIDATION_ERROR, "organization id is required");
    }
    if (caller.organization_id == organization_id) {
        return Result<void>::ok();
    }

    glz::json_t meta;
    meta["operation"] = std::string(operation);
    meta["requested_organization"] = organization_id;
    auto audited = audit_->record_security_event(caller.organization_id, caller.user_id,
                                                 AuditEventType::ACCESS_DENIED, Severity::HIGH,
                                                 "cross-tenant monitoring read rejected",
                                                 caller.source_address, std::move(meta));
    if (audited.is_error()) {
        utils::log::warn(std::format("Cross-tenant monitoring read by {} could not be recorded: {}",
                                     caller.user_id, audited.error_message()));
    }
    return Result<void>::error(ErrorCategory::AUTHORIZATION_FAILURE,
                               "data of another organization is not accessible");
}

std::vector<AuditEvent> SecurityMonitor::list_events(const AuditFilter& filter) {
    auto store = store_;
    return executor_->run_bounded([store, filter] { return store->list_audit(filter); },
                                  config_.read_timeout);
}

UserSecuritySummary SecurityMonitor::user_summary(const std::string& organization_id) {
    auto store = store_;
    return executor_->run_bounded(
        [store, organization_id] { return store->get_user_summary(organization_id); },
        config_.read_timeout);
}

std::vector<IdentityCount> SecurityMonitor::rank(const std::map<std::string, uint64_t>& counts,
                                                 size_t limit) {
    std::vector<IdentityCount> ranked;
    ranked.reserve(counts.size());
    for (const auto& [identity, count] : counts) {
        ranked.push_back({identity, count});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const IdentityCount& a, const IdentityCount& b) { return a.count > b.count; });
    if (ranked.size() > limit) ranked.resize(limit);
    return ranked;
}

// ============================================================================
// Vulnerability checklist
// ============================================================================

std::vector<Vulnerability> SecurityMonitor::assess(const OrgSecuritySettings& settings,
                                                   const UserSecuritySummary& users) const {
    std::vector<Vulnerability> found;

    const uint64_t without_mfa = users.total_users > users.mfa_enabled_users
        ? users.total_users - users.mfa_enabled_users : 0;
    if (without_mfa > 0) {
        found.push_back({
            "MFA_NOT_ENABLED", Severity::HIGH,
            std::format("{} users do not have MFA enabled", without_mfa),
            "Enable MFA for all users"});
    }

    if (settings.password_min_length < config_.recommended_password_length) {
        found.push_back({
            "WEAK_PASSWORD_POLICY", Severity::MEDIUM,
            std::format("Password minimum length is {} (recommended {})",
                        settings.password_min_length, config_.recommended_password_length),
            std::format("Set minimum password length to at least {} characters",
                        config_.recommended_password_length)});
    }

    if (users.stale_sessions > 0) {
        found.push_back({
            "INACTIVE_SESSIONS", Severity::LOW,
            std::format("{} sessions have been active for more than 7 days", users.stale_sessions),
            "Implement a session timeout policy"});
    }

    if (!settings.ip_allowlist_enabled) {
        found.push_back({
            "IP_ALLOWLIST_DISABLED", Severity::MEDIUM,
            "IP allowlisting is not enabled",
            "Enable IP allowlisting for additional security"});
    }

    if (!settings.enforce_mfa) {
        found.push_back({
            "ENFORCE_MFA_DISABLED", Severity::MEDIUM,
            "MFA is not enforced for the organization",
            "Require MFA for every user of the organization"});
    }

    return found;
}

Result<std::vector<Vulnerability>> SecurityMonitor::vulnerabilities(const Caller& caller,
                                                                    const std::string& organization_id) {
    using R = Result<std::vector<Vulnerability>>;
    if (auto auth = authorize(caller, organization_id, "vulnerabilities"); auth.is_error()) {
        return R::error(auth.error_category(), auth.error_message());
    }

    auto settings = settings_->load(caller);
    if (settings.is_error()) {
        return R::error(settings.error_category(), settings.error_message());
    }

    try {
        auto found = assess(settings.value(), user_summary(organization_id));
        utils::log::info(std::format("Vulnerability check for org {}: {} findings",
                                     organization_id, found.size()));
        return R::ok(std::move(found));
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Vulnerability check for org {} failed: {}",
                                      organization_id, e.what()));
        return R::from_exception(e);
    }
}

// ============================================================================
// Dashboard
// ============================================================================

Result<SecurityDashboard> SecurityMonitor::dashboard(const Caller& caller,
                                                     const std::string& organization_id,
                                                     Timeframe timeframe) {
    if (auto auth = authorize(caller, organization_id, "dashboard"); auth.is_error()) {
        return Result<SecurityDashboard>::error(auth.error_category(), auth.error_message());
    }

    auto settings = settings_->load(caller);
    if (settings.is_error()) {
        return Result<SecurityDashboard>::error(settings.error_category(), settings.error_message());
    }

    const auto now = utils::now();
    SecurityDashboard d;
    d.organization_id = organization_id;
    d.timeframe = timeframe;
    d.generated_at = utils::format_timestamp(now);

    try {
        AuditFilter window;
        window.organization_id = organization_id;
        window.start = now - timeframe_duration(timeframe);
        const auto events = list_events(window);

        for (const auto& e : events) {
            if (e.event_type == AuditEventType::LOGIN_FAILED) ++d.failed_logins;
            if (is_suspicious(e)) ++d.suspicious_activity;
        }

        // list_events is oldest first
        for (auto it = events.rbegin();
             it != events.rend() && d.recent_critical.size() < config_.recent_alert_limit; ++it) {
            if (it->severity == Severity::CRITICAL) d.recent_critical.push_back(*it);
        }

        // Trend and risky users always cover the last trend_days
        AuditFilter failed;
        failed.organization_id = organization_id;
        failed.event_type = AuditEventType::LOGIN_FAILED;
        failed.start = now - std::chrono::hours(24 * config_.trend_days);
        const auto failures = list_events(failed);

        std::map<std::string, uint64_t> per_day;
        for (int i = config_.trend_days - 1; i >= 0; --i) {
            per_day[utils::format_date(now - std::chrono::hours(24 * i))] = 0;
        }
        std::map<std::string, uint64_t> per_user;
        for (const auto& e : failures) {
            ++per_day[utils::format_date(e.created_at)];
            if (e.actor_user_id && !e.actor_user_id->empty()) ++per_user[*e.actor_user_id];
        }
        for (const auto& [date, count] : per_day) {
            d.failed_login_trend.push_back({date, count});
        }
        d.risky_users = rank(per_user, config_.risky_user_limit);

        const auto users = user_summary(organization_id);
        d.active_sessions = users.active_sessions;
        d.total_users = users.total_users;
        d.mfa_enabled_users = users.mfa_enabled_users;
        d.mfa_adoption_pct = percentage(users.mfa_enabled_users, users.total_users);
        d.vulnerability_count = assess(settings.value(), users).size();
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Dashboard for org {} failed: {}", organization_id, e.what()));
        return Result<SecurityDashboard>::from_exception(e);
    }

    d.blocked_addresses = denylist_->size();
    return Result<SecurityDashboard>::ok(std::move(d));
}

// ============================================================================
// Report
// ============================================================================

Result<SecurityReport> SecurityMonitor::report(const Caller& caller,
                                               const std::string& organization_id,
                                               TimePoint start, TimePoint end) {
    if (start >= end) {
        return Result<SecurityReport>::error(ErrorCategory::VALIDATION_ERROR,
                                             "report start must be before its end");
    }
    if (auto auth = authorize(caller, organization_id, "report"); auth.is_error()) {
        return Result<SecurityReport>::error(auth.error_category(), auth.error_message());
    }

    auto vulns = vulnerabilities(caller, organization_id);
    if (vulns.is_error()) {
        return Result<SecurityReport>::error(vulns.error_category(), vulns.error_message());
    }

    SecurityReport r;
    r.organization_id = organization_id;
    r.period_start = utils::format_timestamp(start);
    r.period_end = utils::format_timestamp(end);
    r.generated_at = utils::format_timestamp(utils::now());
    r.vulnerabilities = std::move(vulns.value());

    try {
        AuditFilter range;
        range.organization_id = organization_id;
        range.start = start;
        range.end = end;
        const auto events = list_events(range);

        std::map<std::string, uint64_t> per_identity;
        for (const auto& e : events) {
            ++r.events_by_type[event_type_to_string(e.event_type)];
            ++r.events_by_severity[severity_to_string(e.severity)];
            ++per_identity[identity_of(e)];
        }
        r.total_events = events.size();
        r.top_identities = rank(per_identity, config_.top_identity_limit);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Report for org {} failed: {}", organization_id, e.what()));
        return Result<SecurityReport>::from_exception(e);
    }

    utils::log::info(std::format("Security report for org {}: {} events, {} findings",
                                 organization_id, r.total_events, r.vulnerabilities.size()));
    return Result<SecurityReport>::ok(std::move(r));
}

// ============================================================================
// JSON serialization
// ============================================================================

std::string SecurityMonitor::vulnerabilities_to_json(const std::vector<Vulnerability>& list) {
    std::string json = "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) json += ",";
        const auto& v = list[i];
        json += std::format(
            "{{\"type\":\"{}\",\"severity\":\"{}\",\"description\":\"{}\",\"recommendation\":\"{}\"}}",
            v.type, severity_to_string(v.severity),
            utils::escape_json(v.description), utils::escape_json(v.recommendation));
    }
    json += "]";
    return json;
}

std::string SecurityMonitor::dashboard_to_json(const SecurityDashboard& d) {
    std::string json = "{";
    json += std::format("\"organization_id\":\"{}\",", utils::escape_json(d.organization_id));
    json += std::format("\"timeframe\":\"{}\",", timeframe_to_string(d.timeframe));
    json += std::format("\"generated_at\":\"{}\",", d.generated_at);
    json += std::format("\"failed_logins\":{},", d.failed_logins);
    json += std::format("\"suspicious_activity\":{},", d.suspicious_activity);
    json += std::format("\"blocked_addresses\":{},", d.blocked_addresses);
    json += std::format("\"active_sessions\":{},", d.active_sessions);
    json += std::format("\"total_users\":{},", d.total_users);
    json += std::format("\"mfa_enabled_users\":{},", d.mfa_enabled_users);
    json += std::format("\"mfa_adoption_pct\":{:.1f},", d.mfa_adoption_pct);
    json += std::format("\"vulnerability_count\":{},", d.vulnerability_count);

    json += "\"failed_login_trend\":[";
    for (size_t i = 0; i < d.failed_login_trend.size(); ++i) {
        if (i > 0) json += ",";
        json += std::format("{{\"date\":\"{}\",\"count\":{}}}",
                            d.failed_login_trend[i].date, d.failed_login_trend[i].count);
    }
    json += "],";

    json += std::format("\"risky_users\":{},", identity_counts_to_json(d.risky_users));

    json += "\"recent_critical\":[";
    for (size_t i = 0; i < d.recent_critical.size(); ++i) {
        if (i > 0) json += ",";
        json += audit_event_to_json(d.recent_critical[i]);
    }
    json += "]}";
    return json;
}

std::string SecurityMonitor::report_to_json(const SecurityReport& r) {
    std::string json = "{";
    json += std::format("\"organization_id\":\"{}\",", utils::escape_json(r.organization_id));
    json += std::format("\"period\":{{\"start\":\"{}\",\"end\":\"{}\"}},", r.period_start, r.period_end);
    json += std::format("\"generated_at\":\"{}\",", r.generated_at);
    json += std::format("\"total_events\":{},", r.total_events);
    json += std::format("\"events_by_type\":{},", counts_map_to_json(r.events_by_type));
    json += std::format("\"events_by_severity\":{},", counts_map_to_json(r.events_by_severity));
    json += std::format("\"top_identities\":{},", identity_counts_to_json(r.top_identities));
    json += std::format("\"vulnerabilities\":{}", vulnerabilities_to_json(r.vulnerabilities));
    json += "}";
    return json;
}

} // namespace secplane
