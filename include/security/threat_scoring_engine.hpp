#pragma once

#include "audit/audit_log_service.hpp"
#include "core/types.hpp"
#include "security/activity_tracker.hpp"
#include "security/ip_denylist.hpp"
#include "security/signature_matcher.hpp"
#include "tenant/settings_manager.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace secplane {

/**
 * @brief Per-request threat scoring
 *
 * Additive model over independent signals:
 *   denylisted address      +100
 *   request rate            +30   (count in window > rate_threshold)
 *   failed logins           +40   (count in window > org failed_login_threshold)
 *   distinct addresses      +25   (count in window > distinct_address_threshold)
 *   attack signature        +50   (first match only)
 *   missing / short UA      +15
 *   spoofing header         +10   each
 *
 * score >= org threshold  → block, denylist the address for auto_block_ttl,
 *                           CRITICAL audit.
 * score >  suspicious     → allow, MEDIUM audit.
 * otherwise               → allow silently.
 *
 * Fails open: any internal error yields an allow decision with
 * fail_open set, and the error is logged.
 */
class ThreatScoringEngine {
public:
    static constexpr int kDenylistedWeight = 100;
    static constexpr int kRateWeight = 30;
    static constexpr int kFailedLoginWeight = 40;
    static constexpr int kDistinctAddressWeight = 25;
    static constexpr int kSignatureWeight = 50;
    static constexpr int kUserAgentWeight = 15;
    static constexpr int kSpoofHeaderWeight = 10;

    static constexpr const char* kClientBlockedMessage = "Access denied";

    struct Config {
        int suspicious_threshold = 25;
        uint64_t rate_threshold = 60;
        size_t distinct_address_threshold = 5;
        size_t min_user_agent_length = 10;
        size_t max_scan_bytes = SignatureMatcher::kDefaultMaxScanBytes;  // Per payload field
        std::chrono::seconds auto_block_ttl{24 * 3600};
        std::vector<std::string> spoofing_headers = {"x-forwarded-host", "x-original-url"};
        std::string system_organization_id = "system";  // Audit owner for anonymous requests
    };

    struct Score {
        int score = 0;
        std::vector<std::string> reasons;
    };

    ThreatScoringEngine(std::shared_ptr<IpDenylist> denylist,
                        std::shared_ptr<ActivityTracker> activity,
                        std::shared_ptr<AuditLogService> audit,
                        std::shared_ptr<SettingsManager> settings,
                        const Config& config);

    /// Full evaluation: track, score, decide, persist. Never throws.
    [[nodiscard]] Decision evaluate(const RequestContext& ctx) noexcept;

    /// Pure scoring over a context and its activity window
    [[nodiscard]] Score score(const RequestContext& ctx,
                              const ActivityTracker::Snapshot& activity,
                              bool denylisted,
                              int failed_login_threshold) const;

    /// Failed authentication reported by the login flow
    void report_failed_login(const std::string& identity, const std::string& address);

    /// Reset every activity window
    void clear_activity();

    struct Stats {
        uint64_t evaluated = 0;
        uint64_t blocked = 0;
        uint64_t suspicious = 0;
        uint64_t fail_open = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] Decision evaluate_impl(const RequestContext& ctx);
    [[nodiscard]] std::string audit_organization(const RequestContext& ctx) const;

    std::shared_ptr<IpDenylist> denylist_;
    std::shared_ptr<ActivityTracker> activity_;
    std::shared_ptr<AuditLogService> audit_;
    std::shared_ptr<SettingsManager> settings_;
    Config config_;
    SignatureMatcher signatures_;

    std::atomic<uint64_t> evaluated_{0};
    std::atomic<uint64_t> blocked_{0};
    std::atomic<uint64_t> suspicious_{0};
    std::atomic<uint64_t> fail_open_{0};
};

} // namespace secplane
