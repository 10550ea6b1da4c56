#pragma once

#include "audit/alert_notifier.hpp"
#include "audit/audit_log_service.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/periodic_task.hpp"
#include "core/task_executor.hpp"
#include "core/types.hpp"
#include "db/isecurity_store.hpp"
#include "monitor/security_monitor.hpp"
#include "security/activity_tracker.hpp"
#include "security/field_encryptor.hpp"
#include "security/ikey_manager.hpp"
#include "security/ip_denylist.hpp"
#include "security/mfa_service.hpp"
#include "security/threat_scoring_engine.hpp"
#include "tenant/settings_manager.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace secplane {

/**
 * @brief Single owned entry point for the request pipeline and admin tooling
 *
 * Built once at process start from SecPlaneConfig and injected where
 * needed. Owns the worker pool, the shared hot-path state (denylist,
 * activity windows, settings cache) and the two background jobs:
 *
 *   denylist-sweep   drop expired blocks from memory and storage
 *   audit-purge      delete audit rows past each organization's retention
 *
 * evaluate_request() never throws and never blocks beyond the storage
 * call timeout. Every other operation returns a Result.
 */
class SecurityControlPlane {
public:
    SecurityControlPlane(const SecPlaneConfig& config,
                         std::shared_ptr<ISecurityStore> store,
                         std::shared_ptr<IKeyManager> key_manager,
                         std::shared_ptr<IAlertNotifier> notifier);
    ~SecurityControlPlane();

    SecurityControlPlane(const SecurityControlPlane&) = delete;
    SecurityControlPlane& operator=(const SecurityControlPlane&) = delete;

    /// Store for the configured backend
    /// @throws SecurityError when the backend is unknown, not built in, or unreachable
    [[nodiscard]] static std::shared_ptr<ISecurityStore> make_store(const StorageConfig& config);

    /// Webhook notifier when configured, log-only otherwise
    [[nodiscard]] static std::shared_ptr<IAlertNotifier> make_notifier(const AuditConfig& config);

    // ---- Lifecycle ---------------------------------------------------------

    /// Hydrate the denylist and start the background jobs
    void start();
    void stop();

    /// Load active blocks from storage into memory
    [[nodiscard]] Result<size_t> hydrate_denylist();

    // ---- Request path ------------------------------------------------------

    [[nodiscard]] Decision evaluate_request(const RequestContext& ctx) noexcept;

    /// Allowlist check for an organization (true when allowlisting is off)
    [[nodiscard]] bool is_address_allowed(const std::string& organization_id,
                                          const std::string& address);

    void report_failed_login(const std::string& identity, const std::string& address);
    void clear_activity();

    // ---- MFA ---------------------------------------------------------------

    [[nodiscard]] Result<MfaSetup> setup_mfa(const Caller& caller, const std::string& account_name = {});
    [[nodiscard]] Result<bool> verify_mfa(const Caller& caller, std::string_view code);
    [[nodiscard]] Result<void> disable_mfa(const Caller& caller);
    [[nodiscard]] Result<std::vector<std::string>> regenerate_backup_codes(const Caller& caller);
    [[nodiscard]] Result<MfaStatus> mfa_status(const Caller& caller);

    // ---- Audit -------------------------------------------------------------

    [[nodiscard]] Result<AuditEvent> record_audit_event(AuditEvent event);
    [[nodiscard]] Result<AuditPage> query_audit_events(const Caller& caller,
                                                       const AuditFilter& filter,
                                                       const Pagination& pagination);

    [[nodiscard]] Result<AuditEvent> record_auth_event(const std::string& organization_id,
                                                       const std::optional<std::string>& user_id,
                                                       AuditEventType type,
                                                       bool success,
                                                       const std::string& source_address,
                                                       const std::string& user_agent,
                                                       glz::json_t metadata = {});

    /// Skipped (ok, nothing written) when the organization turned audit logging off
    [[nodiscard]] Result<void> record_data_access(const std::string& organization_id,
                                                  const std::string& user_id,
                                                  AuditEventType type,
                                                  const std::string& resource_type,
                                                  const std::string& resource_id,
                                                  const std::string& source_address,
                                                  std::optional<glz::json_t> changes = std::nullopt);

    [[nodiscard]] Result<AuditLogService::ChainVerification> verify_audit_chain(const Caller& caller);

    [[nodiscard]] Result<uint64_t> purge_audit();

    // ---- Monitoring --------------------------------------------------------

    [[nodiscard]] Result<SecurityDashboard> get_dashboard(const Caller& caller,
                                                          const std::string& organization_id,
                                                          Timeframe timeframe);
    [[nodiscard]] Result<std::vector<Vulnerability>> get_vulnerabilities(const Caller& caller,
                                                                         const std::string& organization_id);
    [[nodiscard]] Result<SecurityReport> generate_report(const Caller& caller,
                                                         const std::string& organization_id,
                                                         TimePoint start, TimePoint end);

    // ---- Denylist administration -------------------------------------------

    [[nodiscard]] Result<BlockedAddress> block_address(const Caller& caller,
                                                       const std::string& address,
                                                       const std::string& reason,
                                                       std::optional<std::chrono::seconds> ttl = std::nullopt);
    [[nodiscard]] Result<bool> unblock_address(const Caller& caller, const std::string& address);
    [[nodiscard]] std::vector<BlockedAddress> list_blocked() const;
    [[nodiscard]] Result<size_t> sweep_denylist();

    // ---- Organization settings ---------------------------------------------

    [[nodiscard]] Result<OrgSecuritySettings> get_settings(const Caller& caller);
    [[nodiscard]] Result<OrgSecuritySettings> update_settings(const Caller& caller,
                                                              const OrgSecuritySettings& settings);
    [[nodiscard]] Result<OrgSecuritySettings> add_allowed_address(const Caller& caller,
                                                                  const std::string& entry);
    [[nodiscard]] Result<OrgSecuritySettings> remove_allowed_address(const Caller& caller,
                                                                     const std::string& entry);
    [[nodiscard]] Result<OrgSecuritySettings> set_allowlist_enabled(const Caller& caller, bool enabled);
    [[nodiscard]] Result<OrgSecuritySettings> set_retention_days(const Caller& caller, int days);

    // ---- Introspection -----------------------------------------------------

    [[nodiscard]] const SecPlaneConfig& config() const { return config_; }
    [[nodiscard]] ThreatScoringEngine::Stats threat_stats() const { return threat_->get_stats(); }
    [[nodiscard]] IpDenylist::Stats denylist_stats() const { return denylist_->get_stats(); }
    [[nodiscard]] AuditLogService::Stats audit_stats() const { return audit_->get_stats(); }

private:
    SecPlaneConfig config_;

    std::shared_ptr<ISecurityStore> store_;
    std::shared_ptr<TaskExecutor> executor_;
    std::shared_ptr<FieldEncryptor> encryptor_;
    std::shared_ptr<AuditLogService> audit_;
    std::shared_ptr<SettingsManager> settings_;
    std::shared_ptr<IpDenylist> denylist_;
    std::shared_ptr<ActivityTracker> activity_;
    std::shared_ptr<ThreatScoringEngine> threat_;
    std::shared_ptr<MfaService> mfa_;
    std::shared_ptr<SecurityMonitor> monitor_;

    std::unique_ptr<PeriodicTask> sweep_task_;
    std::unique_ptr<PeriodicTask> purge_task_;
    bool stopped_ = false;
};

} // namespace secplane
