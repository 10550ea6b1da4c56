#include "core/security_control_plane.hpp"
#include "core/utils.hpp"
#include "db/memory_security_store.hpp"
#include "security/ip_allowlist.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_security_store.hpp"
#endif

#include <format>

namespace secplane {

namespace {

AuditLogService::Config audit_config_from(const SecPlaneConfig& c) {
    return {
        .write_timeout = std::chrono::milliseconds(c.audit.write_timeout_ms),
        .alert_timeout = std::chrono::milliseconds(c.audit.alert_timeout_ms),
        .default_retention_days = c.audit.default_retention_days,
    };
}

SettingsManager::Config settings_config_from(const SecPlaneConfig& c) {
    return {
        .ttl = std::chrono::seconds(c.settings.cache_ttl_seconds),
        .load_timeout = std::chrono::milliseconds(c.settings.load_timeout_ms),
        .write_timeout = std::chrono::milliseconds(c.storage.call_timeout_ms),
        .defaults = c.default_org_settings(),
    };
}

ThreatScoringEngine::Config threat_config_from(const SecPlaneConfig& c) {
    return {
        .suspicious_threshold = c.threat.suspicious_threshold,
        .rate_threshold = c.threat.rate_threshold,
        .distinct_address_threshold = c.threat.distinct_address_threshold,
        .min_user_agent_length = c.threat.min_user_agent_length,
        .max_scan_bytes = c.threat.max_scan_bytes,
        .auto_block_ttl = std::chrono::seconds(c.threat.auto_block_ttl_seconds),
        .spoofing_headers = c.threat.spoofing_headers,
        .system_organization_id = c.threat.system_organization_id,
    };
}

MfaService::Config mfa_config_from(const SecPlaneConfig& c) {
    MfaService::Config cfg;
    cfg.totp.issuer = c.mfa.issuer;
    cfg.totp.digits = c.mfa.digits;
    cfg.totp.period_seconds = c.mfa.period_seconds;
    cfg.totp.skew_steps = c.mfa.skew_steps;
    cfg.backup_code_count = c.mfa.backup_code_count;
    cfg.repeated_failure_threshold = c.mfa.repeated_failure_threshold;
    cfg.failure_window = std::chrono::seconds(c.mfa.failure_window_seconds);
    cfg.store_timeout = std::chrono::milliseconds(c.storage.call_timeout_ms);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

SecurityControlPlane::SecurityControlPlane(const SecPlaneConfig& config,
                                           std::shared_ptr<ISecurityStore> store,
                                           std::shared_ptr<IKeyManager> key_manager,
                                           std::shared_ptr<IAlertNotifier> notifier)
    : config_(config), store_(std::move(store)) {
    if (!store_) {
        throw SecurityError(ErrorCategory::VALIDATION_ERROR, "security store is required");
    }

    executor_ = std::make_shared<TaskExecutor>(TaskExecutor::Config{
        .worker_count = config_.storage.worker_count,
        .call_timeout = std::chrono::milliseconds(config_.storage.call_timeout_ms),
    });
    encryptor_ = std::make_shared<FieldEncryptor>(std::move(key_manager));

    audit_ = std::make_shared<AuditLogService>(store_, executor_, std::move(notifier),
                                               audit_config_from(config_));
    settings_ = std::make_shared<SettingsManager>(store_, executor_, audit_,
                                                  settings_config_from(config_));
    denylist_ = std::make_shared<IpDenylist>(store_, executor_, audit_, IpDenylist::Config{
        .shard_count = config_.denylist.shard_count,
        .store_timeout = std::chrono::milliseconds(config_.storage.call_timeout_ms),
    });
    activity_ = std::make_shared<ActivityTracker>(ActivityTracker::Config{
        .window = std::chrono::seconds(config_.threat.window_seconds),
        .shard_count = config_.threat.shard_count,
        .max_tracked_identities = config_.threat.max_tracked_identities,
    });
    threat_ = std::make_shared<ThreatScoringEngine>(denylist_, activity_, audit_, settings_,
                                                    threat_config_from(config_));
    mfa_ = std::make_shared<MfaService>(store_, executor_, encryptor_, audit_,
                                        mfa_config_from(config_));
    monitor_ = std::make_shared<SecurityMonitor>(store_, executor_, denylist_, settings_, audit_,
                                                 SecurityMonitor::Config{});
}

SecurityControlPlane::~SecurityControlPlane() {
    stop();
}

std::shared_ptr<ISecurityStore> SecurityControlPlane::make_store(const StorageConfig& config) {
    if (config.backend == "memory") {
        return std::make_shared<InMemorySecurityStore>();
    }
    if (config.backend == "postgresql") {
#ifdef ENABLE_POSTGRESQL
        return std::make_shared<PgSecurityStore>(PgSecurityStore::Config{
            .connection_string = config.connection_string,
            .statement_timeout_ms = config.statement_timeout_ms,
            .pool_size = config.pool_size,
            .acquire_timeout = std::chrono::milliseconds(config.call_timeout_ms),
            .stale_session_age = std::chrono::hours(config.stale_session_hours),
            .bootstrap_schema = config.bootstrap_schema,
        });
#else
        throw SecurityError(ErrorCategory::VALIDATION_ERROR,
                            "built without PostgreSQL support (ENABLE_POSTGRESQL=OFF)");
#endif
    }
    throw SecurityError(ErrorCategory::VALIDATION_ERROR,
                        std::format("unknown storage backend '{}'", config.backend));
}

std::shared_ptr<IAlertNotifier> SecurityControlPlane::make_notifier(const AuditConfig& config) {
    if (config.webhook_enabled) {
        return std::make_shared<WebhookAlertNotifier>(WebhookAlertNotifier::Config{
            .url = config.webhook_url,
            .auth_header = config.webhook_auth_header,
            .timeout = std::chrono::milliseconds(config.webhook_timeout_ms),
            .max_retries = config.webhook_max_retries,
        });
    }
    return std::make_shared<LogAlertNotifier>();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<size_t> SecurityControlPlane::hydrate_denylist() {
    return denylist_->hydrate();
}

void SecurityControlPlane::start() {
    auto hydrated = hydrate_denylist();
    if (hydrated.is_error()) {
        utils::log::error(std::format("Denylist hydration failed, starting empty: {}",
                                      hydrated.error_message()));
    } else {
        utils::log::info(std::format("Denylist: {} active entries loaded", hydrated.value()));
    }

    auto denylist = denylist_;
    sweep_task_ = std::make_unique<PeriodicTask>(
        "denylist-sweep",
        std::chrono::seconds(config_.denylist.sweep_interval_seconds),
        [denylist] {
            auto swept = denylist->sweep_expired();
            if (swept.is_error()) {
                throw SecurityError(swept.error_category(), swept.error_message());
            }
        });

    auto audit = audit_;
    auto settings = settings_;
    purge_task_ = std::make_unique<PeriodicTask>(
        "audit-purge",
        std::chrono::seconds(config_.audit.purge_interval_seconds),
        [audit, settings] {
            auto purged = audit->purge_expired(
                [settings](const std::string& org) { return settings->retention_days(org); });
            if (purged.is_error()) {
                throw SecurityError(purged.error_category(), purged.error_message());
            }
        });

    sweep_task_->start();
    purge_task_->start();
    stopped_ = false;
}

void SecurityControlPlane::stop() {
    if (stopped_) return;
    stopped_ = true;

    if (sweep_task_) sweep_task_->stop();
    if (purge_task_) purge_task_->stop();
    audit_->shutdown();
    executor_->shutdown();
}

// ============================================================================
// Request path
// ============================================================================

Decision SecurityControlPlane::evaluate_request(const RequestContext& ctx) noexcept {
    return threat_->evaluate(ctx);
}

bool SecurityControlPlane::is_address_allowed(const std::string& organization_id,
                                              const std::string& address) {
    if (organization_id.empty()) return true;
    return IpAllowlist::is_allowed(settings_->get(organization_id), address);
}

void SecurityControlPlane::report_failed_login(const std::string& identity, const std::string& address) {
    threat_->report_failed_login(identity, address);
}

void SecurityControlPlane::clear_activity() {
    threat_->clear_activity();
}

// ============================================================================
// MFA
// ============================================================================

Result<MfaSetup> SecurityControlPlane::setup_mfa(const Caller& caller, const std::string& account_name) {
    return mfa_->setup(caller, account_name);
}

Result<bool> SecurityControlPlane::verify_mfa(const Caller& caller, std::string_view code) {
    return mfa_->verify(caller, code);
}

Result<void> SecurityControlPlane::disable_mfa(const Caller& caller) {
    return mfa_->disable(caller);
}

Result<std::vector<std::string>> SecurityControlPlane::regenerate_backup_codes(const Caller& caller) {
    return mfa_->regenerate_backup_codes(caller);
}

Result<MfaStatus> SecurityControlPlane::mfa_status(const Caller& caller) {
    return mfa_->status(caller);
}

// ============================================================================
// Audit
// ============================================================================

Result<AuditEvent> SecurityControlPlane::record_audit_event(AuditEvent event) {
    return audit_->record(std::move(event));
}

Result<AuditPage> SecurityControlPlane::query_audit_events(const Caller& caller,
                                                          const AuditFilter& filter,
                                                          const Pagination& pagination) {
    return audit_->query(caller, filter, pagination);
}

Result<AuditEvent> SecurityControlPlane::record_auth_event(const std::string& organization_id,
                                                          const std::optional<std::string>& user_id,
                                                          AuditEventType type,
                                                          bool success,
                                                          const std::string& source_address,
                                                          const std::string& user_agent,
                                                          glz::json_t metadata) {
    return audit_->record_auth_event(organization_id, user_id, type, success, source_address,
                                     user_agent, std::move(metadata));
}

Result<void> SecurityControlPlane::record_data_access(const std::string& organization_id,
                                                      const std::string& user_id,
                                                      AuditEventType type,
                                                      const std::string& resource_type,
                                                      const std::string& resource_id,
                                                      const std::string& source_address,
                                                      std::optional<glz::json_t> changes) {
    if (!settings_->get(organization_id).audit_logging_enabled) {
        return Result<void>::ok();
    }
    auto recorded = audit_->record_data_access(organization_id, user_id, type, resource_type,
                                               resource_id, source_address, std::move(changes));
    if (recorded.is_error()) {
        return Result<void>::error(recorded.error_category(), recorded.error_message());
    }
    return Result<void>::ok();
}

Result<AuditLogService::ChainVerification> SecurityControlPlane::verify_audit_chain(const Caller& caller) {
    if (caller.organization_id.empty()) {
        return Result<AuditLogService::ChainVerification>::error(
            ErrorCategory::VALIDATION_ERROR, "caller has no organization");
    }
    return audit_->verify_chain(caller.organization_id);
}

Result<uint64_t> SecurityControlPlane::purge_audit() {
    auto settings = settings_;
    return audit_->purge_expired(
        [settings](const std::string& org) { return settings->retention_days(org); });
}

// ============================================================================
// Monitoring
// ============================================================================

Result<SecurityDashboard> SecurityControlPlane::get_dashboard(const Caller& caller,
                                                              const std::string& organization_id,
                                                              Timeframe timeframe) {
    return monitor_->dashboard(caller, organization_id, timeframe);
}

Result<std::vector<Vulnerability>> SecurityControlPlane::get_vulnerabilities(
    const Caller& caller, const std::string& organization_id) {
    return monitor_->vulnerabilities(caller, organization_id);
}

Result<SecurityReport> SecurityControlPlane::generate_report(const Caller& caller,
                                                             const std::string& organization_id,
                                                             TimePoint start, TimePoint end) {
    return monitor_->report(caller, organization_id, start, end);
}

// ============================================================================
// Denylist administration
// ============================================================================

Result<BlockedAddress> SecurityControlPlane::block_address(const Caller& caller,
                                                           const std::string& address,
                                                           const std::string& reason,
                                                           std::optional<std::chrono::seconds> ttl) {
    if (caller.organization_id.empty()) {
        return Result<BlockedAddress>::error(ErrorCategory::VALIDATION_ERROR, "caller has no organization");
    }
    IpDenylist::BlockRequest request;
    request.address = utils::trim(address);
    request.reason = reason.empty() ? "blocked by administrator" : reason;
    if (!caller.user_id.empty()) request.blocked_by = caller.user_id;
    request.ttl = ttl;
    request.automatic = false;
    request.organization_id = caller.organization_id;
    request.source_address = caller.source_address;
    return denylist_->block(request);
}

Result<bool> SecurityControlPlane::unblock_address(const Caller& caller, const std::string& address) {
    if (caller.organization_id.empty()) {
        return Result<bool>::error(ErrorCategory::VALIDATION_ERROR, "caller has no organization");
    }
    const std::optional<std::string> actor = caller.user_id.empty()
        ? std::nullopt : std::optional<std::string>(caller.user_id);
    return denylist_->unblock(utils::trim(address), actor, caller.organization_id, caller.source_address);
}

std::vector<BlockedAddress> SecurityControlPlane::list_blocked() const {
    return denylist_->list_blocked();
}

Result<size_t> SecurityControlPlane::sweep_denylist() {
    return denylist_->sweep_expired();
}

// ============================================================================
// Organization settings
// ============================================================================

Result<OrgSecuritySettings> SecurityControlPlane::get_settings(const Caller& caller) {
    return settings_->load(caller);
}

Result<OrgSecuritySettings> SecurityControlPlane::update_settings(const Caller& caller,
                                                                  const OrgSecuritySettings& settings) {
    return settings_->update(caller, settings);
}

Result<OrgSecuritySettings> SecurityControlPlane::add_allowed_address(const Caller& caller,
                                                                      const std::string& entry) {
    return settings_->add_allowed_address(caller, entry);
}

Result<OrgSecuritySettings> SecurityControlPlane::remove_allowed_address(const Caller& caller,
                                                                         const std::string& entry) {
    return settings_->remove_allowed_address(caller, entry);
}

Result<OrgSecuritySettings> SecurityControlPlane::set_allowlist_enabled(const Caller& caller, bool enabled) {
    return settings_->set_allowlist_enabled(caller, enabled);
}

Result<OrgSecuritySettings> SecurityControlPlane::set_retention_days(const Caller& caller, int days) {
    return settings_->set_retention_days(caller, days);
}

} // namespace secplane
