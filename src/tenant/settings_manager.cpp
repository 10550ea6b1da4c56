#include "tenant/settings_manager.hpp"
#include "core/utils.hpp"
#include "security/ip_allowlist.hpp"

#include <algorithm>
#include <format>

namespace secplane {

SettingsManager::SettingsManager(std::shared_ptr<ISecurityStore> store,
                                 std::shared_ptr<TaskExecutor> executor,
                                 std::shared_ptr<AuditLogService> audit,
                                 const Config& config)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      audit_(std::move(audit)),
      config_(config),
      entries_(std::make_shared<const EntryMap>()) {}

OrgSecuritySettings SettingsManager::defaults_for(const std::string& organization_id) const {
    OrgSecuritySettings s = config_.defaults;
    s.organization_id = organization_id;
    return s;
}

// ============================================================================
// Cache
// ============================================================================

std::shared_ptr<const SettingsManager::Entry> SettingsManager::lookup(
    const std::string& organization_id) const {
    // RCU read: grab snapshot under shared lock
    std::shared_ptr<const EntryMap> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot = entries_;
    }
    const auto it = snapshot->find(organization_id);
    return it != snapshot->end() ? it->second : nullptr;
}

void SettingsManager::install(const OrgSecuritySettings& settings) {
    auto entry = std::make_shared<const Entry>(Entry{settings, std::chrono::steady_clock::now()});
    std::unique_lock lock(mutex_);
    // Copy-on-write: make mutable copy, insert, swap
    auto new_map = std::make_shared<EntryMap>(*entries_);
    (*new_map)[settings.organization_id] = std::move(entry);
    entries_ = std::move(new_map);
}

void SettingsManager::invalidate(const std::string& organization_id) {
    std::unique_lock lock(mutex_);
    auto new_map = std::make_shared<EntryMap>(*entries_);
    if (new_map->erase(organization_id) > 0) {
        entries_ = std::move(new_map);
    }
}

OrgSecuritySettings SettingsManager::get(const std::string& organization_id) {
    const auto cached = lookup(organization_id);
    if (cached && std::chrono::steady_clock::now() - cached->loaded_at < config_.ttl) {
        return cached->settings;
    }

    try {
        auto store = store_;
        const auto loaded = executor_->run_bounded(
            [store, organization_id] { return store->get_settings(organization_id); },
            config_.load_timeout);
        const OrgSecuritySettings fresh = loaded.value_or(defaults_for(organization_id));
        install(fresh);
        return fresh;
    } catch (const SecurityError& e) {
        load_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Settings load for org {} failed, using {} values: {}",
                                     organization_id, cached ? "cached" : "default", e.what()));
        if (cached) {
            // Keep serving the stale value; retry after another TTL
            install(cached->settings);
            return cached->settings;
        }
        return defaults_for(organization_id);
    }
}

int SettingsManager::retention_days(const std::string& organization_id) {
    return get(organization_id).audit_retention_days;
}

// ============================================================================
// Validation and serialization
// ============================================================================

std::string SettingsManager::validate(const OrgSecuritySettings& s) {
    if (s.organization_id.empty()) return "organization_id is required";
    if (s.threat_score_threshold < 1 || s.threat_score_threshold > 1000) {
        return "threat_score_threshold must be between 1 and 1000";
    }
    if (s.failed_login_threshold < 1) return "failed_login_threshold must be >= 1";
    if (s.audit_retention_days < 1 || s.audit_retention_days > 3650) {
        return "audit_retention_days must be between 1 and 3650";
    }
    if (s.password_min_length < 1 || s.password_min_length > 128) {
        return "password_min_length must be between 1 and 128";
    }
    if (s.session_timeout_minutes < 1) return "session_timeout_minutes must be >= 1";
    for (const auto& entry : s.allowed_addresses) {
        if (!IpAllowlist::is_valid_entry(entry)) {
            return std::format("invalid allowlist entry '{}'", entry);
        }
    }
    return {};
}

glz::json_t SettingsManager::to_json(const OrgSecuritySettings& s) {
    glz::json_t j;
    j["organization_id"] = s.organization_id;
    j["enforce_mfa"] = s.enforce_mfa;
    j["threat_detection_enabled"] = s.threat_detection_enabled;
    j["threat_score_threshold"] = static_cast<double>(s.threat_score_threshold);
    j["failed_login_threshold"] = static_cast<double>(s.failed_login_threshold);
    j["audit_logging_enabled"] = s.audit_logging_enabled;
    j["audit_retention_days"] = static_cast<double>(s.audit_retention_days);
    j["ip_allowlist_enabled"] = s.ip_allowlist_enabled;
    glz::json_t::array_t allowed;
    for (const auto& a : s.allowed_addresses) allowed.emplace_back(a);
    j["allowed_addresses"] = std::move(allowed);
    j["allow_loopback"] = s.allow_loopback;
    j["password_min_length"] = static_cast<double>(s.password_min_length);
    j["session_timeout_minutes"] = static_cast<double>(s.session_timeout_minutes);
    return j;
}

// ============================================================================
// Writes
// ============================================================================

Result<void> SettingsManager::authorize(const Caller& caller, const std::string& organization_id,
                                        const char* operation) {
    if (caller.organization_id.empty()) {
        return Result<void>::error(ErrorCategory::VALIDATION_ERROR, "caller has no organization");
    }
    if (caller.organization_id == organization_id) {
        return Result<void>::ok();
    }

    glz::json_t meta;
    meta["operation"] = std::string(operation);
    meta["requested_organization"] = organization_id;
    auto audited = audit_->record_security_event(caller.organization_id, caller.user_id,
                                                 AuditEventType::ACCESS_DENIED, Severity::HIGH,
                                                 "cross-tenant settings change rejected",
                                                 caller.source_address, std::move(meta));
    if (audited.is_error()) {
        utils::log::warn("Cross-tenant settings change could not be recorded");
    }
    return Result<void>::error(ErrorCategory::AUTHORIZATION_FAILURE,
                               "settings of another organization are not accessible");
}

Result<OrgSecuritySettings> SettingsManager::load(const Caller& caller) {
    if (caller.organization_id.empty()) {
        return Result<OrgSecuritySettings>::error(ErrorCategory::VALIDATION_ERROR,
                                                  "caller has no organization");
    }
    try {
        auto store = store_;
        const auto org = caller.organization_id;
        const auto loaded = executor_->run_bounded(
            [store, org] { return store->get_settings(org); }, config_.write_timeout);
        const OrgSecuritySettings result = loaded.value_or(defaults_for(org));
        install(result);
        return Result<OrgSecuritySettings>::ok(result);
    } catch (const SecurityError& e) {
        return Result<OrgSecuritySettings>::from_exception(e);
    }
}

Result<OrgSecuritySettings> SettingsManager::modify(
    const Caller& caller, const char* operation,
    const std::function<Result<void>(OrgSecuritySettings&)>& mutate) {
    if (caller.organization_id.empty()) {
        return Result<OrgSecuritySettings>::error(ErrorCategory::VALIDATION_ERROR,
                                                  "caller has no organization");
    }

    std::lock_guard write_lock(write_mutex_);
    const std::string org = caller.organization_id;
    auto store = store_;

    OrgSecuritySettings before;
    try {
        before = executor_->run_bounded([store, org] { return store->get_settings(org); },
                                        config_.write_timeout)
                     .value_or(defaults_for(org));
    } catch (const SecurityError& e) {
        return Result<OrgSecuritySettings>::from_exception(e);
    }

    OrgSecuritySettings after = before;
    if (auto applied = mutate(after); applied.is_error()) {
        return Result<OrgSecuritySettings>::error(applied.error_category(), applied.error_message());
    }
    after.organization_id = org;

    if (const auto invalid = validate(after); !invalid.empty()) {
        return Result<OrgSecuritySettings>::error(ErrorCategory::VALIDATION_ERROR, invalid);
    }

    try {
        executor_->run_bounded([store, after] { store->put_settings(after); }, config_.write_timeout);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Settings update for org {} not persisted: {}", org, e.what()));
        return Result<OrgSecuritySettings>::from_exception(e);
    }
    install(after);

    AuditEvent changed;
    changed.organization_id = org;
    changed.actor_user_id = caller.user_id;
    changed.event_type = AuditEventType::SETTINGS_CHANGED;
    changed.severity = Severity::MEDIUM;
    changed.resource_type = "organization_settings";
    changed.resource_id = org;
    changed.action = operation;
    changed.source_address = caller.source_address;
    glz::json_t diff;
    diff["before"] = to_json(before);
    diff["after"] = to_json(after);
    changed.changes = std::move(diff);

    auto audited = audit_->record(std::move(changed));
    if (audited.is_error()) {
        return Result<OrgSecuritySettings>::error(audited.error_category(),
            std::format("settings saved but not audited: {}", audited.error_message()));
    }

    if (before.audit_retention_days != after.audit_retention_days) {
        glz::json_t meta;
        meta["previous_days"] = static_cast<double>(before.audit_retention_days);
        meta["new_days"] = static_cast<double>(after.audit_retention_days);
        auto retention = audit_->record_security_event(
            org, caller.user_id, AuditEventType::RETENTION_CHANGED, Severity::MEDIUM,
            std::format("audit retention changed from {} to {} days",
                        before.audit_retention_days, after.audit_retention_days),
            caller.source_address, std::move(meta));
        if (retention.is_error()) {
            return Result<OrgSecuritySettings>::error(retention.error_category(),
                std::format("retention saved but not audited: {}", retention.error_message()));
        }
    }

    utils::log::info(std::format("Settings for org {} updated ({})", org, operation));
    return Result<OrgSecuritySettings>::ok(std::move(after));
}

Result<OrgSecuritySettings> SettingsManager::update(const Caller& caller,
                                                    const OrgSecuritySettings& settings) {
    if (auto auth = authorize(caller, settings.organization_id, "update_settings"); auth.is_error()) {
        return Result<OrgSecuritySettings>::error(auth.error_category(), auth.error_message());
    }
    return modify(caller, "update_settings", [&settings](OrgSecuritySettings& s) {
        s = settings;
        return Result<void>::ok();
    });
}

Result<OrgSecuritySettings> SettingsManager::add_allowed_address(const Caller& caller,
                                                                 const std::string& entry) {
    const std::string trimmed = utils::trim(entry);
    if (!IpAllowlist::is_valid_entry(trimmed)) {
        return Result<OrgSecuritySettings>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("invalid allowlist entry '{}'", entry));
    }
    return modify(caller, "add_allowed_address", [&trimmed](OrgSecuritySettings& s) {
        if (std::find(s.allowed_addresses.begin(), s.allowed_addresses.end(), trimmed) ==
            s.allowed_addresses.end()) {
            s.allowed_addresses.push_back(trimmed);
        }
        return Result<void>::ok();
    });
}

Result<OrgSecuritySettings> SettingsManager::remove_allowed_address(const Caller& caller,
                                                                    const std::string& entry) {
    const std::string trimmed = utils::trim(entry);
    return modify(caller, "remove_allowed_address", [&trimmed](OrgSecuritySettings& s) {
        const auto removed = std::erase(s.allowed_addresses, trimmed);
        if (removed == 0) {
            return Result<void>::error(ErrorCategory::NOT_FOUND,
                std::format("'{}' is not on the allowlist", trimmed));
        }
        return Result<void>::ok();
    });
}

Result<OrgSecuritySettings> SettingsManager::set_allowlist_enabled(const Caller& caller, bool enabled) {
    return modify(caller, enabled ? "enable_allowlist" : "disable_allowlist",
                  [enabled](OrgSecuritySettings& s) {
                      s.ip_allowlist_enabled = enabled;
                      return Result<void>::ok();
                  });
}

Result<OrgSecuritySettings> SettingsManager::set_retention_days(const Caller& caller, int days) {
    return modify(caller, "set_retention_days", [days](OrgSecuritySettings& s) {
        s.audit_retention_days = days;
        return Result<void>::ok();
    });
}

} // namespace secplane
