#pragma once

#include "audit/audit_log_service.hpp"
#include "core/error.hpp"
#include "core/task_executor.hpp"
#include "core/types.hpp"
#include "db/isecurity_store.hpp"
#include "tenant/security_settings.hpp"

#include <glaze/glaze.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace secplane {

/**
 * @brief Per-organization security settings with a read-mostly cache
 *
 * Readers take a shared_ptr snapshot of the whole map and look up
 * without holding the lock; writers copy, modify and swap. A missing or
 * stale entry is loaded with a bounded wait; when that load fails the
 * last known value (or the configured defaults) is served.
 *
 * Every change is persisted first, then cached, then audited as
 * SETTINGS_CHANGED (plus RETENTION_CHANGED when the retention moved).
 */
class SettingsManager {
public:
    struct Config {
        std::chrono::seconds ttl{60};
        std::chrono::milliseconds load_timeout{500};
        std::chrono::milliseconds write_timeout{2000};
        OrgSecuritySettings defaults;       // organization_id is filled per lookup
    };

    SettingsManager(std::shared_ptr<ISecurityStore> store,
                    std::shared_ptr<TaskExecutor> executor,
                    std::shared_ptr<AuditLogService> audit,
                    const Config& config);

    /// Never fails; falls back to cached or default values
    [[nodiscard]] OrgSecuritySettings get(const std::string& organization_id);

    /// Strict read for administrative callers: storage errors are returned
    [[nodiscard]] Result<OrgSecuritySettings> load(const Caller& caller);

    [[nodiscard]] Result<OrgSecuritySettings> update(const Caller& caller,
                                                     const OrgSecuritySettings& settings);

    // ---- Allowlist administration ------------------------------------------

    [[nodiscard]] Result<OrgSecuritySettings> add_allowed_address(const Caller& caller,
                                                                  const std::string& entry);
    [[nodiscard]] Result<OrgSecuritySettings> remove_allowed_address(const Caller& caller,
                                                                     const std::string& entry);
    [[nodiscard]] Result<OrgSecuritySettings> set_allowlist_enabled(const Caller& caller, bool enabled);

    [[nodiscard]] Result<OrgSecuritySettings> set_retention_days(const Caller& caller, int days);

    /// Retention for the purge job (cached value, never fails)
    [[nodiscard]] int retention_days(const std::string& organization_id);

    void invalidate(const std::string& organization_id);

    /// Error message for the first invalid field, or empty
    [[nodiscard]] static std::string validate(const OrgSecuritySettings& settings);

    [[nodiscard]] static glz::json_t to_json(const OrgSecuritySettings& settings);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Entry {
        OrgSecuritySettings settings;
        std::chrono::steady_clock::time_point loaded_at;
    };

    using EntryMap = std::unordered_map<std::string, std::shared_ptr<const Entry>>;

    [[nodiscard]] std::shared_ptr<const Entry> lookup(const std::string& organization_id) const;
    void install(const OrgSecuritySettings& settings);
    [[nodiscard]] OrgSecuritySettings defaults_for(const std::string& organization_id) const;

    /// Strict read-modify-write under write_mutex_
    [[nodiscard]] Result<OrgSecuritySettings> modify(
        const Caller& caller, const char* operation,
        const std::function<Result<void>(OrgSecuritySettings&)>& mutate);

    /// Rejects and audits a write aimed at another organization
    [[nodiscard]] Result<void> authorize(const Caller& caller, const std::string& organization_id,
                                         const char* operation);

    std::shared_ptr<ISecurityStore> store_;
    std::shared_ptr<TaskExecutor> executor_;
    std::shared_ptr<AuditLogService> audit_;
    Config config_;

    // RCU: readers get shared_ptr snapshot, writers swap entire map
    std::shared_ptr<const EntryMap> entries_;
    mutable std::shared_mutex mutex_;
    std::mutex write_mutex_;    // Serializes read-modify-write updates

    std::atomic<uint64_t> load_failures_{0};
};

} // namespace secplane
