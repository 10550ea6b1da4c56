#pragma once

#include "audit/alert_notifier.hpp"
#include "audit/audit_event.hpp"
#include "core/error.hpp"
#include "core/task_executor.hpp"
#include "core/types.hpp"
#include "db/isecurity_store.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace secplane {

/**
 * @brief Append-only, tenant-scoped audit trail
 *
 * record():
 *   1. Stamps id / timestamp and links the event into its organization's
 *      hash chain. Writes of one organization are serialized so the chain
 *      head only moves past rows the store accepted; a rejected insert
 *      rolls the head back. Waiting for the organization's turn is bounded
 *      by write_timeout.
 *   2. Persists the row through the TaskExecutor with a bounded wait.
 *   3. For CRITICAL events, queues alert delivery on a dedicated alert
 *      worker and waits at most alert_timeout for the outcome. Delivery
 *      continues in the background after that. Alert failure is logged
 *      and counted and never fails the write.
 *
 * Persistence runs on a worker with a copy of the event, so a write the
 * caller stopped waiting for still lands; the head stays advanced for it.
 */
class AuditLogService {
public:
    struct Config {
        std::chrono::milliseconds write_timeout{2000};
        std::chrono::milliseconds alert_timeout{250};     // Caller's wait on alert delivery
        int default_retention_days = 365;
    };

    /// Retention in days for an organization (settings lookup injected by the owner)
    using RetentionLookup = std::function<int(const std::string& organization_id)>;

    struct ChainVerification {
        bool intact = true;
        uint64_t events_checked = 0;
        std::optional<uint64_t> first_broken_sequence;
        std::string detail;
    };

    AuditLogService(std::shared_ptr<ISecurityStore> store,
                    std::shared_ptr<TaskExecutor> executor,
                    std::shared_ptr<IAlertNotifier> notifier,
                    const Config& config);
    ~AuditLogService();

    AuditLogService(const AuditLogService&) = delete;
    AuditLogService& operator=(const AuditLogService&) = delete;

    /// @return the stored event (id, timestamp and chain fields filled in)
    [[nodiscard]] Result<AuditEvent> record(AuditEvent event);

    /**
     * @brief Filtered, paginated read, newest first
     *
     * A filter naming another organization than the caller's is rejected
     * with AUTHORIZATION_FAILURE and recorded as a HIGH ACCESS_DENIED event.
     */
    [[nodiscard]] Result<AuditPage> query(const Caller& caller,
                                          const AuditFilter& filter,
                                          const Pagination& pagination);

    // ---- Convenience recorders ---------------------------------------------

    /// LOW on success, MEDIUM on failure
    [[nodiscard]] Result<AuditEvent> record_auth_event(const std::string& organization_id,
                                                       const std::optional<std::string>& user_id,
                                                       AuditEventType type,
                                                       bool success,
                                                       const std::string& source_address,
                                                       const std::string& user_agent,
                                                       glz::json_t metadata = {});

    /// HIGH for deletes, LOW otherwise
    [[nodiscard]] Result<AuditEvent> record_data_access(const std::string& organization_id,
                                                        const std::string& user_id,
                                                        AuditEventType type,
                                                        const std::string& resource_type,
                                                        const std::string& resource_id,
                                                        const std::string& source_address,
                                                        std::optional<glz::json_t> changes = std::nullopt);

    [[nodiscard]] Result<AuditEvent> record_security_event(const std::string& organization_id,
                                                           const std::optional<std::string>& user_id,
                                                           AuditEventType type,
                                                           Severity severity,
                                                           const std::string& action,
                                                           const std::string& source_address,
                                                           glz::json_t metadata = {});

    // ---- Retention and integrity -------------------------------------------

    /**
     * @brief Delete rows older than each organization's retention window
     *
     * An organization whose delete fails is logged and skipped.
     * @return rows deleted across all organizations
     */
    [[nodiscard]] Result<uint64_t> purge_expired(const RetentionLookup& retention_days_for);

    /// Recompute every hash of an organization's chain in sequence order
    [[nodiscard]] Result<ChainVerification> verify_chain(const std::string& organization_id);

    /// SHA-256 over sequence, previous hash and the canonical event JSON
    [[nodiscard]] static std::string compute_record_hash(const AuditEvent& event);

    void shutdown();

    struct Stats {
        uint64_t recorded = 0;
        uint64_t persist_failures = 0;
        uint64_t alerts_sent = 0;
        uint64_t alert_failures = 0;
        uint64_t rows_purged = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct ChainHead {
        uint64_t sequence = 0;
        std::string hash;
    };

    static constexpr size_t kWriteStripes = 16;

    /// Link event into its organization's chain; returns the head it replaced
    ChainHead assign_chain(AuditEvent& event);

    /// Undo assign_chain for an insert the store rejected
    void rollback_chain(const AuditEvent& event, const ChainHead& previous);

    [[nodiscard]] std::timed_mutex& write_lock_for(const std::string& organization_id);

    /// Runs on the alert worker
    void deliver_alert(const AuditEvent& event);

    /// Last persisted head of an organization, loaded once per process
    [[nodiscard]] ChainHead load_head(const std::string& organization_id);

    void dispatch_alert(const AuditEvent& event);

    std::shared_ptr<ISecurityStore> store_;
    std::shared_ptr<TaskExecutor> executor_;
    std::shared_ptr<IAlertNotifier> notifier_;
    Config config_;
    std::unique_ptr<TaskExecutor> alert_executor_;

    std::mutex chain_mutex_;
    std::unordered_map<std::string, ChainHead> heads_;
    std::array<std::timed_mutex, kWriteStripes> write_locks_;

    std::atomic<uint64_t> recorded_{0};
    std::atomic<uint64_t> persist_failures_{0};
    std::atomic<uint64_t> alerts_sent_{0};
    std::atomic<uint64_t> alert_failures_{0};
    std::atomic<uint64_t> rows_purged_{0};
};

} // namespace secplane
