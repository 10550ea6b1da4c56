#pragma once

#include "audit/audit_log_service.hpp"
#include "core/error.hpp"
#include "core/task_executor.hpp"
#include "db/isecurity_store.hpp"
#include "security/blocked_address.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace secplane {

/**
 * @brief Shared denylist of source addresses
 *
 * The in-memory set is the source of truth for request-time checks and is
 * split into shards, each behind its own shared_mutex, so is_blocked()
 * never serializes unrelated requests. Writes land in memory first, then
 * in the store (bounded wait), then in the audit log.
 *
 * Expired entries stop matching immediately and are removed from memory
 * and storage by sweep_expired().
 */
class IpDenylist {
public:
    struct Config {
        size_t shard_count = 16;
        std::chrono::milliseconds store_timeout{2000};
    };

    struct BlockRequest {
        std::string address;
        std::string reason;
        std::optional<std::string> blocked_by;      // Empty for automatic blocks
        std::optional<std::chrono::seconds> ttl;    // Empty = indefinite
        bool automatic = false;
        std::string organization_id;                // Organization the audit event belongs to
        std::string source_address;                 // Where the action came from
        glz::json_t metadata;                       // Extra audit context (score, reasons)
    };

    IpDenylist(std::shared_ptr<ISecurityStore> store,
               std::shared_ptr<TaskExecutor> executor,
               std::shared_ptr<AuditLogService> audit,
               const Config& config);

    /// Load every non-expired row from storage. Called once at startup.
    [[nodiscard]] Result<size_t> hydrate();

    /// Hot path: O(1) average, shared lock on one shard
    [[nodiscard]] bool is_blocked(std::string_view address) const;

    [[nodiscard]] std::optional<BlockedAddress> find(std::string_view address) const;

    /**
     * @brief Block or re-block an address (idempotent)
     *
     * Re-blocking updates reason and expiry. The block is active in memory
     * even when persistence or auditing fails; that failure is returned.
     */
    [[nodiscard]] Result<BlockedAddress> block(const BlockRequest& request);

    /// @return true if the address was blocked in memory or in storage
    [[nodiscard]] Result<bool> unblock(const std::string& address,
                                       const std::optional<std::string>& actor,
                                       const std::string& organization_id,
                                       const std::string& source_address);

    /// Active (non-expired) entries, most recent first
    [[nodiscard]] std::vector<BlockedAddress> list_blocked() const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Drop expired entries from memory and storage
     *
     * A row whose delete fails is logged and left for the next sweep.
     * @return rows removed from storage
     */
    [[nodiscard]] Result<size_t> sweep_expired();

    struct Stats {
        uint64_t checks = 0;
        uint64_t hits = 0;
        uint64_t blocks = 0;
        uint64_t unblocks = 0;
        uint64_t expired_removed = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, BlockedAddress> entries;
    };

    [[nodiscard]] Shard& shard_for(std::string_view address);
    [[nodiscard]] const Shard& shard_for(std::string_view address) const;

    /// Returns false if the entry was not present
    bool erase_from_memory(const std::string& address);

    std::shared_ptr<ISecurityStore> store_;
    std::shared_ptr<TaskExecutor> executor_;
    std::shared_ptr<AuditLogService> audit_;
    Config config_;

    std::vector<Shard> shards_;

    mutable std::atomic<uint64_t> checks_{0};
    mutable std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> blocks_{0};
    std::atomic<uint64_t> unblocks_{0};
    std::atomic<uint64_t> expired_removed_{0};
};

} // namespace secplane
