#include "security/ip_denylist.hpp"
#include "core/utils.hpp"
#include "security/ip_allowlist.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <mutex>

namespace secplane {

namespace {

bool is_valid_address(std::string_view address) {
    // Single addresses only; ranges belong in the allowlist
    return address.find('/') == std::string_view::npos && IpAllowlist::is_valid_entry(address);
}

} // anonymous namespace

IpDenylist::IpDenylist(std::shared_ptr<ISecurityStore> store,
                       std::shared_ptr<TaskExecutor> executor,
                       std::shared_ptr<AuditLogService> audit,
                       const Config& config)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      audit_(std::move(audit)),
      config_(config),
      shards_(std::max<size_t>(config.shard_count, 1)) {}

IpDenylist::Shard& IpDenylist::shard_for(std::string_view address) {
    return shards_[std::hash<std::string_view>{}(address) % shards_.size()];
}

const IpDenylist::Shard& IpDenylist::shard_for(std::string_view address) const {
    return shards_[std::hash<std::string_view>{}(address) % shards_.size()];
}

// ============================================================================
// Startup hydration
// ============================================================================

Result<size_t> IpDenylist::hydrate() {
    std::vector<BlockedAddress> rows;
    try {
        auto store = store_;
        const auto now = utils::now();
        rows = executor_->run_bounded([store, now] { return store->load_active_blocked(now); },
                                      config_.store_timeout);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Denylist hydration failed: {}", e.what()));
        return Result<size_t>::from_exception(e);
    }

    for (auto& row : rows) {
        auto& shard = shard_for(row.address);
        std::unique_lock lock(shard.mutex);
        const std::string key = row.address;
        shard.entries.insert_or_assign(key, std::move(row));
    }

    utils::log::info(std::format("Denylist hydrated with {} active entries", rows.size()));
    return Result<size_t>::ok(rows.size());
}

// ============================================================================
// Hot path
// ============================================================================

bool IpDenylist::is_blocked(std::string_view address) const {
    checks_.fetch_add(1, std::memory_order_relaxed);

    const auto& shard = shard_for(address);
    std::shared_lock lock(shard.mutex);
    const auto it = shard.entries.find(std::string(address));
    if (it == shard.entries.end() || it->second.is_expired(utils::now())) {
        return false;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<BlockedAddress> IpDenylist::find(std::string_view address) const {
    const auto& shard = shard_for(address);
    std::shared_lock lock(shard.mutex);
    const auto it = shard.entries.find(std::string(address));
    if (it == shard.entries.end() || it->second.is_expired(utils::now())) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Administration
// ============================================================================

Result<BlockedAddress> IpDenylist::block(const BlockRequest& request) {
    if (!is_valid_address(request.address)) {
        return Result<BlockedAddress>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("invalid address '{}'", request.address));
    }
    if (request.ttl && request.ttl->count() <= 0) {
        return Result<BlockedAddress>::error(ErrorCategory::VALIDATION_ERROR,
                                             "block ttl must be positive");
    }

    BlockedAddress row;
    row.address = request.address;
    row.reason = request.reason.empty() ? "manual block" : request.reason;
    row.blocked_by = request.blocked_by;
    row.blocked_at = std::chrono::floor<std::chrono::milliseconds>(utils::now());
    if (request.ttl) {
        row.expires_at = row.blocked_at + *request.ttl;
    }
    row.automatic = request.automatic;

    // Memory first: the next request from this address is rejected
    // regardless of how long storage takes
    {
        auto& shard = shard_for(row.address);
        std::unique_lock lock(shard.mutex);
        shard.entries.insert_or_assign(row.address, row);
    }
    blocks_.fetch_add(1, std::memory_order_relaxed);

    try {
        auto store = store_;
        executor_->run_bounded([store, row] { store->upsert_blocked(row); }, config_.store_timeout);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Denylist: block of {} not persisted: {}", row.address, e.what()));
        return Result<BlockedAddress>::from_exception(e);
    }

    glz::json_t meta = request.metadata.is_null() ? glz::json_t(glz::json_t::object_t{}) : request.metadata;
    meta["address"] = row.address;
    meta["reason"] = row.reason;
    meta["automatic"] = row.automatic;
    if (row.expires_at) {
        meta["expires_at"] = utils::format_timestamp(*row.expires_at);
    }

    auto audited = audit_->record_security_event(
        request.organization_id, request.blocked_by, AuditEventType::IP_BLOCKED,
        row.automatic ? Severity::CRITICAL : Severity::MEDIUM,
        std::format("blocked address {}", row.address),
        request.source_address.empty() ? row.address : request.source_address,
        std::move(meta));
    if (audited.is_error()) {
        return Result<BlockedAddress>::error(audited.error_category(),
            std::format("address blocked but not audited: {}", audited.error_message()));
    }

    utils::log::info(std::format("Denylist: blocked {} ({}{})", row.address,
        row.automatic ? "automatic" : "manual",
        row.expires_at ? ", expires " + utils::format_timestamp(*row.expires_at) : std::string{}));
    return Result<BlockedAddress>::ok(std::move(row));
}

bool IpDenylist::erase_from_memory(const std::string& address) {
    auto& shard = shard_for(address);
    std::unique_lock lock(shard.mutex);
    return shard.entries.erase(address) > 0;
}

Result<bool> IpDenylist::unblock(const std::string& address,
                                 const std::optional<std::string>& actor,
                                 const std::string& organization_id,
                                 const std::string& source_address) {
    if (address.empty()) {
        return Result<bool>::error(ErrorCategory::VALIDATION_ERROR, "address is required");
    }

    const bool in_memory = erase_from_memory(address);

    bool in_store = false;
    try {
        auto store = store_;
        in_store = executor_->run_bounded([store, address] { return store->remove_blocked(address); },
                                          config_.store_timeout);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Denylist: unblock of {} not persisted: {}", address, e.what()));
        return Result<bool>::from_exception(e);
    }

    const bool removed = in_memory || in_store;
    if (!removed) {
        return Result<bool>::ok(false);
    }
    unblocks_.fetch_add(1, std::memory_order_relaxed);

    glz::json_t meta;
    meta["address"] = address;
    auto audited = audit_->record_security_event(
        organization_id, actor, AuditEventType::IP_UNBLOCKED, Severity::MEDIUM,
        std::format("unblocked address {}", address),
        source_address.empty() ? address : source_address, std::move(meta));
    if (audited.is_error()) {
        return Result<bool>::error(audited.error_category(),
            std::format("address unblocked but not audited: {}", audited.error_message()));
    }

    utils::log::info(std::format("Denylist: unblocked {}", address));
    return Result<bool>::ok(true);
}

std::vector<BlockedAddress> IpDenylist::list_blocked() const {
    const auto now = utils::now();
    std::vector<BlockedAddress> result;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        for (const auto& [address, row] : shard.entries) {
            if (!row.is_expired(now)) {
                result.push_back(row);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const BlockedAddress& a, const BlockedAddress& b) {
        return a.blocked_at > b.blocked_at;
    });
    return result;
}

size_t IpDenylist::size() const {
    const auto now = utils::now();
    size_t count = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        count += static_cast<size_t>(std::count_if(shard.entries.begin(), shard.entries.end(),
            [now](const auto& kv) { return !kv.second.is_expired(now); }));
    }
    return count;
}

// ============================================================================
// Expiry sweep
// ============================================================================

Result<size_t> IpDenylist::sweep_expired() {
    const auto now = utils::now();

    // Memory: one shard at a time, unique lock held only for the erase pass
    size_t memory_removed = 0;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        memory_removed += static_cast<size_t>(std::erase_if(shard.entries,
            [now](const auto& kv) { return kv.second.is_expired(now); }));
    }

    std::vector<std::string> expired;
    auto store = store_;
    try {
        expired = executor_->run_bounded([store, now] { return store->list_expired_blocked(now); },
                                         config_.store_timeout);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Denylist sweep: cannot list expired rows: {}", e.what()));
        return Result<size_t>::from_exception(e);
    }

    size_t store_removed = 0;
    size_t skipped = 0;
    for (const auto& address : expired) {
        try {
            if (executor_->run_bounded(
                    [store, address, now] { return store->remove_expired_blocked(address, now); },
                    config_.store_timeout)) {
                ++store_removed;
            }
        } catch (const SecurityError& e) {
            ++skipped;
            utils::log::warn(std::format("Denylist sweep: skipped {}: {}", address, e.what()));
        }
    }

    expired_removed_.fetch_add(store_removed, std::memory_order_relaxed);
    if (memory_removed > 0 || store_removed > 0 || skipped > 0) {
        utils::log::info(std::format("Denylist sweep: {} in memory, {} in storage, {} skipped",
                                     memory_removed, store_removed, skipped));
    }
    return Result<size_t>::ok(store_removed);
}

IpDenylist::Stats IpDenylist::get_stats() const {
    return {
        .checks = checks_.load(std::memory_order_relaxed),
        .hits = hits_.load(std::memory_order_relaxed),
        .blocks = blocks_.load(std::memory_order_relaxed),
        .unblocks = unblocks_.load(std::memory_order_relaxed),
        .expired_removed = expired_removed_.load(std::memory_order_relaxed),
    };
}

} // namespace secplane
