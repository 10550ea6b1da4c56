#include "security/activity_tracker.hpp"

#include <algorithm>
#include <functional>
#include <mutex>

namespace secplane {

ActivityTracker::ActivityTracker(const Config& config)
    : config_(config),
      shards_(std::max<size_t>(config.shard_count, 1)) {}

ActivityTracker::Shard& ActivityTracker::shard_for(const std::string& identity) {
    return shards_[std::hash<std::string>{}(identity) % shards_.size()];
}

const ActivityTracker::Shard& ActivityTracker::shard_for(const std::string& identity) const {
    return shards_[std::hash<std::string>{}(identity) % shards_.size()];
}

ActivityTracker::Snapshot ActivityTracker::update(const std::string& identity,
                                                  const std::string& address,
                                                  bool count_request, bool failed_login,
                                                  std::chrono::system_clock::time_point now) {
    // Periodic eviction: every 10000 updates, clean elapsed windows
    if (update_counter_.fetch_add(1, std::memory_order_relaxed) % 10000 == 9999) {
        evict_expired(now);
    }

    auto& shard = shard_for(identity);
    std::unique_lock lock(shard.mutex);

    const size_t per_shard_cap = std::max<size_t>(config_.max_tracked_identities / shards_.size(), 1);
    auto it = shard.windows.find(identity);
    if (it == shard.windows.end()) {
        if (shard.windows.size() >= per_shard_cap) {
            // Over capacity: drop the stalest window in this shard
            const auto oldest = std::min_element(shard.windows.begin(), shard.windows.end(),
                [](const auto& a, const auto& b) {
                    return a.second.last_activity < b.second.last_activity;
                });
            shard.windows.erase(oldest);
        }
        it = shard.windows.emplace(identity, Window{}).first;
        it->second.window_start = now;
    }

    auto& w = it->second;
    if (elapsed(w, now)) {
        w = Window{};
        w.window_start = now;
    }

    if (count_request) ++w.request_count;
    if (failed_login) ++w.failed_logins;
    if (!address.empty()) w.addresses.insert(address);
    w.last_activity = now;

    return snapshot_of(w);
}

ActivityTracker::Snapshot ActivityTracker::record_request(const std::string& identity,
                                                          const std::string& address,
                                                          bool failed_login,
                                                          std::chrono::system_clock::time_point now) {
    return update(identity, address, true, failed_login, now);
}

ActivityTracker::Snapshot ActivityTracker::record_failed_login(const std::string& identity,
                                                               const std::string& address,
                                                               std::chrono::system_clock::time_point now) {
    return update(identity, address, false, true, now);
}

ActivityTracker::Snapshot ActivityTracker::get(const std::string& identity,
                                               std::chrono::system_clock::time_point now) const {
    const auto& shard = shard_for(identity);
    std::shared_lock lock(shard.mutex);
    const auto it = shard.windows.find(identity);
    if (it == shard.windows.end() || elapsed(it->second, now)) {
        return {};
    }
    return snapshot_of(it->second);
}

void ActivityTracker::clear() {
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        shard.windows.clear();
    }
}

size_t ActivityTracker::evict_expired(std::chrono::system_clock::time_point now) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        removed += static_cast<size_t>(std::erase_if(shard.windows,
            [this, now](const auto& kv) { return elapsed(kv.second, now); }));
    }
    return removed;
}

size_t ActivityTracker::tracked_identities() const {
    size_t count = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        count += shard.windows.size();
    }
    return count;
}

} // namespace secplane
