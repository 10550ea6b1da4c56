#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace secplane {

/**
 * @brief Rolling per-identity activity window
 *
 * Counts requests, failed logins and distinct source addresses per
 * identity over a window (one hour by default) that restarts when it
 * elapses. Sharded by identity; each shard has its own lock, held only
 * for the map update. Never persisted.
 */
class ActivityTracker {
public:
    struct Config {
        std::chrono::seconds window{3600};
        size_t shard_count = 32;
        size_t max_tracked_identities = 100000;     // Cap to prevent memory exhaustion
    };

    /// Counters as seen after the update that produced them
    struct Snapshot {
        uint64_t request_count = 0;
        uint64_t failed_logins = 0;
        size_t distinct_addresses = 0;
    };

    ActivityTracker() : ActivityTracker(Config{}) {}
    explicit ActivityTracker(const Config& config);

    /// Count one request from identity at address
    Snapshot record_request(const std::string& identity, const std::string& address,
                            bool failed_login = false,
                            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Count a failed login without counting a request
    Snapshot record_failed_login(const std::string& identity, const std::string& address,
                                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] Snapshot get(const std::string& identity,
                               std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /// Drop every window
    void clear();

    /// Drop windows that elapsed; returns how many were removed
    size_t evict_expired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] size_t tracked_identities() const;

private:
    struct Window {
        std::chrono::system_clock::time_point window_start{};
        std::chrono::system_clock::time_point last_activity{};
        uint64_t request_count = 0;
        uint64_t failed_logins = 0;
        std::unordered_set<std::string> addresses;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Window> windows;
    };

    Snapshot update(const std::string& identity, const std::string& address,
                    bool count_request, bool failed_login,
                    std::chrono::system_clock::time_point now);

    [[nodiscard]] bool elapsed(const Window& w, std::chrono::system_clock::time_point now) const {
        return now - w.window_start >= config_.window;
    }

    [[nodiscard]] static Snapshot snapshot_of(const Window& w) {
        return {w.request_count, w.failed_logins, w.addresses.size()};
    }

    [[nodiscard]] Shard& shard_for(const std::string& identity);
    [[nodiscard]] const Shard& shard_for(const std::string& identity) const;

    Config config_;
    std::vector<Shard> shards_;
    std::atomic<uint64_t> update_counter_{0};   // Drives periodic eviction
};

} // namespace secplane
