#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>

namespace secplane {

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t connections_discarded = 0;
};

/**
 * @brief Bounded pool of store connections
 *
 * At most max_connections are checked out at once (counting_semaphore).
 * Connections are created lazily through the factory and reused from an
 * idle deque. A connection that reports !is_connected() when it comes
 * back is closed and dropped, so the next acquire opens a fresh one.
 *
 * Conn must provide is_connected() and close().
 */
template<typename Conn>
class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<Conn>()>;

    /// RAII handle; returns the connection to the pool on destruction
    class Lease {
    public:
        using ReturnFunc = std::function<void(std::unique_ptr<Conn>)>;

        Lease(std::unique_ptr<Conn> conn, ReturnFunc return_fn)
            : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

        ~Lease() {
            if (conn_ && return_fn_) {
                return_fn_(std::move(conn_));
            }
        }

        Lease(Lease&& other) noexcept
            : conn_(std::move(other.conn_)), return_fn_(std::move(other.return_fn_)) {}

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                if (conn_ && return_fn_) {
                    return_fn_(std::move(conn_));
                }
                conn_ = std::move(other.conn_);
                return_fn_ = std::move(other.return_fn_);
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Conn& operator*() const { return *conn_; }
        Conn* operator->() const { return conn_.get(); }

    private:
        std::unique_ptr<Conn> conn_;
        ReturnFunc return_fn_;
    };

    ConnectionPool(std::string name, size_t max_connections, Factory factory)
        : name_(std::move(name)),
          max_connections_(max_connections > 0 ? max_connections : 1),
          factory_(std::move(factory)),
          semaphore_(static_cast<std::ptrdiff_t>(max_connections_)) {}

    ~ConnectionPool() { drain(); }

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Check out a connection, waiting up to timeout for a free slot
     * @throws SecurityError(PERSISTENCE_UNAVAILABLE) when the pool is exhausted,
     *         drained, or the factory cannot open a connection
     */
    [[nodiscard]] Lease acquire(std::chrono::milliseconds timeout) {
        if (shutdown_.load(std::memory_order_acquire)) {
            throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                                std::format("connection pool '{}' is drained", name_));
        }

        if (!semaphore_.try_acquire_for(timeout)) {
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                std::format("connection pool '{}' exhausted ({} in use) after {}ms",
                            name_, max_connections_, timeout.count()));
        }

        std::unique_ptr<Conn> conn;
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty()) {
                conn = std::move(idle_.front());
                idle_.pop_front();
            }
        }

        if (!conn) {
            try {
                conn = factory_();
            } catch (const SecurityError&) {
                semaphore_.release();
                failed_acquires_.fetch_add(1, std::memory_order_relaxed);
                throw;
            }
            if (!conn) {
                semaphore_.release();
                failed_acquires_.fetch_add(1, std::memory_order_relaxed);
                throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                    std::format("connection pool '{}' could not open a connection", name_));
            }
            total_connections_.fetch_add(1, std::memory_order_relaxed);
        }

        total_acquires_.fetch_add(1, std::memory_order_relaxed);
        return Lease(std::move(conn), [this](std::unique_ptr<Conn> c) {
            return_connection(std::move(c));
        });
    }

    [[nodiscard]] PoolStats get_stats() const {
        std::lock_guard lock(mutex_);
        PoolStats stats;
        stats.total_connections = total_connections_.load(std::memory_order_relaxed);
        stats.idle_connections = idle_.size();
        stats.active_connections = stats.total_connections - stats.idle_connections;
        stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
        stats.total_releases = total_releases_.load(std::memory_order_relaxed);
        stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
        stats.connections_discarded = discarded_.load(std::memory_order_relaxed);
        return stats;
    }

    /// Close idle connections; connections still checked out close on return
    void drain() {
        shutdown_.store(true, std::memory_order_release);
        std::lock_guard lock(mutex_);
        for (auto& conn : idle_) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
        idle_.clear();
    }

    [[nodiscard]] size_t max_connections() const { return max_connections_; }
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void return_connection(std::unique_ptr<Conn> conn) {
        total_releases_.fetch_add(1, std::memory_order_relaxed);

        if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
            if (!shutdown_.load(std::memory_order_acquire)) {
                discarded_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("Connection pool '{}': dropped broken connection", name_));
            }
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
            semaphore_.release();
            return;
        }

        {
            std::lock_guard lock(mutex_);
            idle_.emplace_back(std::move(conn));
        }
        semaphore_.release();
    }

    std::string name_;
    size_t max_connections_;
    Factory factory_;

    std::deque<std::unique_ptr<Conn>> idle_;
    mutable std::mutex mutex_;
    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> discarded_{0};
    std::atomic<bool> shutdown_{false};
};

} // namespace secplane
