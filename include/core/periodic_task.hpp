#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace secplane {

/**
 * @brief Background thread that runs a job on a fixed interval
 *
 * Used for the denylist expiry sweep and the audit retention purge.
 * A job that throws is logged and retried on the next tick.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name,
                 std::chrono::milliseconds interval,
                 std::function<void()> job);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t run_count() const {
        return run_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t failure_count() const {
        return failure_count_.load(std::memory_order_relaxed);
    }

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> job_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> run_count_{0};
    std::atomic<uint64_t> failure_count_{0};
};

} // namespace secplane
