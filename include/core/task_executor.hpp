#pragma once

#include "core/error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace secplane {

/**
 * @brief Fixed worker pool that gives storage calls a bounded wait
 *
 * run_bounded() hands the call to a worker and waits at most the
 * configured timeout. On timeout the caller gets PERSISTENCE_UNAVAILABLE
 * while the call itself keeps running to completion on the worker, so
 * an audit row that was slow to write is still written.
 *
 * shutdown() drains every queued task before joining the workers.
 */
class TaskExecutor {
public:
    struct Config {
        size_t worker_count = 4;
        std::chrono::milliseconds call_timeout{2000};
        size_t max_queue_depth = 10000;
    };

    TaskExecutor() : TaskExecutor(Config{}) {}
    explicit TaskExecutor(const Config& config);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /**
     * @brief Run fn on a worker, waiting at most call_timeout for its result
     * @throws SecurityError(PERSISTENCE_UNAVAILABLE) on timeout or a full queue
     * @throws whatever fn throws, once it has finished
     */
    template<typename F>
    auto run_bounded(F&& fn) -> decltype(fn()) {
        return run_bounded(std::forward<F>(fn), config_.call_timeout);
    }

    template<typename F>
    auto run_bounded(F&& fn, std::chrono::milliseconds timeout) -> decltype(fn()) {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();

        if (!enqueue([task] { (*task)(); })) {
            // Stopped executor: run on the caller thread rather than drop the call
            (*task)();
            return future.get();
        }

        if (future.wait_for(timeout) != std::future_status::ready) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                std::format("storage call exceeded {}ms", timeout.count()));
        }
        return future.get();
    }

    /// Fire-and-forget; the task still runs before shutdown() returns
    void submit(std::function<void()> task);

    /// Drain the queue and join workers. Idempotent.
    void shutdown();

    struct Stats {
        uint64_t executed = 0;
        uint64_t timeouts = 0;
        uint64_t rejected = 0;
        size_t queue_depth = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    /// Returns false when the executor is stopped. Throws when the queue is full.
    bool enqueue(std::function<void()> task);
    void worker_loop();

    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace secplane
