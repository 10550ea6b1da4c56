#include "core/task_executor.hpp"
#include "core/utils.hpp"

namespace secplane {

TaskExecutor::TaskExecutor(const Config& config)
    : config_(config) {
    const size_t count = config_.worker_count > 0 ? config_.worker_count : 1;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

bool TaskExecutor::enqueue(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return false;
        if (queue_.size() >= config_.max_queue_depth) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                std::format("storage queue full ({} pending)", queue_.size()));
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void TaskExecutor::submit(std::function<void()> task) {
    if (!enqueue(task)) {
        task();
    }
}

void TaskExecutor::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

TaskExecutor::Stats TaskExecutor::get_stats() const {
    Stats s;
    s.executed = executed_.load(std::memory_order_relaxed);
    s.timeouts = timeouts_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    {
        std::lock_guard lock(mutex_);
        s.queue_depth = queue_.size();
    }
    return s;
}

void TaskExecutor::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;  // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // packaged_task captures exceptions into its future; plain submit()
        // tasks report their own failure.
        try {
            task();
        } catch (const std::exception& e) {
            utils::log::error(std::format("TaskExecutor: task failed: {}", e.what()));
        }
        executed_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace secplane
