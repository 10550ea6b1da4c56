#include "core/periodic_task.hpp"
#include "core/utils.hpp"

#include <format>

namespace secplane {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           std::function<void()> job)
    : name_(std::move(name)),
      interval_(interval),
      job_(std::move(job)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    thread_ = std::thread(&PeriodicTask::loop, this);
    utils::log::info(std::format("{}: running every {}ms", name_, interval_.count()));
}

void PeriodicTask::stop() {
    {
        std::lock_guard lock(cv_mutex_);
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) return;
    }
    cv_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void PeriodicTask::loop() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, interval_, [this] {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) break;

        try {
            job_();
        } catch (const std::exception& e) {
            failure_count_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("{}: run failed: {}", name_, e.what()));
        }
        run_count_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace secplane
