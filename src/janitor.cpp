#include "janitor.hpp"
#include "cache/ttl_cache.hpp"
#include "tasks/task_manager.hpp"
#include "admission/rate_limiter.hpp"
#include <iostream>
#include <stdexcept>

namespace pipeguard {

Janitor::Janitor(TTLCache& cache, TaskManager& tasks, RateLimiter& limiter,
                 std::chrono::milliseconds interval, uint32_t max_task_age_minutes)
    : cache_(cache), tasks_(tasks), limiter_(limiter),
      interval_(interval), max_task_age_minutes_(max_task_age_minutes) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Janitor requires an interval > 0");
    }
}

Janitor::~Janitor() {
    stop();
}

SweepReport Janitor::run_once() {
    SweepReport report;
    report.expired_entries = cache_.cleanup_expired();
    report.removed_tasks = tasks_.cleanup_old_tasks(max_task_age_minutes_);
    report.idle_clients = limiter_.purge_idle();

    std::lock_guard<std::mutex> lock(mutex_);
    sweeps_++;
    return report;
}

void Janitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    stop_requested_ = false;
    running_ = true;
    thread_ = std::thread([this]() { loop(); });
}

void Janitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

bool Janitor::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

uint64_t Janitor::sweeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweeps_;
}

void Janitor::loop() {
    std::cerr << "[janitor] Started, sweeping every " << interval_.count() << "ms\n";
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;
        }
        try {
            run_once();
        } catch (const std::exception& e) {
            std::cerr << "[janitor] Sweep failed: " << e.what() << "\n";
        }
    }
    std::cerr << "[janitor] Stopped\n";
}

} // namespace pipeguard
