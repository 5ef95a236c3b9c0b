#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace pipeguard {

class TTLCache;
class TaskManager;
class RateLimiter;

struct SweepReport {
    size_t expired_entries = 0;
    size_t removed_tasks = 0;
    size_t idle_clients = 0;
};

// Periodic cleanup owned by the process, independent of any request.
// Runs its loop in a background thread.
class Janitor {
public:
    Janitor(TTLCache& cache, TaskManager& tasks, RateLimiter& limiter,
            std::chrono::milliseconds interval, uint32_t max_task_age_minutes);
    ~Janitor();

    Janitor(const Janitor&) = delete;
    Janitor& operator=(const Janitor&) = delete;

    // One sweep on the calling thread.
    SweepReport run_once();

    // Start the background thread. No-op if already running.
    void start();

    // Signal the thread to stop and join it. No-op if not running.
    void stop();

    bool running() const;
    uint64_t sweeps() const;

private:
    void loop();

    TTLCache& cache_;
    TaskManager& tasks_;
    RateLimiter& limiter_;
    std::chrono::milliseconds interval_;
    uint32_t max_task_age_minutes_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool running_ = false;
    uint64_t sweeps_ = 0;
    std::thread thread_;
};

} // namespace pipeguard
