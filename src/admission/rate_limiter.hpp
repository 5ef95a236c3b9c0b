#pragma once
#include "../clock.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <deque>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include <cstddef>

namespace pipeguard {

struct RateLimitInfo {
    bool allowed = false;
    uint32_t limit = 0;
    uint32_t remaining = 0;
    uint32_t retry_after = 0; // seconds, set on denial
    uint32_t reset = 0;       // seconds until the oldest slot frees, set on admission
};

nlohmann::json rate_limit_to_json(const RateLimitInfo& info);

struct RateLimiterStats {
    size_t active_clients = 0;
    size_t total_requests_last_window = 0;
    uint32_t requests_per_window_limit = 0;
    uint32_t window_seconds = 0;
    size_t tracked_clients = 0;
};

nlohmann::json rate_limiter_stats_to_json(const RateLimiterStats& stats);

// Per-client sliding-window admission control. Each client keeps the
// timestamps of its admitted requests; entries older than the window are
// pruned lazily when that client is next checked.
class RateLimiter {
public:
    explicit RateLimiter(uint32_t requests_per_window = 10, uint32_t window_seconds = 60,
                         Clock& clock = default_clock());

    // Admits and records the request, or denies it with retry_after.
    RateLimitInfo check_rate_limit(const std::string& client_id);

    // Remaining admissions in the current window. Does not record anything.
    uint32_t get_remaining(const std::string& client_id) const;

    RateLimiterStats get_stats() const;

    void reset_client(const std::string& client_id);

    // Drop clients with no timestamps left in the window. Returns count dropped.
    size_t purge_idle();

    uint32_t limit() const { return limit_; }

private:
    // Must be called with mutex_ already held.
    void prune_locked(std::deque<double>& timestamps, double cutoff) const;
    size_t count_recent(const std::deque<double>& timestamps, double cutoff) const;

    uint32_t limit_;
    uint32_t window_seconds_;
    Clock& clock_;
    std::unordered_map<std::string, std::deque<double>> requests_;
    mutable std::mutex mutex_;
};

} // namespace pipeguard
