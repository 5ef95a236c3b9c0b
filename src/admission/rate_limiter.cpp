#include "rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace pipeguard {

nlohmann::json rate_limit_to_json(const RateLimitInfo& info) {
    nlohmann::json j = {
        {"allowed",   info.allowed},
        {"limit",     info.limit},
        {"remaining", info.remaining}
    };
    if (info.allowed) {
        j["reset"] = info.reset;
    } else {
        j["retry_after"] = info.retry_after;
    }
    return j;
}

nlohmann::json rate_limiter_stats_to_json(const RateLimiterStats& stats) {
    return {
        {"active_clients",             stats.active_clients},
        {"total_requests_last_window", stats.total_requests_last_window},
        {"requests_per_window_limit",  stats.requests_per_window_limit},
        {"window_seconds",             stats.window_seconds},
        {"tracked_clients",            stats.tracked_clients}
    };
}

RateLimiter::RateLimiter(uint32_t requests_per_window, uint32_t window_seconds, Clock& clock)
    : limit_(requests_per_window), window_seconds_(window_seconds), clock_(clock) {
    if (limit_ == 0) {
        throw std::invalid_argument("RateLimiter requires a limit > 0");
    }
    if (window_seconds_ == 0) {
        throw std::invalid_argument("RateLimiter requires window_seconds > 0");
    }
}

void RateLimiter::prune_locked(std::deque<double>& timestamps, double cutoff) const {
    while (!timestamps.empty() && timestamps.front() <= cutoff) {
        timestamps.pop_front();
    }
}

size_t RateLimiter::count_recent(const std::deque<double>& timestamps, double cutoff) const {
    return static_cast<size_t>(std::count_if(timestamps.begin(), timestamps.end(),
        [cutoff](double t) { return t > cutoff; }));
}

RateLimitInfo RateLimiter::check_rate_limit(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    double now = clock_.now();
    double cutoff = now - window_seconds_;

    auto& timestamps = requests_[client_id];
    prune_locked(timestamps, cutoff);

    RateLimitInfo info;
    info.limit = limit_;

    if (timestamps.size() >= limit_) {
        info.allowed = false;
        info.remaining = 0;
        info.retry_after = static_cast<uint32_t>(std::ceil(timestamps.front() - cutoff));
        std::cerr << "[rate_limit] Client " << client_id << " denied, retry after "
                  << info.retry_after << "s\n";
        return info;
    }

    timestamps.push_back(now);
    info.allowed = true;
    info.remaining = limit_ - static_cast<uint32_t>(timestamps.size());
    info.reset = static_cast<uint32_t>(std::ceil(timestamps.front() - cutoff));
    return info;
}

uint32_t RateLimiter::get_remaining(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(client_id);
    if (it == requests_.end()) return limit_;

    size_t recent = count_recent(it->second, clock_.now() - window_seconds_);
    return recent >= limit_ ? 0 : limit_ - static_cast<uint32_t>(recent);
}

RateLimiterStats RateLimiter::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double cutoff = clock_.now() - window_seconds_;

    RateLimiterStats stats;
    stats.requests_per_window_limit = limit_;
    stats.window_seconds = window_seconds_;
    stats.tracked_clients = requests_.size();
    for (const auto& [client, timestamps] : requests_) {
        size_t recent = count_recent(timestamps, cutoff);
        if (recent > 0) {
            stats.active_clients++;
            stats.total_requests_last_window += recent;
        }
    }
    return stats;
}

void RateLimiter::reset_client(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.erase(client_id);
}

size_t RateLimiter::purge_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    double cutoff = clock_.now() - window_seconds_;

    size_t dropped = 0;
    for (auto it = requests_.begin(); it != requests_.end(); ) {
        prune_locked(it->second, cutoff);
        if (it->second.empty()) {
            it = requests_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    return dropped;
}

} // namespace pipeguard
