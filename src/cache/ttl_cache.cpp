#include "ttl_cache.hpp"
#include "../util.hpp"
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace pipeguard {

nlohmann::json cache_stats_to_json(const CacheStats& stats) {
    return {
        {"size",           stats.size},
        {"max_size",       stats.max_size},
        {"utilization",    stats.utilization},
        {"cache_hits",     stats.hits},
        {"cache_misses",   stats.misses},
        {"total_requests", stats.total_requests},
        {"hit_rate",       stats.hit_rate},
        {"in_flight",      stats.in_flight}
    };
}

TTLCache::TTLCache(size_t max_size, uint32_t default_ttl, bool coalesce_misses, Clock& clock)
    : max_size_(max_size), default_ttl_(default_ttl),
      coalesce_misses_(coalesce_misses), clock_(clock) {
    if (max_size_ == 0) {
        throw std::invalid_argument("TTLCache requires max_size > 0");
    }
    if (default_ttl_ == 0) {
        throw std::invalid_argument("TTLCache requires default_ttl > 0");
    }
}

std::optional<nlohmann::json> TTLCache::lookup_locked(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (clock_.now() >= it->second.entry.expires_at) {
        remove_locked(it);
        misses_++;
        return std::nullopt;
    }

    it->second.entry.hits++;
    hits_++;
    lru_.splice(lru_.end(), lru_, it->second.lru_pos);
    return it->second.entry.value;
}

void TTLCache::insert_locked(const std::string& key, nlohmann::json value, uint32_t ttl_seconds) {
    double now = clock_.now();
    uint32_t ttl = ttl_seconds == 0 ? default_ttl_ : ttl_seconds;

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.entry = CacheEntry{std::move(value), now + ttl, now, 0};
        lru_.splice(lru_.end(), lru_, it->second.lru_pos);
        return;
    }

    if (entries_.size() >= max_size_) {
        auto victim = entries_.find(lru_.front());
        remove_locked(victim);
    }

    lru_.push_back(key);
    Slot slot{CacheEntry{std::move(value), now + ttl, now, 0}, std::prev(lru_.end())};
    entries_.emplace(key, std::move(slot));
}

void TTLCache::remove_locked(std::unordered_map<std::string, Slot>::iterator it) {
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
}

std::optional<nlohmann::json> TTLCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked(key);
}

void TTLCache::set(const std::string& key, nlohmann::json value, uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(key, std::move(value), ttl_seconds);
}

nlohmann::json TTLCache::get_or_compute(const std::string& key, const ComputeFn& compute,
                                        uint32_t ttl_seconds) {
    if (!coalesce_misses_) {
        if (auto cached = get(key)) return *cached;
        nlohmann::json value = compute();
        set(key, value, ttl_seconds);
        return value;
    }

    std::promise<nlohmann::json> promise;
    std::shared_future<nlohmann::json> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto cached = lookup_locked(key)) return *cached;

        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            in_flight_.emplace(key, pending);
            leader = true;
        }
    }

    // Another caller is already computing this key; share its outcome.
    if (!leader) return pending.get();

    try {
        nlohmann::json value = compute();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            insert_locked(key, value, ttl_seconds);
            in_flight_.erase(key);
        }
        promise.set_value(value);
        return value;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

bool TTLCache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    remove_locked(it);
    return true;
}

void TTLCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    hits_ = 0;
    misses_ = 0;
}

size_t TTLCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    double now = clock_.now();

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now >= it->second.entry.expires_at) {
            lru_.erase(it->second.lru_pos);
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        std::cerr << "[cache] Removed " << removed << " expired entries\n";
    }
    return removed;
}

CacheStats TTLCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.size = entries_.size();
    stats.max_size = max_size_;
    stats.utilization = percent_of(entries_.size(), max_size_);
    stats.hits = hits_;
    stats.misses = misses_;
    stats.total_requests = hits_ + misses_;
    stats.hit_rate = percent_of(hits_, hits_ + misses_);
    stats.in_flight = in_flight_.size();
    return stats;
}

bool TTLCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && clock_.now() < it->second.entry.expires_at;
}

size_t TTLCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace pipeguard
