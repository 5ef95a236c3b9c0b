#pragma once
#include "../clock.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <list>
#include <unordered_map>
#include <functional>
#include <future>
#include <mutex>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace pipeguard {

struct CacheEntry {
    nlohmann::json value;
    double expires_at = 0;
    double created_at = 0;
    uint64_t hits = 0;
};

struct CacheStats {
    size_t size = 0;
    size_t max_size = 0;
    double utilization = 0;   // percent
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t total_requests = 0;
    double hit_rate = 0;      // percent
    size_t in_flight = 0;
};

nlohmann::json cache_stats_to_json(const CacheStats& stats);

// Bounded in-memory cache with per-entry TTL and LRU eviction.
// One mutex guards the whole instance; compute functions run unlocked.
class TTLCache {
public:
    using ComputeFn = std::function<nlohmann::json()>;

    // coalesce_misses: concurrent get_or_compute misses on the same key share
    // one compute call instead of each running their own.
    TTLCache(size_t max_size = 1000, uint32_t default_ttl = 3600,
             bool coalesce_misses = true, Clock& clock = default_clock());

    TTLCache(const TTLCache&) = delete;
    TTLCache& operator=(const TTLCache&) = delete;

    // Returns nullopt on miss or expiry. A hit becomes most recently used.
    std::optional<nlohmann::json> get(const std::string& key);

    // ttl_seconds == 0 selects the default TTL.
    void set(const std::string& key, nlohmann::json value, uint32_t ttl_seconds = 0);

    nlohmann::json get_or_compute(const std::string& key, const ComputeFn& compute,
                                  uint32_t ttl_seconds = 0);

    bool erase(const std::string& key);

    // Drops all entries and resets hit/miss counters.
    void clear();

    // Removes every expired entry. Returns the number removed.
    size_t cleanup_expired();

    CacheStats get_stats() const;

    // Does not touch LRU order or counters.
    bool contains(const std::string& key) const;

    size_t size() const;
    size_t max_size() const { return max_size_; }
    uint32_t default_ttl() const { return default_ttl_; }

private:
    struct Slot {
        CacheEntry entry;
        std::list<std::string>::iterator lru_pos;
    };

    // Must be called with mutex_ already held.
    std::optional<nlohmann::json> lookup_locked(const std::string& key);
    void insert_locked(const std::string& key, nlohmann::json value, uint32_t ttl_seconds);
    void remove_locked(std::unordered_map<std::string, Slot>::iterator it);

    size_t max_size_;
    uint32_t default_ttl_;
    bool coalesce_misses_;
    Clock& clock_;

    std::unordered_map<std::string, Slot> entries_;
    std::list<std::string> lru_; // front = least recently used
    std::unordered_map<std::string, std::shared_future<nlohmann::json>> in_flight_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace pipeguard
