#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace pipeguard {

struct CacheConfig {
    uint32_t max_size = 1000;
    uint32_t default_ttl = 3600;
    uint32_t plan_ttl = 3600;
    uint32_t search_ttl = 7200;
    bool coalesce_misses = true;
};

struct BreakerConfig {
    uint32_t failure_threshold = 5;
    uint32_t recovery_timeout = 60; // seconds
};

struct RetryConfig {
    uint32_t max_retries = 3;
    double initial_delay = 2.0;
    double max_delay = 10.0;
    double backoff_base = 2.0;
};

struct RateLimitConfig {
    uint32_t requests_per_minute = 10;
    uint32_t window_seconds = 60;
};

struct TaskConfig {
    uint32_t max_age_minutes = 60;
    uint32_t cleanup_interval = 300; // seconds between janitor sweeps
    uint32_t keepalive_seconds = 30;
};

struct Config {
    CacheConfig cache;
    BreakerConfig breaker;
    RetryConfig retry;
    RateLimitConfig rate_limit;
    TaskConfig tasks;

    // Load from ~/.pipeguard/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (merged) config document; unknown or mistyped keys keep defaults.
    static Config from_json(const nlohmann::json& j);
};

std::string config_path();

} // namespace pipeguard
