#pragma once
#include "config.hpp"
#include "clock.hpp"
#include "cache/ttl_cache.hpp"
#include "resilience/resilience.hpp"
#include "admission/rate_limiter.hpp"
#include "tasks/task_manager.hpp"
#include "janitor.hpp"
#include "progress_relay.hpp"
#include "pipeline.hpp"

namespace pipeguard {

// Every shared process-wide component, built once at startup from Config and
// handed to consumers by reference.
class Runtime {
public:
    explicit Runtime(const Config& config, Clock& clock = default_clock());

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    const Config& config() const { return config_; }

    TTLCache& cache() { return cache_; }
    BreakerRegistry& breakers() { return breakers_; }
    RetryExecutor& retry() { return retry_; }
    Resilience& resilience() { return resilience_; }
    RateLimiter& limiter() { return limiter_; }
    TaskManager& tasks() { return tasks_; }
    ProgressRelay& relay() { return relay_; }
    Janitor& janitor() { return janitor_; }

private:
    Config config_;
    TTLCache cache_;
    BreakerRegistry breakers_;
    RetryExecutor retry_;
    Resilience resilience_;
    RateLimiter limiter_;
    TaskManager tasks_;
    ProgressRelay relay_;
    Janitor janitor_; // declared last: stopped before the parts it sweeps
};

RetryPolicy retry_policy_from(const RetryConfig& config);
PipelineOptions pipeline_options_from(const CacheConfig& config);

} // namespace pipeguard
