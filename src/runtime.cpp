#include "runtime.hpp"

namespace pipeguard {

RetryPolicy retry_policy_from(const RetryConfig& config) {
    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    policy.initial_delay = config.initial_delay;
    policy.max_delay = config.max_delay;
    policy.backoff_base = config.backoff_base;
    return policy;
}

PipelineOptions pipeline_options_from(const CacheConfig& config) {
    PipelineOptions options;
    options.plan_ttl = config.plan_ttl;
    options.search_ttl = config.search_ttl;
    return options;
}

Runtime::Runtime(const Config& config, Clock& clock)
    : config_(config),
      cache_(config.cache.max_size, config.cache.default_ttl,
             config.cache.coalesce_misses, clock),
      breakers_(config.breaker.failure_threshold, config.breaker.recovery_timeout, clock),
      retry_(retry_policy_from(config.retry), clock),
      resilience_(breakers_, retry_),
      limiter_(config.rate_limit.requests_per_minute, config.rate_limit.window_seconds, clock),
      tasks_(clock),
      relay_(tasks_, std::chrono::seconds(config.tasks.keepalive_seconds)),
      janitor_(cache_, tasks_, limiter_,
               std::chrono::seconds(config.tasks.cleanup_interval),
               config.tasks.max_age_minutes)
{}

} // namespace pipeguard
