#pragma once
#include "circuit_breaker.hpp"
#include "retry.hpp"
#include "errors.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pipeguard {

// One process-lifetime breaker per named dependency.
class BreakerRegistry {
public:
    BreakerRegistry(uint32_t failure_threshold = 5, uint32_t recovery_timeout = 60,
                    Clock& clock = default_clock());

    // Get or create the breaker for a dependency.
    CircuitBreaker& get(const std::string& name);

    // Snapshot of every breaker, ordered by name.
    std::vector<BreakerState> states() const;

    // Returns false if no breaker has that name.
    bool reset(const std::string& name);

    size_t size() const;

private:
    uint32_t failure_threshold_;
    uint32_t recovery_timeout_;
    Clock& clock_;
    std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
    mutable std::mutex mutex_;
};

// Retry over circuit breaker for a named dependency.
class Resilience {
public:
    Resilience(BreakerRegistry& breakers, RetryExecutor& retry)
        : breakers_(breakers), retry_(retry) {}

    // Throws BreakerOpenError (not retried) or RetryExhaustedError wrapping
    // the last failure.
    template<typename Fn>
    auto with_resilience(const std::string& dependency, Fn&& operation) -> decltype(operation()) {
        CircuitBreaker& breaker = breakers_.get(dependency);
        try {
            return retry_.retry([&]() { return breaker.call(operation); });
        } catch (const BreakerOpenError&) {
            throw;
        } catch (const std::exception& e) {
            throw RetryExhaustedError(dependency, retry_.policy().max_retries + 1,
                                      e.what(), std::current_exception());
        }
    }

    BreakerRegistry& breakers() { return breakers_; }
    const RetryPolicy& policy() const { return retry_.policy(); }

private:
    BreakerRegistry& breakers_;
    RetryExecutor& retry_;
};

} // namespace pipeguard
