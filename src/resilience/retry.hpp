#pragma once
#include "../clock.hpp"
#include "errors.hpp"
#include <string>
#include <exception>
#include <cstdint>

namespace pipeguard {

struct RetryPolicy {
    uint32_t max_retries = 3;
    double initial_delay = 1.0; // seconds
    double max_delay = 10.0;    // seconds
    double backoff_base = 2.0;
};

// min(initial_delay * backoff_base^attempt, max_delay)
double backoff_delay(const RetryPolicy& policy, uint32_t attempt);

// Bounded exponential-backoff retry. Wrap operations that are themselves
// wrapped by CircuitBreaker::call so breaker bookkeeping happens first.
class RetryExecutor {
public:
    explicit RetryExecutor(RetryPolicy policy = {}, Clock& clock = default_clock());

    template<typename Fn>
    auto retry(Fn&& operation) -> decltype(operation()) {
        return retry(operation, policy_);
    }

    // Up to policy.max_retries + 1 attempts. BreakerOpenError propagates at
    // once; otherwise the last failure is rethrown unchanged.
    template<typename Fn>
    auto retry(Fn&& operation, const RetryPolicy& policy) -> decltype(operation()) {
        std::exception_ptr last_error;
        for (uint32_t attempt = 0; attempt <= policy.max_retries; ++attempt) {
            try {
                return operation();
            } catch (const BreakerOpenError&) {
                throw;
            } catch (const std::exception& e) {
                last_error = std::current_exception();
                after_failure(policy, attempt, e.what());
            }
        }
        std::rethrow_exception(last_error);
    }

    const RetryPolicy& policy() const { return policy_; }

private:
    // Logs the failure and sleeps the backoff delay if attempts remain.
    void after_failure(const RetryPolicy& policy, uint32_t attempt, const std::string& what);

    RetryPolicy policy_;
    Clock& clock_;
};

} // namespace pipeguard
