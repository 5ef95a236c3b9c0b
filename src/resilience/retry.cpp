#include "retry.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace pipeguard {

double backoff_delay(const RetryPolicy& policy, uint32_t attempt) {
    double delay = policy.initial_delay * std::pow(policy.backoff_base, static_cast<double>(attempt));
    return std::min(delay, policy.max_delay);
}

RetryExecutor::RetryExecutor(RetryPolicy policy, Clock& clock)
    : policy_(policy), clock_(clock) {
    if (policy_.initial_delay < 0 || policy_.max_delay < 0 || policy_.backoff_base < 1.0) {
        throw std::invalid_argument("RetryPolicy requires non-negative delays and backoff_base >= 1");
    }
}

void RetryExecutor::after_failure(const RetryPolicy& policy, uint32_t attempt,
                                  const std::string& what) {
    uint32_t total = policy.max_retries + 1;
    if (attempt < policy.max_retries) {
        double delay = backoff_delay(policy, attempt);
        std::cerr << "[retry] Attempt " << (attempt + 1) << "/" << total
                  << " failed: " << what.substr(0, 100) << '\n'
                  << "[retry] Retrying in " << std::fixed << std::setprecision(1)
                  << delay << "s...\n" << std::defaultfloat;
        clock_.sleep_for(delay);
    } else {
        std::cerr << "[retry] All " << total << " attempts failed\n";
    }
}

} // namespace pipeguard
