#include "resilience.hpp"
#include <stdexcept>

namespace pipeguard {

BreakerRegistry::BreakerRegistry(uint32_t failure_threshold, uint32_t recovery_timeout,
                                 Clock& clock)
    : failure_threshold_(failure_threshold), recovery_timeout_(recovery_timeout),
      clock_(clock) {
    if (failure_threshold_ == 0) {
        throw std::invalid_argument("BreakerRegistry requires failure_threshold > 0");
    }
}

CircuitBreaker& BreakerRegistry::get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    if (it != breakers_.end()) return *it->second;

    auto breaker = std::make_unique<CircuitBreaker>(
        name, failure_threshold_, recovery_timeout_, clock_);
    auto [inserted, _] = breakers_.emplace(name, std::move(breaker));
    return *inserted->second;
}

std::vector<BreakerState> BreakerRegistry::states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BreakerState> out;
    out.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        out.push_back(breaker->get_state());
    }
    return out;
}

bool BreakerRegistry::reset(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    if (it == breakers_.end()) return false;
    it->second->reset();
    return true;
}

size_t BreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.size();
}

} // namespace pipeguard
