#include "circuit_breaker.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace pipeguard {

const char* breaker_status_name(BreakerStatus status) {
    switch (status) {
        case BreakerStatus::Closed:   return "closed";
        case BreakerStatus::Open:     return "open";
        case BreakerStatus::HalfOpen: return "half_open";
    }
    return "unknown";
}

nlohmann::json breaker_state_to_json(const BreakerState& state) {
    nlohmann::json j = {
        {"name",              state.name},
        {"status",            breaker_status_name(state.status)},
        {"is_open",           state.is_open},
        {"failure_count",     state.failure_count},
        {"failure_threshold", state.failure_threshold},
        {"recovery_timeout",  state.recovery_timeout}
    };
    if (state.last_failure) {
        j["last_failure"] = *state.last_failure;
    } else {
        j["last_failure"] = nullptr;
    }
    return j;
}

CircuitBreaker::CircuitBreaker(std::string name, uint32_t failure_threshold,
                               uint32_t recovery_timeout, Clock& clock)
    : name_(std::move(name)), failure_threshold_(failure_threshold),
      recovery_timeout_(recovery_timeout), clock_(clock) {
    if (failure_threshold_ == 0) {
        throw std::invalid_argument("CircuitBreaker requires failure_threshold > 0");
    }
}

bool CircuitBreaker::before_call() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (status_ == BreakerStatus::Closed) return false;

    if (status_ == BreakerStatus::HalfOpen) {
        // Only the single probe may pass while recovery is being tested.
        if (probe_in_flight_) throw BreakerOpenError(name_, 0);
        probe_in_flight_ = true;
        return true;
    }

    double elapsed = clock_.now() - last_failure_.value_or(0.0);
    if (elapsed < static_cast<double>(recovery_timeout_)) {
        auto remaining = static_cast<uint32_t>(
            std::ceil(static_cast<double>(recovery_timeout_) - elapsed));
        throw BreakerOpenError(name_, remaining);
    }

    std::cerr << "[breaker:" << name_ << "] Entering half-open state, testing service...\n";
    status_ = BreakerStatus::HalfOpen;
    probe_in_flight_ = true;
    return true;
}

void CircuitBreaker::record_success(bool probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (probe) {
        if (status_ == BreakerStatus::HalfOpen) {
            std::cerr << "[breaker:" << name_ << "] Probe succeeded, circuit closed\n";
            status_ = BreakerStatus::Closed;
            failure_count_ = 0;
        }
        probe_in_flight_ = false;
        return;
    }

    // Late successes leave an Open or HalfOpen breaker alone.
    if (status_ == BreakerStatus::Closed) failure_count_ = 0;
}

void CircuitBreaker::record_failure(const std::string& what, bool probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_count_++;
    last_failure_ = clock_.now();

    std::cerr << "[breaker:" << name_ << "] Failure " << failure_count_ << "/"
              << failure_threshold_ << ": " << what.substr(0, 100) << '\n';

    if (probe) {
        if (status_ == BreakerStatus::HalfOpen) {
            status_ = BreakerStatus::Open;
            std::cerr << "[breaker:" << name_ << "] Probe failed, circuit reopened\n";
        }
        probe_in_flight_ = false;
    } else if (status_ == BreakerStatus::Closed && failure_count_ >= failure_threshold_) {
        status_ = BreakerStatus::Open;
        std::cerr << "[breaker:" << name_ << "] Circuit opened after "
                  << failure_count_ << " failures\n";
    }
}

BreakerState CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BreakerState state;
    state.name = name_;
    state.status = status_;
    state.is_open = status_ == BreakerStatus::Open;
    state.failure_count = failure_count_;
    state.failure_threshold = failure_threshold_;
    state.last_failure = last_failure_;
    state.recovery_timeout = recovery_timeout_;
    return state;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = BreakerStatus::Closed;
    failure_count_ = 0;
    probe_in_flight_ = false;
}

} // namespace pipeguard
