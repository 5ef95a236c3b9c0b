#pragma once
#include "../clock.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <optional>
#include <type_traits>
#include <cstdint>

namespace pipeguard {

enum class BreakerStatus { Closed, Open, HalfOpen };

const char* breaker_status_name(BreakerStatus status);

struct BreakerState {
    std::string name;
    BreakerStatus status = BreakerStatus::Closed;
    bool is_open = false;
    uint32_t failure_count = 0;
    uint32_t failure_threshold = 0;
    std::optional<double> last_failure; // epoch seconds
    uint32_t recovery_timeout = 0;
};

nlohmann::json breaker_state_to_json(const BreakerState& state);

// Three-state failure isolator for one dependency.
//
//   Closed   --failure_threshold failures-->  Open
//   Open     --recovery_timeout elapsed---->  HalfOpen (one probe call)
//   HalfOpen --probe succeeds-------------->  Closed
//   HalfOpen --probe fails---------------->   Open
//
// State is mutex-guarded; the wrapped operation runs without the lock.
class CircuitBreaker {
public:
    CircuitBreaker(std::string name, uint32_t failure_threshold = 5,
                   uint32_t recovery_timeout = 60, Clock& clock = default_clock());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Run operation under breaker protection. Throws BreakerOpenError without
    // calling it while open; otherwise returns its result or rethrows its
    // exception unchanged after recording the failure.
    template<typename Fn>
    auto call(Fn&& operation) -> decltype(operation()) {
        const bool probe = before_call();
        try {
            if constexpr (std::is_void_v<decltype(operation())>) {
                operation();
                record_success(probe);
                return;
            } else {
                auto result = operation();
                record_success(probe);
                return result;
            }
        } catch (const std::exception& e) {
            record_failure(e.what(), probe);
            throw;
        } catch (...) {
            record_failure("unknown error", probe);
            throw;
        }
    }

    BreakerState get_state() const;

    // Force Closed with zero failures.
    void reset();

    const std::string& name() const { return name_; }

private:
    // Returns true when the admitted call is the half-open probe. Only the
    // probe's outcome may move the breaker out of HalfOpen; a call admitted
    // while Closed that finishes after the breaker opened never closes it.
    bool before_call();
    void record_success(bool probe);
    void record_failure(const std::string& what, bool probe);

    std::string name_;
    uint32_t failure_threshold_;
    uint32_t recovery_timeout_;
    Clock& clock_;

    BreakerStatus status_ = BreakerStatus::Closed;
    uint32_t failure_count_ = 0;
    std::optional<double> last_failure_;
    bool probe_in_flight_ = false;
    mutable std::mutex mutex_;
};

} // namespace pipeguard
