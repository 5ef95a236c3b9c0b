#pragma once
#include <string>
#include <stdexcept>
#include <exception>
#include <cstdint>

namespace pipeguard {

// Thrown instead of running the operation while a breaker is open.
// Never retried.
class BreakerOpenError : public std::runtime_error {
public:
    BreakerOpenError(const std::string& breaker, uint32_t cooldown_seconds)
        : std::runtime_error("Circuit breaker '" + breaker + "' is open. "
                             "Service temporarily unavailable. Try again in "
                             + std::to_string(cooldown_seconds) + "s"),
          breaker_(breaker), cooldown_seconds_(cooldown_seconds) {}

    const std::string& breaker() const { return breaker_; }
    uint32_t cooldown_seconds() const { return cooldown_seconds_; }

private:
    std::string breaker_;
    uint32_t cooldown_seconds_;
};

// All attempts against a dependency failed. Carries the last failure.
class RetryExhaustedError : public std::runtime_error {
public:
    RetryExhaustedError(const std::string& dependency, uint32_t attempts,
                        const std::string& last_error, std::exception_ptr last_exception)
        : std::runtime_error("All " + std::to_string(attempts) + " attempts against '"
                             + dependency + "' failed. Last error: " + last_error),
          dependency_(dependency), attempts_(attempts), last_error_(last_error),
          last_exception_(std::move(last_exception)) {}

    const std::string& dependency() const { return dependency_; }
    uint32_t attempts() const { return attempts_; }
    const std::string& last_error() const { return last_error_; }
    std::exception_ptr last_exception() const { return last_exception_; }

private:
    std::string dependency_;
    uint32_t attempts_;
    std::string last_error_;
    std::exception_ptr last_exception_;
};

} // namespace pipeguard
