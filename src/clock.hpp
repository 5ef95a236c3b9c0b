#pragma once

namespace pipeguard {

// Abstract time source (injectable for testing).
// Times are fractional seconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
    virtual void sleep_for(double seconds) = 0;
};

class SystemClock : public Clock {
public:
    double now() const override;
    void sleep_for(double seconds) override;
};

// Shared stateless SystemClock used when no clock is injected.
Clock& default_clock();

} // namespace pipeguard
