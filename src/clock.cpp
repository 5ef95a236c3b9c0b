#include "clock.hpp"
#include <chrono>
#include <thread>

namespace pipeguard {

double SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

void SystemClock::sleep_for(double seconds) {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

Clock& default_clock() {
    static SystemClock clock;
    return clock;
}

} // namespace pipeguard
