#include "clock.hpp"
#include <thread>

namespace vigil {

MonoTime SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

WallTime SystemClock::wallNow() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleepFor(std::chrono::milliseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

IClock& systemClock() {
    static SystemClock clock;
    return clock;
}

} // namespace vigil
