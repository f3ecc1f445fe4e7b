#include "clock.hpp"
#include <platform/platform.hpp>

Clock::time_point SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(std::chrono::milliseconds ms) {
    if (ms.count() > 0) {
        platform::sleep_ms(static_cast<int>(ms.count()));
    }
}

Clock& steady_clock() {
    static SteadyClock clock;
    return clock;
}
