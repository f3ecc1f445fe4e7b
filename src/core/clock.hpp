#pragma once

#include <chrono>

// Time source for everything that waits on a remote device. Production code
// uses SteadyClock; tests drive a manual clock so silence thresholds and hard
// ceilings can be exercised without real sleeps.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() = 0;
    virtual void sleep_for(std::chrono::milliseconds ms) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() override;
    void sleep_for(std::chrono::milliseconds ms) override;
};

// Process-wide steady clock instance.
Clock& steady_clock();

// Milliseconds elapsed between two points.
inline long long elapsed_ms(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}
