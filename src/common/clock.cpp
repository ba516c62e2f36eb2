/**
 * @file clock.cpp
 * @brief SteadyClock implementation
 */

#include "clock.h"

#include <chrono>
#include <thread>

static long long steadyNowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

SteadyClock::SteadyClock() : _startNs(steadyNowNs()) {}

unsigned long SteadyClock::millis() const {
    return static_cast<unsigned long>((steadyNowNs() - _startNs) / 1000000LL);
}

void SteadyClock::delay(unsigned long ms) {
    if (ms == 0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::time_t SteadyClock::wallTime() const {
    return std::time(nullptr);
}
