/**
 * @file fake_clock.h
 * @brief Manually advanced Clock for loop and timer tests
 */

#ifndef FAKE_CLOCK_H
#define FAKE_CLOCK_H

#include <ctime>
#include <functional>
#include <vector>

#include "common/clock.h"

class FakeClock : public Clock {
public:
    explicit FakeClock(std::time_t wallBase = 1700000000) : now_ms(0), wall_base(wallBase) {}

    unsigned long millis() const override { return now_ms; }

    // Advances time instead of sleeping; on_delay runs after each advance
    void delay(unsigned long ms) override {
        delays.push_back(ms);
        now_ms += ms;
        if (on_delay) {
            on_delay(now_ms);
        }
    }

    std::time_t wallTime() const override {
        return wall_base + static_cast<std::time_t>(now_ms / 1000);
    }

    void advance(unsigned long ms) { now_ms += ms; }

    unsigned long totalDelayed() const {
        unsigned long total = 0;
        for (unsigned long d : delays) total += d;
        return total;
    }

    unsigned long now_ms;
    std::time_t wall_base;
    std::vector<unsigned long> delays;
    std::function<void(unsigned long)> on_delay;
};

#endif // FAKE_CLOCK_H
