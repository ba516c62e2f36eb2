/**
 * @file clock.h
 * @brief Time source used by the main loop, timers and the weather cache
 *
 * The loop never calls sleep or reads the clock directly; it goes through a
 * Clock so tests can run hours of simulated time instantly.
 */

#ifndef CLOCK_H
#define CLOCK_H

#include <ctime>

class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Monotonic milliseconds since an arbitrary start point
     */
    virtual unsigned long millis() const = 0;

    /**
     * @brief Block the calling thread for ms milliseconds
     */
    virtual void delay(unsigned long ms) = 0;

    /**
     * @brief Wall-clock time, used only for what is printed on screen
     */
    virtual std::time_t wallTime() const = 0;
};

/**
 * @brief Real clock: std::chrono::steady_clock and std::this_thread::sleep_for
 */
class SteadyClock : public Clock {
public:
    SteadyClock();

    unsigned long millis() const override;
    void delay(unsigned long ms) override;
    std::time_t wallTime() const override;

private:
    long long _startNs;
};

#endif // CLOCK_H
