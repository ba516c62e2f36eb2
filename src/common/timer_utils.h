/**
 * @file timer_utils.h
 * @brief Refresh and retry timers on top of a Clock
 *
 * All arithmetic is on unsigned millis, so it stays correct across
 * wraparound.
 */

#ifndef TIMER_UTILS_H
#define TIMER_UTILS_H

#include "clock.h"

/**
 * @brief Content refresh timer
 *
 * Usage:
 *   IntervalTimer timer(clock, 15000);
 *   timer.reset();             // fire on the first check
 *
 *   if (timer.isReady()) {
 *       showContent();
 *       timer.touch();         // next period starts after the content
 *   }
 */
class IntervalTimer {
public:
    /**
     * @param clock Time source
     * @param intervalMs Period in milliseconds (0 = never ready)
     *
     * The interval starts counting from construction.
     */
    IntervalTimer(const Clock& clock, unsigned long intervalMs)
        : _clock(clock), _interval(intervalMs), _lastTrigger(clock.millis()), _forceNext(false) {}

    /**
     * @brief true once the period has elapsed since the last touch()
     */
    bool isReady() const {
        if (_interval == 0) return false;
        if (_forceNext) return true;
        return (_clock.millis() - _lastTrigger) >= _interval;
    }

    /**
     * @brief Make the timer ready immediately
     */
    void reset() { _forceNext = true; }

    /**
     * @brief Restart the period from now
     */
    void touch() {
        _lastTrigger = _clock.millis();
        _forceNext = false;
    }

private:
    const Clock& _clock;
    unsigned long _interval;
    unsigned long _lastTrigger;    ///< From Clock::millis()
    bool _forceNext;
};

/**
 * @brief Exponential backoff for retry logic
 *
 * Automatically increases delay between retry attempts using exponential backoff.
 *
 * Usage:
 *   ExponentialBackoff backoff(clock, 60000, 3600000);  // Start at 1 min, max 1 h
 *
 *   if (backoff.isReady()) {
 *       if (attemptOperation()) {
 *           backoff.recordSuccess();  // Reset on success
 *       } else {
 *           backoff.recordFailure();  // Increase delay
 *       }
 *   }
 */
class ExponentialBackoff {
public:
    /**
     * @brief Construct an exponential backoff timer
     * @param clock Time source
     * @param minDelayMs Delay after the first failure
     * @param maxDelayMs Maximum delay in milliseconds
     * @param multiplier Multiplier for each further failure (default 2.0)
     */
    ExponentialBackoff(const Clock& clock, unsigned long minDelayMs, unsigned long maxDelayMs,
                       float multiplier = 2.0f)
        : _clock(clock), _minDelay(minDelayMs), _maxDelay(maxDelayMs), _multiplier(multiplier),
          _currentDelay(0), _lastAttempt(0), _attempts(0) {}

    /**
     * @brief Check if ready for next attempt
     * @return true if no failure is pending or enough time has passed since it
     */
    bool isReady() const {
        if (_attempts == 0) return true;
        return (_clock.millis() - _lastAttempt) >= _currentDelay;
    }

    /**
     * @brief Record a failed attempt (increases delay)
     */
    void recordFailure() {
        _lastAttempt = _clock.millis();
        if (_attempts == 0) {
            _currentDelay = _minDelay;
        } else {
            unsigned long next = static_cast<unsigned long>(_currentDelay * _multiplier);
            _currentDelay = next < _maxDelay ? next : _maxDelay;
        }
        _attempts++;
    }

    /**
     * @brief Record success (resets delay)
     */
    void recordSuccess() { reset(); }

    /**
     * @brief Reset to initial state
     */
    void reset() {
        _currentDelay = 0;
        _attempts = 0;
        _lastAttempt = 0;
    }

    unsigned long getCurrentDelay() const { return _currentDelay; }
    unsigned int getAttempts() const { return _attempts; }

    /**
     * @brief Get time until next retry is allowed
     * @return Milliseconds remaining until ready (0 if ready now)
     */
    unsigned long getTimeUntilReady() const {
        if (_attempts == 0) return 0;
        unsigned long elapsed = _clock.millis() - _lastAttempt;
        return (elapsed >= _currentDelay) ? 0 : (_currentDelay - elapsed);
    }

private:
    const Clock& _clock;
    unsigned long _minDelay;       ///< Delay after the first failure
    unsigned long _maxDelay;       ///< Maximum delay in milliseconds
    float _multiplier;             ///< Multiplier for exponential backoff
    unsigned long _currentDelay;   ///< Current delay in milliseconds
    unsigned long _lastAttempt;    ///< Last failure time (from Clock::millis())
    unsigned int _attempts;        ///< Failures since last reset
};

#endif // TIMER_UTILS_H
