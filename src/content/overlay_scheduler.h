/**
 * @file overlay_scheduler.h
 * @brief Short-lived status message that preempts normal content
 */

#ifndef OVERLAY_SCHEDULER_H
#define OVERLAY_SCHEDULER_H

#include <string>

#include "../display/display_text.h"

class DisplayDriver;

// How long an overlay stays on screen
constexpr unsigned long DEFAULT_OVERLAY_HOLD_MS = 1500;

/**
 * @brief Holds at most one pending overlay
 *
 * A new request replaces an overlay that has not been shown yet. Used from
 * the main loop thread only; button threads reach it through
 * ModeController's intent queue.
 */
class OverlayScheduler {
public:
    explicit OverlayScheduler(unsigned long holdMs = DEFAULT_OVERLAY_HOLD_MS);

    /**
     * @brief Queue text, replacing any unshown overlay
     */
    void request(const std::string& text);

    bool hasPending() const { return _pending; }
    const std::string& pendingText() const { return _text; }
    unsigned long holdMs() const { return _holdMs; }
    void clear();

    /**
     * @brief Show the pending overlay, hold it, then clear it
     *
     * Blocks the caller for the hold duration. This is the intended
     * "hold the screen" step of the loop, not a background animation.
     *
     * @param driver Target display (static path)
     * @param holdFn Performs the hold; may end early on stop
     * @return true if an overlay was shown
     */
    bool showIfPending(DisplayDriver& driver, const FrameDelayFn& holdFn);

private:
    unsigned long _holdMs;
    bool _pending;
    std::string _text;
};

#endif // OVERLAY_SCHEDULER_H
