/**
 * @file loop_handlers.h
 * @brief Main loop handler functions
 *
 * One loop iteration runs these handlers in order:
 *   1. handleIntents()         - apply queued button/console intents
 *   2. handleOverlay()         - show a pending overlay (blocks for its hold)
 *   3. handleContentRefresh()  - next phrase or weather summary when due
 *   4. sleep one poll interval
 *
 * Every hold is taken in poll-interval slices through pauseWhileRunning(),
 * so a stop request ends the loop within one poll interval.
 */

#ifndef LOOP_HANDLERS_H
#define LOOP_HANDLERS_H

#include <atomic>
#include <string>

#include "../common/timer_utils.h"
#include "../display/display_text.h"

// Forward declarations for external types
class Clock;
class DisplayDriver;
class ModeController;
class OverlayScheduler;
class PhraseSequencer;
class WeatherProvider;

/**
 * @brief Loop periods and holds (milliseconds)
 */
struct LoopTiming {
    unsigned long refresh_interval_ms = 5000;
    unsigned long poll_interval_ms = 100;
    unsigned long category_hold_ms = 5000;
    unsigned long scroll_delay_ms = 800;
};

/**
 * @brief Context structure passed to loop handlers
 *
 * Contains pointers to everything the handlers touch. weather may be null
 * (weather screen then always reports unavailable).
 */
struct LoopContext {
    Clock* clock;
    DisplayDriver* display;
    PhraseSequencer* sequencer;
    ModeController* modes;
    OverlayScheduler* overlay;
    WeatherProvider* weather;
    const std::atomic<bool>* running;
    LoopTiming timing;
};

/**
 * @brief State carried between iterations
 */
struct LoopState {
    LoopState(const Clock& clock, unsigned long refreshIntervalMs);

    IntervalTimer refresh_timer;    // Restarted after each content refresh
    bool has_last_category;         // Category announcement tracking
    std::string last_category;
    unsigned long iterations;
};

// =============================================================================
// HANDLER FUNCTION DECLARATIONS
// =============================================================================

/**
 * @brief Sleep in poll-interval slices while the running flag stays set
 * @return false if a stop was requested before the pause completed
 */
bool pauseWhileRunning(LoopContext& ctx, unsigned long ms);

/**
 * @brief FrameDelayFn bound to pauseWhileRunning()
 */
FrameDelayFn makeHoldFn(LoopContext& ctx);

/**
 * @brief Apply pending intents on the loop thread
 */
void handleIntents(LoopContext& ctx);

/**
 * @brief Show and hold a pending overlay
 */
void handleOverlay(LoopContext& ctx);

/**
 * @brief Show the next content item if the refresh period has elapsed
 * @return true if content was shown this iteration
 */
bool handleContentRefresh(LoopContext& ctx, LoopState& state);

/**
 * @brief Render the two-line weather summary, or "Погода недоступна"
 */
void displayWeather(LoopContext& ctx);

/**
 * @brief Show the next phrase, announcing its category when it changed
 */
void displayPhrase(LoopContext& ctx, LoopState& state);

/**
 * @brief One full iteration including the trailing poll sleep
 */
void runLoopIteration(LoopContext& ctx, LoopState& state);

/**
 * @brief Run iterations until the running flag is cleared
 *
 * The first content is shown on the first iteration.
 */
void runMainLoop(LoopContext& ctx);

/**
 * @brief Loading animation followed by the main loop
 *
 * An exception escaping either is logged and ends the session, so the
 * caller's shutdown path still runs.
 *
 * @return false if the session ended on an exception
 */
bool runDisplaySession(LoopContext& ctx, const char* version);

#endif // LOOP_HANDLERS_H
