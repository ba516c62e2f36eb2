/**
 * @file mode_controller.h
 * @brief Mode state machine driven by the buttons
 *
 * Transitions:
 *   primary short    toggleMode()     SEQUENTIAL -> RANDOM -> CATEGORY_SEQUENCE -> ...
 *   primary long     cycleCategory()  CATEGORY_SEQUENCE, next category pinned
 *   secondary short  toggleWeather()  WEATHER <-> mode that was active before
 *   secondary long   no-op
 *
 * Every transition requests an overlay naming the new state.
 */

#ifndef MODE_CONTROLLER_H
#define MODE_CONTROLLER_H

#include <cstddef>

#include "display_mode.h"
#include "intent_queue.h"

class PhraseSequencer;
class OverlayScheduler;

/**
 * @brief Owns the current mode
 *
 * Threading: post() may be called from any thread. Everything else runs
 * on the main loop thread; processPendingIntents() applies posted intents
 * there, so a transition (mode, cursor and overlay together) is never
 * observed half-applied.
 */
class ModeController {
public:
    ModeController(PhraseSequencer& sequencer, OverlayScheduler& overlay);

    DisplayMode mode() const { return _mode; }

    /**
     * @brief Whether a mode to restore is recorded (only while in WEATHER)
     */
    bool hasPreviousMode() const { return _hasPrevious; }
    DisplayMode previousMode() const { return _previous; }

    /**
     * @brief Cycle the phrase modes; ignored while in WEATHER
     */
    void toggleMode();

    /**
     * @brief Force CATEGORY_SEQUENCE and pin the next category at its first phrase
     *
     * Leaving WEATHER this way forgets the recorded previous mode.
     */
    void cycleCategory();

    /**
     * @brief Enter WEATHER remembering the current mode, or restore it
     *
     * Restores SEQUENTIAL when nothing was recorded.
     */
    void toggleWeather();

    /**
     * @brief Apply one intent immediately (main loop thread)
     */
    void handleIntent(UserIntent intent);

    /**
     * @brief Queue an intent for the main loop (any thread)
     * @return false if the queue was full
     */
    bool post(UserIntent intent);

    /**
     * @brief Apply all queued intents in arrival order (main loop thread)
     * @return Number of intents applied
     */
    size_t processPendingIntents();

    const IntentQueue& queue() const { return _queue; }

private:
    void setMode(DisplayMode mode);

    PhraseSequencer& _sequencer;
    OverlayScheduler& _overlay;
    IntentQueue _queue;
    DisplayMode _mode;
    DisplayMode _previous;
    bool _hasPrevious;
};

#endif // MODE_CONTROLLER_H
