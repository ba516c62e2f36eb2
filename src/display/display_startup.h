/**
 * @file display_startup.h
 * @brief Loading screen shown before the first phrase
 */

#ifndef DISPLAY_STARTUP_H
#define DISPLAY_STARTUP_H

#include "display_text.h"

struct LoadingTiming {
    unsigned long duration_ms = 5000;        // Dots animation length
    unsigned long interval_ms = 700;         // Time per dots frame
    unsigned long ready_hold_ms = 5000;      // "ready" screen hold
};

/**
 * @brief Play the loading animation
 *
 * Shows "Маркошка v<version>" / "загружается" with one to three dots, then
 * the ready screen.
 *
 * @param holdFn Performs each hold; returning false ends the animation early
 * @return false when cut short by holdFn
 */
bool showLoadingAnimation(DisplayDriver& driver, const char* version,
                          const FrameDelayFn& holdFn,
                          const LoadingTiming& timing = LoadingTiming());

#endif // DISPLAY_STARTUP_H
