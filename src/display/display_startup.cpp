/**
 * @file display_startup.cpp
 * @brief Loading screen
 */

#include "display_startup.h"
#include "../debug/log_system.h"

#include <algorithm>
#include <string>

bool showLoadingAnimation(DisplayDriver& driver, const char* version,
                          const FrameDelayFn& holdFn, const LoadingTiming& timing) {
    const std::string title = std::string("Маркошка v") + (version ? version : "");

    unsigned long elapsed = 0;
    size_t frame = 0;
    while (elapsed < timing.duration_ms) {
        const std::string dots(frame % 3 + 1, '.');
        showStaticMessage(driver, title + "\nзагружается" + dots);
        frame++;

        const unsigned long hold = std::min(timing.interval_ms, timing.duration_ms - elapsed);
        if (!holdFn(hold)) {
            DEBUG_DISPLAY("Loading animation interrupted");
            return false;
        }
        elapsed += hold;
        if (timing.interval_ms == 0) {
            break;
        }
    }

    showStaticMessage(driver, "Маркошка готова!\nПоехали!");
    return holdFn(timing.ready_hold_ms);
}
