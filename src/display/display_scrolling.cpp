/**
 * @file display_scrolling.cpp
 * @brief Vertical scrolling engine
 *
 * Long messages move up one row per step through the two-row window.
 */

#include "display_text.h"
#include "display_driver.h"
#include "../debug/log_system.h"

#include <utility>

ScrollFrames::ScrollFrames(std::vector<std::string> lines)
    : _lines(std::move(lines)) {}

size_t ScrollFrames::size() const {
    return _lines.size() > 1 ? _lines.size() - 1 : 0;
}

DisplayFrame ScrollFrames::frameAt(size_t index) const {
    return frameFromLines(_lines[index], _lines[index + 1]);
}

ScrollFrames verticalScrollingFrames(const std::string& message) {
    return ScrollFrames(wrapMessageLines(message));
}

MessagePresentation showMessage(DisplayDriver& driver, const std::string& message,
                                unsigned long frameDelayMs, const FrameDelayFn& delayFn) {
    ScrollFrames frames = verticalScrollingFrames(message);

    if (frames.lines().size() <= DISPLAY_HEIGHT) {
        driver.write(staticFrame(message));
        return MessagePresentation::STATIC;
    }

    DEBUG_DISPLAY("Scrolling %zu lines in %zu frames", frames.lines().size(), frames.size());
    for (const DisplayFrame& frame : frames) {
        driver.write(frame);
        if (delayFn && !delayFn(frameDelayMs)) {
            DEBUG_DISPLAY("Scroll interrupted");
            break;
        }
    }
    return MessagePresentation::SCROLLING;
}
