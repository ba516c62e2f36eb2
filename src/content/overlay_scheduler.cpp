/**
 * @file overlay_scheduler.cpp
 * @brief Overlay hold-and-clear
 */

#include "overlay_scheduler.h"
#include "../debug/log_system.h"

static const char* TAG = "OVERLAY";

OverlayScheduler::OverlayScheduler(unsigned long holdMs)
    : _holdMs(holdMs), _pending(false) {}

void OverlayScheduler::request(const std::string& text) {
    if (_pending) {
        MK_LOGD(TAG, "Replacing unshown overlay '%s'", _text.c_str());
    }
    _text = text;
    _pending = true;
}

void OverlayScheduler::clear() {
    _pending = false;
    _text.clear();
}

bool OverlayScheduler::showIfPending(DisplayDriver& driver, const FrameDelayFn& holdFn) {
    if (!_pending) {
        return false;
    }

    MK_LOGI(TAG, "%s", _text.c_str());
    showStaticMessage(driver, _text);
    if (holdFn && !holdFn(_holdMs)) {
        MK_LOGD(TAG, "Overlay hold interrupted");
    }
    clear();
    return true;
}
