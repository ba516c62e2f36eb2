/**
 * @file mode_controller.cpp
 * @brief Mode transitions
 */

#include "mode_controller.h"
#include "overlay_scheduler.h"
#include "phrase_sequencer.h"
#include "../debug/log_system.h"

#include <string>

static const char* TAG = "MODE";

static const char* CATEGORY_OVERLAY_PREFIX = "Раздел: ";

ModeController::ModeController(PhraseSequencer& sequencer, OverlayScheduler& overlay)
    : _sequencer(sequencer),
      _overlay(overlay),
      _mode(DisplayMode::SEQUENTIAL),
      _previous(DisplayMode::SEQUENTIAL),
      _hasPrevious(false) {}

void ModeController::setMode(DisplayMode mode) {
    if (mode != _mode) {
        MK_LOGI(TAG, "Mode %s -> %s", getModeKey(_mode), getModeKey(mode));
    }
    _mode = mode;
}

void ModeController::toggleMode() {
    DisplayMode next = DisplayMode::SEQUENTIAL;
    switch (_mode) {
        case DisplayMode::SEQUENTIAL:
            next = DisplayMode::RANDOM;
            break;
        case DisplayMode::RANDOM:
            next = DisplayMode::CATEGORY_SEQUENCE;
            break;
        case DisplayMode::CATEGORY_SEQUENCE:
            next = DisplayMode::SEQUENTIAL;
            break;
        case DisplayMode::WEATHER:
            MK_LOGD(TAG, "Mode toggle ignored in weather mode");
            return;
    }
    setMode(next);
    _overlay.request(getModeDisplayName(_mode));
}

void ModeController::cycleCategory() {
    if (_mode == DisplayMode::WEATHER) {
        _hasPrevious = false;
    }
    setMode(DisplayMode::CATEGORY_SEQUENCE);
    _sequencer.jumpToNextCategory();

    const std::string& name = _sequencer.currentCategory().name;
    MK_LOGI(TAG, "Category -> '%s'", name.c_str());
    _overlay.request(std::string(CATEGORY_OVERLAY_PREFIX) + name);
}

void ModeController::toggleWeather() {
    if (_mode == DisplayMode::WEATHER) {
        setMode(_hasPrevious ? _previous : DisplayMode::SEQUENTIAL);
        _hasPrevious = false;
        _overlay.request(getModeDisplayName(_mode));
        return;
    }

    _previous = _mode;
    _hasPrevious = true;
    setMode(DisplayMode::WEATHER);
    _overlay.request(getModeDisplayName(DisplayMode::WEATHER));
}

void ModeController::handleIntent(UserIntent intent) {
    DEBUG_INPUT("Applying %s press", getIntentName(intent));
    switch (intent) {
        case UserIntent::SHORT_PRESS:
            toggleMode();
            break;
        case UserIntent::LONG_PRESS:
            cycleCategory();
            break;
        case UserIntent::WEATHER_PRESS:
            toggleWeather();
            break;
        case UserIntent::WEATHER_LONG_PRESS:
            // Reserved
            break;
    }
}

bool ModeController::post(UserIntent intent) {
    return _queue.push(intent);
}

size_t ModeController::processPendingIntents() {
    size_t applied = 0;
    UserIntent intent;
    while (_queue.pop(&intent)) {
        handleIntent(intent);
        applied++;
    }
    return applied;
}
