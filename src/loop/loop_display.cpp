/**
 * @file loop_display.cpp
 * @brief Content handlers: phrases and the weather screen
 */

#include "loop_handlers.h"
#include "../common/clock.h"
#include "../content/display_mode.h"
#include "../content/mode_controller.h"
#include "../content/phrase_sequencer.h"
#include "../display/display_driver.h"
#include "../debug/log_system.h"
#include "../weather/weather_provider.h"
#include "../weather/weather_summary.h"

#include <ctime>

static const char* TAG = "LOOP_DISP";

#define WEATHER_UNAVAILABLE_TEXT "Погода недоступна"

void displayWeather(LoopContext& ctx) {
    WeatherReading reading;
    if (ctx.weather == nullptr || !ctx.weather->fetch(&reading)) {
        showStaticMessage(*ctx.display, WEATHER_UNAVAILABLE_TEXT);
        return;
    }

    const std::time_t now = ctx.clock->wallTime();
    std::tm local{};
    localtime_r(&now, &local);

    ctx.display->write(frameFromLines(formatClockLine(local), formatConditionsLine(reading)));
}

void displayPhrase(LoopContext& ctx, LoopState& state) {
    const DisplayMode mode = ctx.modes->mode();

    PhraseSelection selection;
    if (!ctx.sequencer->nextPhrase(mode, &selection)) {
        MK_LOGW(TAG, "No phrase for mode %s", getModeKey(mode));
        return;
    }

    const FrameDelayFn hold = makeHoldFn(ctx);

    if (mode == DisplayMode::RANDOM) {
        state.has_last_category = false;
    } else if (!state.has_last_category || state.last_category != selection.category->name) {
        DEBUG_DISPLAY("Announcing category %s", selection.category->name.c_str());
        showMessage(*ctx.display, selection.category->name, ctx.timing.scroll_delay_ms, hold);
        state.has_last_category = true;
        state.last_category = selection.category->name;
        if (!pauseWhileRunning(ctx, ctx.timing.category_hold_ms)) {
            return;
        }
    }

    showMessage(*ctx.display, *selection.phrase, ctx.timing.scroll_delay_ms, hold);
}
