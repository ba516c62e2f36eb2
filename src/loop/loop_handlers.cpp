/**
 * @file loop_handlers.cpp
 * @brief Loop sequencing, pauses and overlays
 */

#include "loop_handlers.h"
#include "../common/clock.h"
#include "../content/display_mode.h"
#include "../content/mode_controller.h"
#include "../content/overlay_scheduler.h"
#include "../debug/log_system.h"
#include "../display/display_startup.h"

#include <algorithm>
#include <exception>

static const char* TAG = "LOOP";

LoopState::LoopState(const Clock& clock, unsigned long refreshIntervalMs)
    : refresh_timer(clock, refreshIntervalMs),
      has_last_category(false),
      iterations(0) {
    // First content is due immediately
    refresh_timer.reset();
}

static bool isRunning(const LoopContext& ctx) {
    return ctx.running == nullptr || ctx.running->load();
}

bool pauseWhileRunning(LoopContext& ctx, unsigned long ms) {
    const unsigned long slice = ctx.timing.poll_interval_ms > 0 ? ctx.timing.poll_interval_ms : ms;
    unsigned long remaining = ms;

    while (remaining > 0) {
        if (!isRunning(ctx)) {
            return false;
        }
        const unsigned long step = std::min(slice, remaining);
        ctx.clock->delay(step);
        remaining -= step;
    }
    return isRunning(ctx);
}

FrameDelayFn makeHoldFn(LoopContext& ctx) {
    return [&ctx](unsigned long ms) { return pauseWhileRunning(ctx, ms); };
}

void handleIntents(LoopContext& ctx) {
    const size_t applied = ctx.modes->processPendingIntents();
    if (applied > 0) {
        MK_LOGD(TAG, "Applied %zu intent(s), mode now %s",
                applied, getModeKey(ctx.modes->mode()));
    }
}

void handleOverlay(LoopContext& ctx) {
    ctx.overlay->showIfPending(*ctx.display, makeHoldFn(ctx));
}

bool handleContentRefresh(LoopContext& ctx, LoopState& state) {
    if (!state.refresh_timer.isReady()) {
        return false;
    }

    switch (ctx.modes->mode()) {
        case DisplayMode::WEATHER:
            displayWeather(ctx);
            state.has_last_category = false;
            break;
        case DisplayMode::SEQUENTIAL:
        case DisplayMode::RANDOM:
        case DisplayMode::CATEGORY_SEQUENCE:
            displayPhrase(ctx, state);
            break;
    }

    // Period counts from the end of the content (scrolling included)
    state.refresh_timer.touch();
    return true;
}

void runLoopIteration(LoopContext& ctx, LoopState& state) {
    state.iterations++;

    handleIntents(ctx);
    if (!isRunning(ctx)) return;

    handleOverlay(ctx);
    if (!isRunning(ctx)) return;

    handleContentRefresh(ctx, state);
    if (!isRunning(ctx)) return;

    ctx.clock->delay(ctx.timing.poll_interval_ms);
}

void runMainLoop(LoopContext& ctx) {
    LoopState state(*ctx.clock, ctx.timing.refresh_interval_ms);

    MK_LOGI(TAG, "Main loop started (refresh %lu ms, poll %lu ms)",
            ctx.timing.refresh_interval_ms, ctx.timing.poll_interval_ms);

    while (isRunning(ctx)) {
        runLoopIteration(ctx, state);
    }

    MK_LOGI(TAG, "Main loop stopped after %lu iterations", state.iterations);
}

bool runDisplaySession(LoopContext& ctx, const char* version) {
    try {
        if (showLoadingAnimation(*ctx.display, version, makeHoldFn(ctx))) {
            runMainLoop(ctx);
        }
    } catch (const std::exception& e) {
        MK_LOGE(TAG, "Main loop aborted: %s", e.what());
        return false;
    }
    return true;
}
