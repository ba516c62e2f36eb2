/**
 * @file test_loop_handlers.cpp
 * @brief Unit tests for the main loop handlers
 *
 * Time is simulated with FakeClock: every pause advances it instantly, and
 * on_delay is used to request a stop at a chosen moment.
 */

#ifdef UNIT_TEST

#include <unity.h>
#include <atomic>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "content/mode_controller.h"
#include "content/overlay_scheduler.h"
#include "content/phrase_sequencer.h"
#include "display/display_startup.h"
#include "loop/loop_handlers.h"
#include "mocks/fake_clock.h"
#include "mocks/recording_display.h"
#include "mocks/scripted_weather.h"

static PhraseCatalogue makeCatalogue() {
    PhraseCatalogue catalogue;
    std::vector<Category> categories = {
        {"A", {"a1", "a2"}},
        {"B", {"b1"}},
    };
    TEST_ASSERT_TRUE(PhraseCatalogue::build(categories, &catalogue, nullptr));
    return catalogue;
}

/**
 * @brief Everything one loop needs, wired like main() does
 */
struct LoopHarness {
    LoopHarness()
        : catalogue(makeCatalogue()),
          sequencer(catalogue, 1),
          overlay(1500),
          modes(sequencer, overlay),
          running(true) {
        ctx.clock = &clock;
        ctx.display = &display;
        ctx.sequencer = &sequencer;
        ctx.modes = &modes;
        ctx.overlay = &overlay;
        ctx.weather = &weather;
        ctx.running = &running;
        ctx.timing = LoopTiming();
    }

    FakeClock clock;
    RecordingDisplay display;
    PhraseCatalogue catalogue;
    PhraseSequencer sequencer;
    OverlayScheduler overlay;
    ModeController modes;
    ScriptedWeatherProvider weather;
    std::atomic<bool> running;
    LoopContext ctx;
};

static LoopHarness* h = nullptr;

void setUp(void) {
    // Weather clock line is rendered in local time
    setenv("TZ", "UTC", 1);
    tzset();
    h = new LoopHarness();
}

void tearDown(void) {
    delete h;
    h = nullptr;
}

// Run iterations until the display holds at least frameCount frames
static void runUntilFrames(LoopState& state, size_t frameCount) {
    for (int i = 0; i < 2000 && h->display.frames.size() < frameCount; i++) {
        runLoopIteration(h->ctx, state);
    }
    TEST_ASSERT_TRUE(h->display.frames.size() >= frameCount);
}

// ============================================================================
// Pause Tests
// ============================================================================

void test_pause_sleeps_in_poll_slices() {
    TEST_ASSERT_TRUE(pauseWhileRunning(h->ctx, 250));
    TEST_ASSERT_EQUAL(3, h->clock.delays.size());
    TEST_ASSERT_EQUAL(100, h->clock.delays[0]);
    TEST_ASSERT_EQUAL(100, h->clock.delays[1]);
    TEST_ASSERT_EQUAL(50, h->clock.delays[2]);
    TEST_ASSERT_EQUAL(250, h->clock.now_ms);
}

void test_pause_returns_early_on_stop() {
    h->clock.on_delay = [](unsigned long now) {
        if (now >= 300) h->running = false;
    };
    TEST_ASSERT_FALSE(pauseWhileRunning(h->ctx, 5000));
    TEST_ASSERT_EQUAL(300, h->clock.now_ms);
}

void test_pause_when_already_stopped() {
    h->running = false;
    TEST_ASSERT_FALSE(pauseWhileRunning(h->ctx, 1000));
    TEST_ASSERT_EQUAL(0, h->clock.delays.size());
}

// ============================================================================
// Phrase Content Tests
// ============================================================================

void test_first_content_is_immediate_with_category_announcement() {
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runLoopIteration(h->ctx, state);

    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL(2, rows.size());
    TEST_ASSERT_EQUAL_STRING("A", rows[0].c_str());
    TEST_ASSERT_EQUAL_STRING("a1", rows[1].c_str());

    // Announcement hold, then the trailing poll sleep
    TEST_ASSERT_EQUAL(5000 + 100, h->clock.now_ms);
    TEST_ASSERT_TRUE(state.has_last_category);
    TEST_ASSERT_EQUAL_STRING("A", state.last_category.c_str());
}

void test_refresh_waits_for_interval() {
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runLoopIteration(h->ctx, state);
    const unsigned long shownAt = h->clock.now_ms - 100;

    runLoopIteration(h->ctx, state);
    TEST_ASSERT_EQUAL(2, h->display.frames.size());

    runUntilFrames(state, 3);
    TEST_ASSERT_EQUAL_STRING("a2", h->display.firstRows()[2].c_str());
    // Shown on the first tick at or after the interval
    TEST_ASSERT_TRUE(h->clock.now_ms - 100 >= shownAt + 5000);
    TEST_ASSERT_TRUE(h->clock.now_ms - 100 < shownAt + 5000 + 100);
}

void test_same_category_is_not_announced_again() {
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runUntilFrames(state, 5);

    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL_STRING("A", rows[0].c_str());
    TEST_ASSERT_EQUAL_STRING("a1", rows[1].c_str());
    TEST_ASSERT_EQUAL_STRING("a2", rows[2].c_str());
    TEST_ASSERT_EQUAL_STRING("B", rows[3].c_str());
    TEST_ASSERT_EQUAL_STRING("b1", rows[4].c_str());
}

void test_random_mode_has_no_announcement() {
    h->modes.toggleMode();
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runUntilFrames(state, 6);

    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL_STRING("Режим: рандом", rows[0].c_str());
    for (size_t i = 1; i < rows.size(); i++) {
        TEST_ASSERT_TRUE(rows[i] == "a1" || rows[i] == "a2" || rows[i] == "b1");
    }
    TEST_ASSERT_FALSE(state.has_last_category);
}

void test_stop_during_announcement_skips_phrase() {
    h->clock.on_delay = [](unsigned long now) {
        if (now >= 1000) h->running = false;
    };
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runLoopIteration(h->ctx, state);

    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL(1, rows.size());
    TEST_ASSERT_EQUAL_STRING("A", rows[0].c_str());
    TEST_ASSERT_EQUAL(1000, h->clock.now_ms);
}

void test_long_phrase_scrolls_with_frame_delay() {
    std::vector<Category> categories = {
        {"L", {"Очень длинная фраза которая точно не помещается в две строки экрана"}},
    };
    PhraseCatalogue catalogue;
    TEST_ASSERT_TRUE(PhraseCatalogue::build(categories, &catalogue, nullptr));
    PhraseSequencer sequencer(catalogue, 1);
    h->ctx.sequencer = &sequencer;

    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    state.has_last_category = true;
    state.last_category = "L";
    runLoopIteration(h->ctx, state);

    const size_t expectedFrames =
        verticalScrollingFrames(catalogue.at(0).phrases[0]).size();
    TEST_ASSERT_TRUE(expectedFrames >= 2);
    TEST_ASSERT_EQUAL(expectedFrames, h->display.frames.size());
    TEST_ASSERT_EQUAL(expectedFrames * 800 + 100, h->clock.now_ms);
}

// ============================================================================
// Overlay and Intent Tests
// ============================================================================

void test_posted_intent_shows_overlay_before_content() {
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runLoopIteration(h->ctx, state);
    const size_t before = h->display.frames.size();
    const unsigned long start = h->clock.now_ms;

    h->modes.post(UserIntent::LONG_PRESS);
    runLoopIteration(h->ctx, state);

    TEST_ASSERT_TRUE(h->modes.mode() == DisplayMode::CATEGORY_SEQUENCE);
    TEST_ASSERT_EQUAL(before + 1, h->display.frames.size());
    TEST_ASSERT_EQUAL_STRING("Раздел: B", h->display.firstRows()[before].c_str());
    TEST_ASSERT_EQUAL(start + 1500 + 100, h->clock.now_ms);
    TEST_ASSERT_FALSE(h->overlay.hasPending());
}

void test_category_jump_content_follows_pinned_category() {
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    h->modes.post(UserIntent::LONG_PRESS);
    runUntilFrames(state, 3);

    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL_STRING("Раздел: B", rows[0].c_str());
    TEST_ASSERT_EQUAL_STRING("B", rows[1].c_str());
    TEST_ASSERT_EQUAL_STRING("b1", rows[2].c_str());
}

// ============================================================================
// Weather Content Tests
// ============================================================================

void test_weather_unavailable() {
    h->modes.toggleWeather();
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runUntilFrames(state, 2);

    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL_STRING("Режим: погода", rows[0].c_str());
    TEST_ASSERT_EQUAL_STRING("Погода недоступна", rows[1].c_str());
    TEST_ASSERT_EQUAL(1, h->weather.calls);
}

void test_weather_summary_frame() {
    h->weather.available = true;
    h->weather.reading.has_temperature = true;
    h->weather.reading.temperature = 5.0f;
    h->weather.reading.has_humidity = true;
    h->weather.reading.humidity = 60.0f;
    h->weather.reading.has_wind_speed = true;
    h->weather.reading.wind_speed = 2.0f;
    h->modes.toggleWeather();

    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runUntilFrames(state, 2);

    // 1700000000 + 1.5 s is Tuesday 2023-11-14 22:13 UTC
    const DisplayFrame& frame = h->display.frames[1];
    TEST_ASSERT_TRUE(frame == frameFromLines("22:13 14.11 Вт", "5° 60% 2.0м/с"));
}

void test_weather_without_provider() {
    h->ctx.weather = nullptr;
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    h->modes.toggleWeather();
    h->overlay.clear();
    TEST_ASSERT_TRUE(handleContentRefresh(h->ctx, state));
    TEST_ASSERT_EQUAL_STRING("Погода недоступна", h->display.firstRows()[0].c_str());
}

void test_weather_forgets_last_category() {
    LoopState state(h->clock, h->ctx.timing.refresh_interval_ms);
    runUntilFrames(state, 2);                  // A, a1

    h->modes.post(UserIntent::WEATHER_PRESS);
    runUntilFrames(state, 4);                  // overlay, weather
    TEST_ASSERT_FALSE(state.has_last_category);

    h->modes.post(UserIntent::WEATHER_PRESS);
    runUntilFrames(state, 7);                  // overlay, A, a2

    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL_STRING("Режим: подряд", rows[4].c_str());
    TEST_ASSERT_EQUAL_STRING("A", rows[5].c_str());
    TEST_ASSERT_EQUAL_STRING("a2", rows[6].c_str());
}

// ============================================================================
// Main Loop Tests
// ============================================================================

void test_main_loop_stops_on_flag() {
    h->clock.on_delay = [](unsigned long now) {
        if (now >= 12000) h->running = false;
    };
    runMainLoop(h->ctx);

    TEST_ASSERT_FALSE(h->running.load());
    TEST_ASSERT_TRUE(h->clock.now_ms <= 12000 + 100);
    std::vector<std::string> rows = h->display.firstRows();
    TEST_ASSERT_EQUAL(3, rows.size());
    TEST_ASSERT_EQUAL_STRING("a2", rows[2].c_str());
}

void test_main_loop_not_entered_when_stopped() {
    h->running = false;
    runMainLoop(h->ctx);
    TEST_ASSERT_EQUAL(0, h->display.frames.size());
    TEST_ASSERT_EQUAL(0, h->clock.delays.size());
}

void test_session_runs_animation_then_loop() {
    h->clock.on_delay = [](unsigned long now) {
        if (now >= 16000) h->running = false;
    };
    // 10 s of loading screen, then the "A" announcement held 5 s, then a1
    TEST_ASSERT_TRUE(runDisplaySession(h->ctx, "1.0"));
    TEST_ASSERT_TRUE(h->display.frames[0] == staticFrame("Маркошка v1.0\nзагружается."));
    TEST_ASSERT_EQUAL_STRING("a1", h->display.firstRows().back().c_str());
}

void test_session_contains_exception_from_loop() {
    h->clock.on_delay = [](unsigned long now) {
        if (now >= 12000) throw std::runtime_error("display gone");
    };
    TEST_ASSERT_FALSE(runDisplaySession(h->ctx, "1.0"));
    TEST_ASSERT_TRUE(h->running.load());
}

// ============================================================================
// Startup Animation Tests
// ============================================================================

void test_loading_animation_frames() {
    std::vector<unsigned long> holds;
    bool finished = showLoadingAnimation(h->display, "1.0",
                                         [&holds](unsigned long ms) { holds.push_back(ms); return true; });
    TEST_ASSERT_TRUE(finished);

    // 5000 ms in 700 ms steps: seven full frames and a 100 ms tail, then "ready"
    TEST_ASSERT_EQUAL(9, h->display.frames.size());
    TEST_ASSERT_EQUAL(9, holds.size());
    TEST_ASSERT_EQUAL(700, holds[0]);
    TEST_ASSERT_EQUAL(100, holds[7]);
    TEST_ASSERT_EQUAL(5000, holds[8]);

    TEST_ASSERT_TRUE(h->display.frames[0] == staticFrame("Маркошка v1.0\nзагружается."));
    TEST_ASSERT_TRUE(h->display.frames[2] == staticFrame("Маркошка v1.0\nзагружается..."));
    TEST_ASSERT_TRUE(h->display.frames[3] == staticFrame("Маркошка v1.0\nзагружается."));
    TEST_ASSERT_TRUE(h->display.last() == staticFrame("Маркошка готова!\nПоехали!"));
}

void test_loading_animation_interrupted() {
    int calls = 0;
    bool finished = showLoadingAnimation(h->display, "1.0",
                                         [&calls](unsigned long) { return ++calls < 2; });
    TEST_ASSERT_FALSE(finished);
    TEST_ASSERT_EQUAL(2, h->display.frames.size());
}

// ============================================================================
// Test Runner
// ============================================================================

int runUnityTests() {
    UNITY_BEGIN();

    // Pauses
    RUN_TEST(test_pause_sleeps_in_poll_slices);
    RUN_TEST(test_pause_returns_early_on_stop);
    RUN_TEST(test_pause_when_already_stopped);

    // Phrases
    RUN_TEST(test_first_content_is_immediate_with_category_announcement);
    RUN_TEST(test_refresh_waits_for_interval);
    RUN_TEST(test_same_category_is_not_announced_again);
    RUN_TEST(test_random_mode_has_no_announcement);
    RUN_TEST(test_stop_during_announcement_skips_phrase);
    RUN_TEST(test_long_phrase_scrolls_with_frame_delay);

    // Overlays and intents
    RUN_TEST(test_posted_intent_shows_overlay_before_content);
    RUN_TEST(test_category_jump_content_follows_pinned_category);

    // Weather
    RUN_TEST(test_weather_unavailable);
    RUN_TEST(test_weather_summary_frame);
    RUN_TEST(test_weather_without_provider);
    RUN_TEST(test_weather_forgets_last_category);

    // Main loop
    RUN_TEST(test_main_loop_stops_on_flag);
    RUN_TEST(test_main_loop_not_entered_when_stopped);
    RUN_TEST(test_session_runs_animation_then_loop);
    RUN_TEST(test_session_contains_exception_from_loop);

    // Startup
    RUN_TEST(test_loading_animation_frames);
    RUN_TEST(test_loading_animation_interrupted);

    return UNITY_END();
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    return runUnityTests();
}

#endif // UNIT_TEST
