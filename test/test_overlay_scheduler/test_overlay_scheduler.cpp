/**
 * @file test_overlay_scheduler.cpp
 * @brief Unit tests for the overlay hold-and-clear
 */

#ifdef UNIT_TEST

#include <unity.h>
#include <string>
#include <vector>

#include "content/overlay_scheduler.h"
#include "mocks/recording_display.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Overlay Tests
// ============================================================================

void test_nothing_pending_initially() {
    OverlayScheduler overlay(1500);
    RecordingDisplay display;
    TEST_ASSERT_FALSE(overlay.hasPending());
    TEST_ASSERT_FALSE(overlay.showIfPending(display, [](unsigned long) { return true; }));
    TEST_ASSERT_EQUAL(0, display.frames.size());
}

void test_request_replaces_unshown_text() {
    OverlayScheduler overlay(1500);
    overlay.request("Режим: рандом");
    overlay.request("Режим: погода");
    TEST_ASSERT_TRUE(overlay.hasPending());
    TEST_ASSERT_EQUAL_STRING("Режим: погода", overlay.pendingText().c_str());
}

void test_show_writes_static_frame_and_holds() {
    OverlayScheduler overlay(1500);
    RecordingDisplay display;
    std::vector<unsigned long> holds;
    overlay.request("Раздел: Юмор");

    TEST_ASSERT_TRUE(overlay.showIfPending(display, [&holds](unsigned long ms) {
        holds.push_back(ms);
        return true;
    }));

    TEST_ASSERT_EQUAL(1, display.frames.size());
    TEST_ASSERT_TRUE(display.last() == staticFrame("Раздел: Юмор"));
    TEST_ASSERT_EQUAL(1, holds.size());
    TEST_ASSERT_EQUAL(1500, holds[0]);
    TEST_ASSERT_FALSE(overlay.hasPending());
}

void test_interrupted_hold_still_clears() {
    OverlayScheduler overlay(700);
    RecordingDisplay display;
    overlay.request("Режим: подряд");
    TEST_ASSERT_TRUE(overlay.showIfPending(display, [](unsigned long) { return false; }));
    TEST_ASSERT_FALSE(overlay.hasPending());
    TEST_ASSERT_EQUAL(700, overlay.holdMs());
}

void test_clear_discards_pending() {
    OverlayScheduler overlay;
    overlay.request("x");
    overlay.clear();
    TEST_ASSERT_FALSE(overlay.hasPending());
    TEST_ASSERT_EQUAL(DEFAULT_OVERLAY_HOLD_MS, overlay.holdMs());
}

// ============================================================================
// Test Runner
// ============================================================================

int runUnityTests() {
    UNITY_BEGIN();

    RUN_TEST(test_nothing_pending_initially);
    RUN_TEST(test_request_replaces_unshown_text);
    RUN_TEST(test_show_writes_static_frame_and_holds);
    RUN_TEST(test_interrupted_hold_still_clears);
    RUN_TEST(test_clear_discards_pending);

    return UNITY_END();
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    return runUnityTests();
}

#endif // UNIT_TEST
