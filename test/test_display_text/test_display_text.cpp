/**
 * @file test_display_text.cpp
 * @brief Unit tests for wrapping, static frames and scrolling
 */

#ifdef UNIT_TEST

#include <unity.h>
#include <string>
#include <vector>

#include "common/utf8_utils.h"
#include "display/display_text.h"
#include "mocks/recording_display.h"

void setUp(void) {}
void tearDown(void) {}

static void assertFrameShape(const DisplayFrame& frame) {
    TEST_ASSERT_EQUAL(2, frame.lines.size());
    TEST_ASSERT_EQUAL(DISPLAY_WIDTH, utf8Length(frame.lines[0]));
    TEST_ASSERT_EQUAL(DISPLAY_WIDTH, utf8Length(frame.lines[1]));
}

static std::string padded(const std::string& text) {
    return utf8FitWidth(text, DISPLAY_WIDTH);
}

// ============================================================================
// wrapMessageLines Tests
// ============================================================================

void test_wrap_splits_on_newline() {
    std::vector<std::string> lines = wrapMessageLines("Ты справишься!\nДыши глубже");
    TEST_ASSERT_EQUAL(2, lines.size());
    TEST_ASSERT_EQUAL_STRING("Ты справишься!", lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING("Дыши глубже", lines[1].c_str());
    for (const std::string& line : lines) {
        TEST_ASSERT_TRUE(utf8Length(line) <= DISPLAY_WIDTH);
    }
}

void test_wrap_empty_message_gives_one_empty_line() {
    std::vector<std::string> lines = wrapMessageLines("");
    TEST_ASSERT_EQUAL(1, lines.size());
    TEST_ASSERT_EQUAL_STRING("", lines[0].c_str());
}

void test_wrap_keeps_blank_lines() {
    std::vector<std::string> lines = wrapMessageLines("a\n\nb");
    TEST_ASSERT_EQUAL(3, lines.size());
    TEST_ASSERT_EQUAL_STRING("a", lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING("", lines[1].c_str());
    TEST_ASSERT_EQUAL_STRING("b", lines[2].c_str());
}

void test_wrap_collapses_whitespace() {
    std::vector<std::string> lines = wrapMessageLines("  one \t two   three  ");
    TEST_ASSERT_EQUAL(1, lines.size());
    TEST_ASSERT_EQUAL_STRING("one two three", lines[0].c_str());
}

void test_wrap_does_not_break_words() {
    // 13 + 1 + 4 + 1 + 7 code points: the last word moves down
    std::vector<std::string> lines = wrapMessageLines("Замечательный день сегодня");
    TEST_ASSERT_EQUAL(2, lines.size());
    TEST_ASSERT_EQUAL_STRING("Замечательный день", lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING("сегодня", lines[1].c_str());
}

void test_wrap_exact_width_fits() {
    const std::string twenty = "abcdefghij klmnopqrs";   // 20 chars
    std::vector<std::string> lines = wrapMessageLines(twenty);
    TEST_ASSERT_EQUAL(1, lines.size());
    TEST_ASSERT_EQUAL_STRING(twenty.c_str(), lines[0].c_str());
}

void test_wrap_does_not_split_at_hyphen() {
    std::vector<std::string> lines = wrapMessageLines("aaaaaaaaaaaaaaa кто-нибудь");
    TEST_ASSERT_EQUAL(2, lines.size());
    TEST_ASSERT_EQUAL_STRING("aaaaaaaaaaaaaaa", lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING("кто-нибудь", lines[1].c_str());
}

void test_wrap_cuts_overlong_word() {
    const std::string word(45, 'x');
    std::vector<std::string> lines = wrapMessageLines("go " + word + " now");
    TEST_ASSERT_EQUAL(4, lines.size());
    TEST_ASSERT_EQUAL_STRING("go", lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING(std::string(20, 'x').c_str(), lines[1].c_str());
    TEST_ASSERT_EQUAL_STRING(std::string(20, 'x').c_str(), lines[2].c_str());
    TEST_ASSERT_EQUAL_STRING("xxxxx now", lines[3].c_str());
}

void test_wrap_counts_cyrillic_as_single_columns() {
    // 20 Cyrillic letters are 40 bytes but exactly one line
    const std::string word = "ЖЖЖЖЖЖЖЖЖЖЖЖЖЖЖЖЖЖЖЖ";
    std::vector<std::string> lines = wrapMessageLines(word);
    TEST_ASSERT_EQUAL(1, lines.size());
    TEST_ASSERT_EQUAL(20, utf8Length(lines[0]));
}

// ============================================================================
// staticFrame Tests
// ============================================================================

void test_static_frame_empty_string() {
    DisplayFrame frame = staticFrame("");
    assertFrameShape(frame);
    TEST_ASSERT_EQUAL_STRING(std::string(20, ' ').c_str(), frame.lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING(std::string(20, ' ').c_str(), frame.lines[1].c_str());
}

void test_static_frame_pads_single_line() {
    DisplayFrame frame = staticFrame("Шаг за шагом");
    assertFrameShape(frame);
    TEST_ASSERT_EQUAL_STRING(padded("Шаг за шагом").c_str(), frame.lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING(padded("").c_str(), frame.lines[1].c_str());
}

void test_static_frame_drops_lines_after_second() {
    DisplayFrame frame = staticFrame("one\ntwo\nthree");
    assertFrameShape(frame);
    TEST_ASSERT_EQUAL_STRING(padded("one").c_str(), frame.lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING(padded("two").c_str(), frame.lines[1].c_str());
}

void test_static_frame_shape_for_many_inputs() {
    const char* inputs[] = {
        "", " ", "\n", "\n\n\n", "a", "Ты справишься!",
        "Очень длинная фраза которая точно не помещается в две строки экрана",
        "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx",
    };
    for (const char* input : inputs) {
        assertFrameShape(staticFrame(input));
    }
}

void test_static_frame_row_width_with_malformed_bytes() {
    DisplayFrame frame = staticFrame("\x80\x80" + std::string(25, 'a'));
    assertFrameShape(frame);
    TEST_ASSERT_EQUAL(DISPLAY_WIDTH, utf8Chunks(frame.lines[0], 1).size());
}

void test_frame_from_lines_truncates() {
    DisplayFrame frame = frameFromLines("abcdefghijklmnopqrstuvwxyz", "ёжик");
    assertFrameShape(frame);
    TEST_ASSERT_EQUAL_STRING("abcdefghijklmnopqrst", frame.lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING(padded("ёжик").c_str(), frame.lines[1].c_str());
}

// ============================================================================
// ScrollFrames Tests
// ============================================================================

void test_scroll_frame_count() {
    TEST_ASSERT_EQUAL(0, verticalScrollingFrames("").size());
    TEST_ASSERT_EQUAL(0, verticalScrollingFrames("short").size());
    TEST_ASSERT_EQUAL(1, verticalScrollingFrames("a\nb").size());
    TEST_ASSERT_EQUAL(3, verticalScrollingFrames("a\nb\nc\nd").size());
}

void test_scroll_frames_overlap_by_one_row() {
    ScrollFrames frames = verticalScrollingFrames(
        "Очень длинная фраза которая точно не помещается в две строки экрана");
    TEST_ASSERT_TRUE(frames.size() >= 2);
    for (size_t i = 1; i < frames.size(); i++) {
        TEST_ASSERT_EQUAL_STRING(frames.frameAt(i - 1).lines[1].c_str(),
                                 frames.frameAt(i).lines[0].c_str());
    }
    for (const DisplayFrame& frame : frames) {
        assertFrameShape(frame);
    }
}

void test_scroll_frames_restartable() {
    ScrollFrames frames = verticalScrollingFrames("a\nb\nc\nd\ne");
    std::vector<DisplayFrame> first(frames.begin(), frames.end());
    std::vector<DisplayFrame> second(frames.begin(), frames.end());
    TEST_ASSERT_EQUAL(4, first.size());
    TEST_ASSERT_TRUE(first == second);
    TEST_ASSERT_EQUAL_STRING(padded("c").c_str(), first[2].lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING(padded("d").c_str(), first[2].lines[1].c_str());
}

// ============================================================================
// showMessage Tests
// ============================================================================

void test_show_message_short_is_static() {
    RecordingDisplay display;
    int delays = 0;
    MessagePresentation result = showMessage(display, "Я рядом, Марго", 800,
                                             [&delays](unsigned long) { delays++; return true; });
    TEST_ASSERT_TRUE(result == MessagePresentation::STATIC);
    TEST_ASSERT_EQUAL(1, display.frames.size());
    TEST_ASSERT_EQUAL(0, delays);
    TEST_ASSERT_TRUE(display.last() == staticFrame("Я рядом, Марго"));
}

void test_show_message_two_lines_is_static() {
    RecordingDisplay display;
    MessagePresentation result = showMessage(display, "first\nsecond", 800,
                                             [](unsigned long) { return true; });
    TEST_ASSERT_TRUE(result == MessagePresentation::STATIC);
    TEST_ASSERT_EQUAL(1, display.frames.size());
}

void test_show_message_long_word_scrolls() {
    RecordingDisplay display;
    std::vector<unsigned long> delays;
    const std::string longWord(50, 'z');   // 3 wrapped lines
    MessagePresentation result = showMessage(display, longWord, 800,
                                             [&delays](unsigned long ms) { delays.push_back(ms); return true; });
    TEST_ASSERT_TRUE(result == MessagePresentation::SCROLLING);
    TEST_ASSERT_EQUAL(2, display.frames.size());
    TEST_ASSERT_EQUAL(2, delays.size());
    TEST_ASSERT_EQUAL(800, delays[0]);
}

void test_show_message_scroll_stops_when_delay_refuses() {
    RecordingDisplay display;
    MessagePresentation result = showMessage(display, "a\nb\nc\nd\ne", 800,
                                             [](unsigned long) { return false; });
    TEST_ASSERT_TRUE(result == MessagePresentation::SCROLLING);
    TEST_ASSERT_EQUAL(1, display.frames.size());
}

void test_show_static_message_writes_static_frame() {
    RecordingDisplay display;
    showStaticMessage(display, "one\ntwo\nthree");
    TEST_ASSERT_EQUAL(1, display.frames.size());
    TEST_ASSERT_TRUE(display.last() == staticFrame("one\ntwo"));
}

// ============================================================================
// Test Runner
// ============================================================================

int runUnityTests() {
    UNITY_BEGIN();

    // wrapMessageLines
    RUN_TEST(test_wrap_splits_on_newline);
    RUN_TEST(test_wrap_empty_message_gives_one_empty_line);
    RUN_TEST(test_wrap_keeps_blank_lines);
    RUN_TEST(test_wrap_collapses_whitespace);
    RUN_TEST(test_wrap_does_not_break_words);
    RUN_TEST(test_wrap_exact_width_fits);
    RUN_TEST(test_wrap_does_not_split_at_hyphen);
    RUN_TEST(test_wrap_cuts_overlong_word);
    RUN_TEST(test_wrap_counts_cyrillic_as_single_columns);

    // staticFrame
    RUN_TEST(test_static_frame_empty_string);
    RUN_TEST(test_static_frame_pads_single_line);
    RUN_TEST(test_static_frame_drops_lines_after_second);
    RUN_TEST(test_static_frame_shape_for_many_inputs);
    RUN_TEST(test_frame_from_lines_truncates);
    RUN_TEST(test_static_frame_row_width_with_malformed_bytes);

    // ScrollFrames
    RUN_TEST(test_scroll_frame_count);
    RUN_TEST(test_scroll_frames_overlap_by_one_row);
    RUN_TEST(test_scroll_frames_restartable);

    // showMessage
    RUN_TEST(test_show_message_short_is_static);
    RUN_TEST(test_show_message_two_lines_is_static);
    RUN_TEST(test_show_message_long_word_scrolls);
    RUN_TEST(test_show_message_scroll_stops_when_delay_refuses);
    RUN_TEST(test_show_static_message_writes_static_frame);

    return UNITY_END();
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    return runUnityTests();
}

#endif // UNIT_TEST
