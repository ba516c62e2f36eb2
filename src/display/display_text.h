/**
 * @file display_text.h
 * @brief Text-to-frame rendering for the 20x2 display
 *
 * Turns arbitrary UTF-8 messages into DisplayFrames:
 * - wrapMessageLines() word-wraps to DISPLAY_WIDTH, honoring explicit '\n'
 * - staticFrame() shows the first two wrapped lines, dropping the rest
 * - ScrollFrames slides a two-row window over the wrapped lines
 * - showMessage() picks static or scrolling presentation
 *
 * Widths are counted in code points (see utf8_utils.h).
 */

#ifndef DISPLAY_TEXT_H
#define DISPLAY_TEXT_H

#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <vector>

#include "display_frame.h"

class DisplayDriver;

/**
 * @brief Word-wrap a message into display lines
 *
 * The message is split on '\n' first. Within each segment whitespace runs
 * collapse to single spaces and words are wrapped to DISPLAY_WIDTH. Words
 * longer than the width are cut into width-sized pieces; hyphens are never
 * break points. An empty segment yields one empty line.
 *
 * @param message UTF-8 text
 * @return At least one line, each at most DISPLAY_WIDTH code points
 */
std::vector<std::string> wrapMessageLines(const std::string& message);

/**
 * @brief Build a frame from two rows, truncating and padding each to DISPLAY_WIDTH
 */
DisplayFrame frameFromLines(const std::string& first, const std::string& second);

/**
 * @brief Non-scrolling frame: first two wrapped lines, the rest is dropped
 */
DisplayFrame staticFrame(const std::string& message);

/**
 * @brief Frames that scroll a message upward one row per step
 *
 * For N wrapped lines there are N-1 frames; frame i shows lines i and i+1.
 * One or zero lines give no frames at all, so callers must fall back to
 * staticFrame(). Frames are built on access, and the sequence can be
 * iterated any number of times.
 */
class ScrollFrames {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = DisplayFrame;
        using difference_type = std::ptrdiff_t;
        using pointer = const DisplayFrame*;
        using reference = DisplayFrame;

        const_iterator(const ScrollFrames* owner, size_t index)
            : _owner(owner), _index(index) {}

        DisplayFrame operator*() const { return _owner->frameAt(_index); }
        const_iterator& operator++() { ++_index; return *this; }
        const_iterator operator++(int) { const_iterator prev = *this; ++_index; return prev; }
        bool operator==(const const_iterator& other) const { return _index == other._index && _owner == other._owner; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const ScrollFrames* _owner;
        size_t _index;
    };

    explicit ScrollFrames(std::vector<std::string> lines);

    size_t size() const;
    bool empty() const { return size() == 0; }

    /**
     * @brief Frame at position index (index < size())
     */
    DisplayFrame frameAt(size_t index) const;

    const std::vector<std::string>& lines() const { return _lines; }

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size()); }

private:
    std::vector<std::string> _lines;
};

/**
 * @brief Scrolling frames for a message (wraps it first)
 */
ScrollFrames verticalScrollingFrames(const std::string& message);

/**
 * @brief How showMessage() presented a message
 */
enum class MessagePresentation {
    STATIC,
    SCROLLING
};

/**
 * @brief Wait between scroll frames
 *
 * Receives the delay in milliseconds. Returning false aborts the animation
 * (used when a stop has been requested).
 */
using FrameDelayFn = std::function<bool(unsigned long)>;

/**
 * @brief Write staticFrame(message) to the driver
 */
void showStaticMessage(DisplayDriver& driver, const std::string& message);

/**
 * @brief Show a message, scrolling only when it wraps to more than DISPLAY_HEIGHT lines
 *
 * Entry point for normal content. Overlays and status lines use
 * showStaticMessage() directly.
 *
 * @param driver Target display
 * @param message UTF-8 text
 * @param frameDelayMs Delay after each scroll frame
 * @param delayFn Performs the delay
 * @return Which path was taken
 */
MessagePresentation showMessage(DisplayDriver& driver, const std::string& message,
                                unsigned long frameDelayMs, const FrameDelayFn& delayFn);

#endif // DISPLAY_TEXT_H
