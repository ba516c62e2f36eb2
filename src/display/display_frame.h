/**
 * @file display_frame.h
 * @brief Display geometry and the two-row frame sent to a driver
 */

#ifndef DISPLAY_FRAME_H
#define DISPLAY_FRAME_H

#include <array>
#include <cstddef>
#include <string>

// 20x2 character module
constexpr size_t DISPLAY_WIDTH = 20;
constexpr size_t DISPLAY_HEIGHT = 2;

/**
 * @brief Exactly what is shown on the display for one refresh
 *
 * Rows are UTF-8 and, once produced by the renderer, exactly DISPLAY_WIDTH
 * code points each.
 */
struct DisplayFrame {
    std::array<std::string, DISPLAY_HEIGHT> lines;

    bool operator==(const DisplayFrame& other) const { return lines == other.lines; }
    bool operator!=(const DisplayFrame& other) const { return lines != other.lines; }
};

#endif // DISPLAY_FRAME_H
