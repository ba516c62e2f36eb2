/**
 * @file console_display.cpp
 * @brief Terminal display driver
 */

#include "console_display.h"

#include <string>

ConsoleDisplay::ConsoleDisplay(std::FILE* out) : _out(out) {}

bool ConsoleDisplay::begin() {
    return _out != nullptr;
}

void ConsoleDisplay::write(const DisplayFrame& frame) {
    if (_out == nullptr) {
        return;
    }

    const std::string divider(DISPLAY_WIDTH + 2, '-');
    std::string text = divider + "\n";
    for (const std::string& row : frame.lines) {
        text += "|" + row + "|\n";
    }
    text += divider + "\n";

    std::fputs(text.c_str(), _out);
    std::fflush(_out);
}
