/**
 * @file console_display.h
 * @brief Display driver that draws the module as text on a terminal
 */

#ifndef CONSOLE_DISPLAY_H
#define CONSOLE_DISPLAY_H

#include <cstdio>

#include "display_driver.h"

/**
 * Output for each frame:
 *   ----------------------
 *   |row 1               |
 *   |row 2               |
 *   ----------------------
 */
class ConsoleDisplay : public DisplayDriver {
public:
    explicit ConsoleDisplay(std::FILE* out = stdout);

    bool begin() override;
    void write(const DisplayFrame& frame) override;
    const char* name() const override { return "console"; }

private:
    std::FILE* _out;
};

#endif // CONSOLE_DISPLAY_H
