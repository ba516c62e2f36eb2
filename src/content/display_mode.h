/**
 * @file display_mode.h
 * @brief Content selection modes and their on-screen labels
 */

#ifndef DISPLAY_MODE_H
#define DISPLAY_MODE_H

#include <cstdint>

/**
 * @brief Active content strategy; exactly one at a time
 */
enum class DisplayMode : uint8_t {
    SEQUENTIAL = 0,         // Every phrase of every category, in order
    RANDOM = 1,             // Random category, random phrase
    CATEGORY_SEQUENCE = 2,  // Sequential from a manually pinned category
    WEATHER = 3             // Clock and current weather instead of phrases
};

/**
 * @brief Overlay label announcing a mode
 */
inline const char* getModeDisplayName(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::SEQUENTIAL:        return "Режим: подряд";
        case DisplayMode::RANDOM:            return "Режим: рандом";
        case DisplayMode::CATEGORY_SEQUENCE: return "Режим: по разделу";
        case DisplayMode::WEATHER:           return "Режим: погода";
    }
    return "";
}

/**
 * @brief Stable ASCII key for logs
 */
inline const char* getModeKey(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::SEQUENTIAL:        return "sequential";
        case DisplayMode::RANDOM:            return "random";
        case DisplayMode::CATEGORY_SEQUENCE: return "category";
        case DisplayMode::WEATHER:           return "weather";
    }
    return "";
}

#endif // DISPLAY_MODE_H
