/**
 * @file log_system.h
 * @brief Unified tag-based logging
 *
 * Single logging path for the whole program. One TAG per module with
 * printf-style formatting and a global level that tags may override.
 * Lines go to stderr so they never mix with frames
 * the console display prints to stdout.
 *
 * Usage:
 *   #include "debug/log_system.h"
 *   static const char* TAG = "MY_MODULE";
 *   MK_LOGI(TAG, "Hello %s", "world");
 *   MK_LOGE(TAG, "Something failed: %d", err);
 */

#ifndef LOG_SYSTEM_H
#define LOG_SYSTEM_H

#include <cstdarg>
#include <cstdint>

/**
 * @brief Log levels, ordered by verbosity
 */
enum LogLevel : uint8_t {
    LOG_LEVEL_NONE = 0,
    LOG_LEVEL_ERROR = 1,
    LOG_LEVEL_WARN = 2,
    LOG_LEVEL_INFO = 3,
    LOG_LEVEL_DEBUG = 4,
    LOG_LEVEL_VERBOSE = 5
};

/**
 * @brief Initialize the log system
 *
 * Records the start time used for the millisecond stamp on every line.
 * Safe to call more than once.
 */
void log_system_init();

/**
 * @brief Set the global log level
 * @param level Messages above this level are dropped
 */
void log_system_set_level(LogLevel level);

/**
 * @brief Get the global log level
 */
LogLevel log_system_get_level();

/**
 * @brief Override the level for one tag
 * @param tag Module tag, e.g. "WEATHER"
 * @param level Level for this tag only
 */
void log_system_set_tag_level(const char* tag, LogLevel level);

/**
 * @brief Parse a level name ("none", "error", "warn", "info", "debug", "verbose")
 * @param name Level name, case-insensitive
 * @param out Parsed level
 * @return true if the name was recognized
 */
bool log_system_parse_level(const char* name, LogLevel* out);

/**
 * @brief Check whether a message for tag at level would be printed
 */
bool log_system_enabled(LogLevel level, const char* tag);

/**
 * @brief Format and emit one log line
 */
void log_system_write(LogLevel level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

void log_system_vwrite(LogLevel level, const char* tag, const char* fmt, va_list args);

#define MK_LOGE(tag, fmt, ...) log_system_write(LOG_LEVEL_ERROR, tag, fmt, ##__VA_ARGS__)
#define MK_LOGW(tag, fmt, ...) log_system_write(LOG_LEVEL_WARN, tag, fmt, ##__VA_ARGS__)
#define MK_LOGI(tag, fmt, ...) log_system_write(LOG_LEVEL_INFO, tag, fmt, ##__VA_ARGS__)
#define MK_LOGD(tag, fmt, ...) log_system_write(LOG_LEVEL_DEBUG, tag, fmt, ##__VA_ARGS__)
#define MK_LOGV(tag, fmt, ...) log_system_write(LOG_LEVEL_VERBOSE, tag, fmt, ##__VA_ARGS__)

// Subsystem shortcuts
#define DEBUG_DISPLAY(fmt, ...) MK_LOGD("DISPLAY", fmt, ##__VA_ARGS__)
#define DEBUG_INPUT(fmt, ...)   MK_LOGD("INPUT", fmt, ##__VA_ARGS__)

#endif // LOG_SYSTEM_H
