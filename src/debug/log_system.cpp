/**
 * @file log_system.cpp
 * @brief Unified logging implementation
 */

#include "log_system.h"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <strings.h>

// ============================================================================
// Module-level state
// ============================================================================

static std::mutex s_log_mutex;
static LogLevel s_global_level = LOG_LEVEL_INFO;
static std::map<std::string, LogLevel> s_tag_levels;
static std::chrono::steady_clock::time_point s_start = std::chrono::steady_clock::now();

/** Maximum formatted message length (longer messages are truncated) */
static constexpr size_t LOG_MSG_LEN = 512;

static char levelLetter(LogLevel level) {
    switch (level) {
        case LOG_LEVEL_ERROR:   return 'E';
        case LOG_LEVEL_WARN:    return 'W';
        case LOG_LEVEL_INFO:    return 'I';
        case LOG_LEVEL_DEBUG:   return 'D';
        case LOG_LEVEL_VERBOSE: return 'V';
        case LOG_LEVEL_NONE:    break;
    }
    return '?';
}

struct LevelName {
    const char* name;
    LogLevel level;
};

static constexpr LevelName LEVEL_NAMES[] = {
    {"none",    LOG_LEVEL_NONE},
    {"error",   LOG_LEVEL_ERROR},
    {"warn",    LOG_LEVEL_WARN},
    {"warning", LOG_LEVEL_WARN},
    {"info",    LOG_LEVEL_INFO},
    {"debug",   LOG_LEVEL_DEBUG},
    {"verbose", LOG_LEVEL_VERBOSE},
};

// Caller holds s_log_mutex
static LogLevel effectiveLevel(const char* tag) {
    if (tag != nullptr && !s_tag_levels.empty()) {
        auto it = s_tag_levels.find(tag);
        if (it != s_tag_levels.end()) {
            return it->second;
        }
    }
    return s_global_level;
}

// ============================================================================
// Public API
// ============================================================================

void log_system_init() {
    std::lock_guard<std::mutex> lock(s_log_mutex);
    s_start = std::chrono::steady_clock::now();
}

void log_system_set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(s_log_mutex);
    s_global_level = level;
}

LogLevel log_system_get_level() {
    std::lock_guard<std::mutex> lock(s_log_mutex);
    return s_global_level;
}

void log_system_set_tag_level(const char* tag, LogLevel level) {
    if (tag == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(s_log_mutex);
    s_tag_levels[tag] = level;
}

bool log_system_parse_level(const char* name, LogLevel* out) {
    if (name == nullptr || out == nullptr) {
        return false;
    }
    for (const auto& entry : LEVEL_NAMES) {
        if (strcasecmp(entry.name, name) == 0) {
            *out = entry.level;
            return true;
        }
    }
    return false;
}

bool log_system_enabled(LogLevel level, const char* tag) {
    if (level == LOG_LEVEL_NONE) {
        return false;
    }
    std::lock_guard<std::mutex> lock(s_log_mutex);
    return level <= effectiveLevel(tag);
}

void log_system_write(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_system_vwrite(level, tag, fmt, args);
    va_end(args);
}

void log_system_vwrite(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!log_system_enabled(level, tag)) {
        return;
    }

    char message[LOG_MSG_LEN];
    vsnprintf(message, sizeof(message), fmt, args);

    std::lock_guard<std::mutex> lock(s_log_mutex);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - s_start).count();
    fprintf(stderr, "%c (%lld) %s: %s\n", levelLetter(level),
            static_cast<long long>(elapsed), tag ? tag : "-", message);
    fflush(stderr);
}
