/**
 * @file weather_summary.cpp
 * @brief Two-line weather screen text
 */

#include "weather_summary.h"
#include "../common/lookup_tables.h"

#include <cstdio>

std::string formatClockLine(const std::tm& local) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d:%02d %02d.%02d ",
             local.tm_hour, local.tm_min, local.tm_mday, local.tm_mon + 1);
    return std::string(buf) + WeekdayLookup::getAbbrev(local.tm_wday);
}

// Missing values render as a bare "?" without their unit
static void appendField(std::string& line, bool present, const char* format, float value,
                        const char* unit) {
    if (!line.empty()) {
        line += ' ';
    }
    if (!present) {
        line += '?';
        return;
    }
    char buf[16];
    snprintf(buf, sizeof(buf), format, value);
    line += buf;
    line += unit;
}

std::string formatConditionsLine(const WeatherReading& reading) {
    std::string line;
    line.reserve(32);
    appendField(line, reading.has_temperature, "%.0f", reading.temperature, "°");
    appendField(line, reading.has_humidity, "%.0f", reading.humidity, "%");
    appendField(line, reading.has_wind_speed, "%.1f", reading.wind_speed, "м/с");
    return line;
}
