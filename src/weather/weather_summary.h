/**
 * @file weather_summary.h
 * @brief Two-line weather screen text
 *
 * Line 1: "HH:MM DD.MM Пн"
 * Line 2: "<temp>° <hum>% <wind>м/с", each missing value shown as a bare "?"
 */

#ifndef WEATHER_SUMMARY_H
#define WEATHER_SUMMARY_H

#include <ctime>
#include <string>

#include "weather_provider.h"

std::string formatClockLine(const std::tm& local);

std::string formatConditionsLine(const WeatherReading& reading);

#endif // WEATHER_SUMMARY_H
