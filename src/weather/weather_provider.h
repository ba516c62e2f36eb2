/**
 * @file weather_provider.h
 * @brief Weather collaborator contract
 */

#ifndef WEATHER_PROVIDER_H
#define WEATHER_PROVIDER_H

#include <string>

/**
 * @brief Snapshot of current conditions; any field may be missing
 */
struct WeatherReading {
    bool has_temperature = false;
    float temperature = 0.0f;       // °C
    bool has_humidity = false;
    float humidity = 0.0f;          // % relative
    bool has_wind_speed = false;
    float wind_speed = 0.0f;        // m/s
    std::string location_name;      // Empty when the provider does not report one
    unsigned long fetched_at_ms = 0;  // Clock::millis() at fetch time
};

/**
 * @brief Source of weather readings
 *
 * fetch() never throws and never reports transport details: a reading is
 * either available or not.
 */
class WeatherProvider {
public:
    virtual ~WeatherProvider() = default;

    /**
     * @param out Receives the reading on success
     * @return false when no reading is available
     */
    virtual bool fetch(WeatherReading* out) = 0;
};

#endif // WEATHER_PROVIDER_H
