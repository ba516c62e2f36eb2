/**
 * @file weather_client.h
 * @brief OpenWeatherMap / Open-Meteo client with a same-day cache
 *
 * Provider choice:
 * - API key configured: OpenWeatherMap current weather for a city
 * - otherwise: Open-Meteo current weather for coordinates, plus a
 *   best-effort hourly humidity request
 *
 * A successful reading is reused for cache_ttl_ms (24 h). Failures are not
 * cached; retries are spaced by an exponential backoff so an outage does
 * not turn the 5 s content refresh into a request storm.
 */

#ifndef WEATHER_CLIENT_H
#define WEATHER_CLIENT_H

#include <string>

#include "weather_provider.h"
#include "../common/timer_utils.h"

class Clock;
class HttpTransport;

// Defaults
constexpr unsigned long WEATHER_CACHE_TTL_MS = 24UL * 3600UL * 1000UL;
constexpr long WEATHER_HTTP_TIMEOUT_MS = 5000;
constexpr unsigned long WEATHER_RETRY_MIN_MS = 60UL * 1000UL;
constexpr unsigned long WEATHER_RETRY_MAX_MS = 3600UL * 1000UL;
#define DEFAULT_WEATHER_CITY "Moscow"
#define DEFAULT_WEATHER_LAT "47.2357"
#define DEFAULT_WEATHER_LON "39.7015"
#define OPENWEATHER_URL "https://api.openweathermap.org/data/2.5/weather"
#define OPEN_METEO_URL "https://api.open-meteo.com/v1/forecast"

/**
 * @brief Weather client settings
 */
struct WeatherConfig {
    std::string api_key;                       // OpenWeatherMap key; empty selects Open-Meteo
    std::string city = DEFAULT_WEATHER_CITY;
    std::string latitude = DEFAULT_WEATHER_LAT;
    std::string longitude = DEFAULT_WEATHER_LON;
    std::string openweather_url = OPENWEATHER_URL;
    std::string open_meteo_url = OPEN_METEO_URL;
    long timeout_ms = WEATHER_HTTP_TIMEOUT_MS;
    unsigned long cache_ttl_ms = WEATHER_CACHE_TTL_MS;
};

class WeatherClient : public WeatherProvider {
public:
    WeatherClient(HttpTransport& transport, const Clock& clock, const WeatherConfig& config);

    bool fetch(WeatherReading* out) override;

    /**
     * @brief Drop the cached reading and any pending backoff
     */
    void invalidate();

    bool hasCachedReading() const { return _hasCache; }

private:
    bool fetchOpenWeather(WeatherReading* out);
    bool fetchOpenMeteo(WeatherReading* out);

    HttpTransport& _transport;
    const Clock& _clock;
    WeatherConfig _config;
    ExponentialBackoff _backoff;
    bool _hasCache;
    WeatherReading _cache;
};

// =============================================================================
// Response parsers (no network; unit tested directly)
// =============================================================================

/**
 * @brief Parse an OpenWeatherMap /data/2.5/weather response
 *
 * main.temp is required. Temperature is rounded to a whole degree, wind to
 * one decimal; missing wind counts as calm.
 */
bool parseOpenWeatherResponse(const std::string& body, WeatherReading* out);

/**
 * @brief Parse an Open-Meteo current_weather response
 *
 * Temperature is optional. Missing wind counts as calm.
 */
bool parseOpenMeteoCurrent(const std::string& body, WeatherReading* out);

/**
 * @brief Read hourly relative humidity at hourIndex (falls back to the first value)
 */
bool parseOpenMeteoHumidity(const std::string& body, int hourIndex, float* humidity);

#endif // WEATHER_CLIENT_H
