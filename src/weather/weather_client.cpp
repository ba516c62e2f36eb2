/**
 * @file weather_client.cpp
 * @brief Weather client implementation
 */

#include "weather_client.h"
#include "../common/clock.h"
#include "../common/http_utils.h"
#include "../debug/log_system.h"

#include <ArduinoJson.h>
#include <cmath>
#include <ctime>

static const char* TAG = "WEATHER";

// Adding +0.0f turns a rounded -0 into 0 so it never prints as "-0"
static float roundTo(float value, float step) {
    return std::round(value / step) * step + 0.0f;
}

// =============================================================================
// Parsers
// =============================================================================

bool parseOpenWeatherResponse(const std::string& body, WeatherReading* out) {
    if (out == nullptr) {
        return false;
    }

    JsonDocument doc;
    if (!parseJsonResponse(body, doc, "OpenWeather")) {
        return false;
    }

    JsonVariantConst temp = doc["main"]["temp"];
    if (!temp.is<float>()) {
        MK_LOGW(TAG, "OpenWeather response has no main.temp");
        return false;
    }

    WeatherReading reading;
    reading.has_temperature = true;
    reading.temperature = roundTo(temp.as<float>(), 1.0f);

    JsonVariantConst humidity = doc["main"]["humidity"];
    if (humidity.is<float>()) {
        reading.has_humidity = true;
        reading.humidity = roundTo(humidity.as<float>(), 1.0f);
    }

    reading.has_wind_speed = true;
    reading.wind_speed = roundTo(doc["wind"]["speed"] | 0.0f, 0.1f);
    reading.location_name = doc["name"] | "";

    *out = reading;
    return true;
}

bool parseOpenMeteoCurrent(const std::string& body, WeatherReading* out) {
    if (out == nullptr) {
        return false;
    }

    JsonDocument doc;
    if (!parseJsonResponse(body, doc, "Open-Meteo")) {
        return false;
    }

    JsonObjectConst current = doc["current_weather"];
    if (current.isNull()) {
        MK_LOGW(TAG, "Open-Meteo response has no current_weather");
        return false;
    }

    WeatherReading reading;
    JsonVariantConst temp = current["temperature"];
    if (temp.is<float>()) {
        reading.has_temperature = true;
        reading.temperature = roundTo(temp.as<float>(), 1.0f);
    }
    reading.has_wind_speed = true;
    reading.wind_speed = roundTo(current["windspeed"] | 0.0f, 0.1f);

    *out = reading;
    return true;
}

bool parseOpenMeteoHumidity(const std::string& body, int hourIndex, float* humidity) {
    if (humidity == nullptr) {
        return false;
    }

    JsonDocument doc;
    if (!parseJsonResponse(body, doc, "Open-Meteo hourly")) {
        return false;
    }

    JsonArrayConst values = doc["hourly"]["relativehumidity_2m"];
    if (values.isNull() || values.size() == 0) {
        return false;
    }

    JsonVariantConst value = values[0];
    if (hourIndex >= 0 && static_cast<size_t>(hourIndex) < values.size()) {
        value = values[static_cast<size_t>(hourIndex)];
    }
    if (!value.is<float>()) {
        return false;
    }

    *humidity = roundTo(value.as<float>(), 1.0f);
    return true;
}

// =============================================================================
// WeatherClient
// =============================================================================

WeatherClient::WeatherClient(HttpTransport& transport, const Clock& clock, const WeatherConfig& config)
    : _transport(transport),
      _clock(clock),
      _config(config),
      _backoff(clock, WEATHER_RETRY_MIN_MS, WEATHER_RETRY_MAX_MS),
      _hasCache(false) {}

void WeatherClient::invalidate() {
    _hasCache = false;
    _cache = WeatherReading();
    _backoff.reset();
}

bool WeatherClient::fetch(WeatherReading* out) {
    if (out == nullptr) {
        return false;
    }

    const unsigned long now = _clock.millis();
    if (_hasCache && (now - _cache.fetched_at_ms) < _config.cache_ttl_ms) {
        *out = _cache;
        return true;
    }

    if (!_backoff.isReady()) {
        MK_LOGD(TAG, "Retry in %lu ms", _backoff.getTimeUntilReady());
        return false;
    }

    WeatherReading reading;
    const bool ok = _config.api_key.empty() ? fetchOpenMeteo(&reading) : fetchOpenWeather(&reading);
    if (!ok) {
        _backoff.recordFailure();
        MK_LOGW(TAG, "Weather unavailable, next attempt in %lu s",
                _backoff.getCurrentDelay() / 1000);
        return false;
    }

    _backoff.recordSuccess();
    reading.fetched_at_ms = now;
    _cache = reading;
    _hasCache = true;

    MK_LOGI(TAG, "Updated: temp=%s%.0f hum=%s%.0f wind=%.1f",
            reading.has_temperature ? "" : "?", reading.temperature,
            reading.has_humidity ? "" : "?", reading.humidity, reading.wind_speed);

    *out = reading;
    return true;
}

bool WeatherClient::fetchOpenWeather(WeatherReading* out) {
    HttpClientBuilder builder(_config.openweather_url);
    builder.withQuery("q", _config.city)
           .withQuery("appid", _config.api_key)
           .withQuery("units", "metric")
           .withQuery("lang", "ru")
           .withTimeout(_config.timeout_ms);

    HttpResponse response;
    if (!builder.get(_transport, &response) || !handleHttpError(response, "openweather")) {
        return false;
    }
    return parseOpenWeatherResponse(response.body, out);
}

bool WeatherClient::fetchOpenMeteo(WeatherReading* out) {
    HttpClientBuilder current(_config.open_meteo_url);
    current.withQuery("latitude", _config.latitude)
           .withQuery("longitude", _config.longitude)
           .withQuery("current_weather", "true")
           .withQuery("windspeed_unit", "ms")
           .withTimeout(_config.timeout_ms);

    HttpResponse response;
    if (!current.get(_transport, &response) || !handleHttpError(response, "open-meteo")) {
        return false;
    }
    if (!parseOpenMeteoCurrent(response.body, out)) {
        return false;
    }

    // Humidity is best effort: the reading stands without it
    HttpClientBuilder hourly(_config.open_meteo_url);
    hourly.withQuery("latitude", _config.latitude)
          .withQuery("longitude", _config.longitude)
          .withQuery("hourly", "relativehumidity_2m")
          .withQuery("forecast_days", "1")
          .withQuery("timezone", "UTC")
          .withTimeout(_config.timeout_ms);

    HttpResponse humidityResponse;
    if (!hourly.get(_transport, &humidityResponse) ||
        !handleHttpError(humidityResponse, "open-meteo humidity")) {
        return true;
    }

    std::time_t wall = _clock.wallTime();
    std::tm utc{};
    gmtime_r(&wall, &utc);

    float humidity = 0.0f;
    if (parseOpenMeteoHumidity(humidityResponse.body, utc.tm_hour, &humidity)) {
        out->has_humidity = true;
        out->humidity = humidity;
    } else {
        MK_LOGD(TAG, "Open-Meteo humidity missing");
    }
    return true;
}
