/**
 * @file config_export.cpp
 * @brief Configuration Export/Import Domain Implementation
 */

#include "config_manager.h"
#include "../debug/log_system.h"
#include <ArduinoJson.h>
#include <cstdio>

static const char* TAG = "CFG_EXPORT";

// Show only enough of the key to tell two keys apart
static std::string maskSecret(const std::string& secret) {
    if (secret.empty()) {
        return "";
    }
    if (secret.size() <= 4) {
        return "****";
    }
    return secret.substr(0, 4) + "****";
}

// Export/Import Configuration

std::string ConfigManager::exportConfig() const {
    JsonDocument doc;

    doc["transport"] = getTransport();
    doc["serial_port"] = getSerialPort();
    doc["baud"] = getBaud();
    doc["i2c_bus"] = getI2cBus();
    doc["i2c_address"] = getI2cAddress();
    doc["charset"] = getCharset();
    doc["gpio_chip"] = getGpioChip();
    doc["button_pin"] = getButtonPin();
    doc["weather_pin"] = getWeatherPin();
    doc["button_hold_ms"] = getButtonHoldMs();
    doc["console_input"] = getConsoleInput();
    doc["catalogue_path"] = getCataloguePath();
    doc["refresh_interval_ms"] = getRefreshIntervalMs();
    doc["poll_interval_ms"] = getPollIntervalMs();
    doc["overlay_ms"] = getOverlayMs();
    doc["category_hold_ms"] = getCategoryHoldMs();
    doc["scroll_delay_ms"] = getScrollDelayMs();
    doc["openweather_api_key"] = maskSecret(getWeatherApiKey());
    doc["weather_city"] = getWeatherCity();
    doc["weather_lat"] = getWeatherLatitude();
    doc["weather_lon"] = getWeatherLongitude();
    doc["log_level"] = getLogLevel();

    std::string output;
    serializeJson(doc, output);
    return output;
}

// Numbers may be given as JSON numbers or as strings ("0x27")
static bool readInt(JsonVariantConst value, const char* key, long minValue, long maxValue,
                    long* out, int base = 10) {
    if (value.isNull()) {
        return false;
    }
    if (value.is<long>()) {
        const long number = value.as<long>();
        if (number >= minValue && number <= maxValue) {
            *out = number;
            return true;
        }
    } else if (value.is<const char*>() &&
               parseConfigInt(value.as<const char*>(), minValue, maxValue, out, base)) {
        return true;
    }
    MK_LOGW(TAG, "Ignoring invalid value for '%s'", key);
    return false;
}

// Coordinates may be JSON numbers or strings; kept as text for the query string
static bool readCoordinate(JsonVariantConst value, std::string* out) {
    if (value.is<const char*>()) {
        *out = value.as<const char*>();
        return true;
    }
    if (value.is<double>()) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%.4f", value.as<double>());
        *out = buf;
        return true;
    }
    return false;
}

bool ConfigManager::importConfig(const std::string& json) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json);

    if (error) {
        MK_LOGE(TAG, "Failed to parse config JSON: %s", error.c_str());
        return false;
    }
    if (!doc.is<JsonObjectConst>()) {
        MK_LOGE(TAG, "Config JSON must be an object");
        return false;
    }

    long number = 0;

    if (doc["transport"].is<const char*>()) {
        setTransport(doc["transport"].as<const char*>());
    }
    if (doc["serial_port"].is<const char*>()) {
        setSerialPort(doc["serial_port"].as<const char*>());
    }
    if (readInt(doc["baud"], "baud", 1200, 115200, &number)) {
        setBaud(static_cast<int>(number));
    }
    if (readInt(doc["i2c_bus"], "i2c_bus", 0, 255, &number)) {
        setI2cBus(static_cast<int>(number));
    }
    if (readInt(doc["i2c_address"], "i2c_address", 0x08, 0x77, &number, 0)) {
        setI2cAddress(static_cast<uint8_t>(number));
    }
    if (doc["charset"].is<const char*>()) {
        setCharset(doc["charset"].as<const char*>());
    }
    if (doc["gpio_chip"].is<const char*>()) {
        setGpioChip(doc["gpio_chip"].as<const char*>());
    }
    if (readInt(doc["button_pin"], "button_pin", MIN_GPIO_LINE, MAX_GPIO_LINE, &number)) {
        setButtonPin(static_cast<int>(number));
    }
    if (readInt(doc["weather_pin"], "weather_pin", MIN_GPIO_LINE, MAX_GPIO_LINE, &number)) {
        setWeatherPin(static_cast<int>(number));
    }
    if (readInt(doc["button_hold_ms"], "button_hold_ms", 0, 60000, &number)) {
        setButtonHoldMs(static_cast<unsigned long>(number));
    }
    if (doc["console_input"].is<bool>()) {
        setConsoleInput(doc["console_input"].as<bool>());
    }
    if (doc["catalogue_path"].is<const char*>()) {
        setCataloguePath(doc["catalogue_path"].as<const char*>());
    }
    if (readInt(doc["refresh_interval_ms"], "refresh_interval_ms", 0, 3600000, &number)) {
        setRefreshIntervalMs(static_cast<unsigned long>(number));
    }
    if (readInt(doc["poll_interval_ms"], "poll_interval_ms", 0, 10000, &number)) {
        setPollIntervalMs(static_cast<unsigned long>(number));
    }
    if (readInt(doc["overlay_ms"], "overlay_ms", 0, 60000, &number)) {
        setOverlayMs(static_cast<unsigned long>(number));
    }
    if (readInt(doc["category_hold_ms"], "category_hold_ms", 0, 60000, &number)) {
        setCategoryHoldMs(static_cast<unsigned long>(number));
    }
    if (readInt(doc["scroll_delay_ms"], "scroll_delay_ms", 0, 60000, &number)) {
        setScrollDelayMs(static_cast<unsigned long>(number));
    }
    if (doc["openweather_api_key"].is<const char*>()) {
        setWeatherApiKey(doc["openweather_api_key"].as<const char*>());
    }
    if (doc["weather_city"].is<const char*>()) {
        setWeatherCity(doc["weather_city"].as<const char*>());
    }

    std::string coordinate;
    if (readCoordinate(doc["weather_lat"], &coordinate)) {
        setWeatherLatitude(coordinate);
    }
    if (readCoordinate(doc["weather_lon"], &coordinate)) {
        setWeatherLongitude(coordinate);
    }

    if (doc["log_level"].is<const char*>()) {
        const char* name = doc["log_level"].as<const char*>();
        LogLevel level = LOG_LEVEL_INFO;
        if (log_system_parse_level(name, &level)) {
            setLogLevel(name);
        } else {
            MK_LOGW(TAG, "Ignoring invalid value for 'log_level'");
        }
    }

    MK_LOGI(TAG, "Configuration imported");
    return true;
}
