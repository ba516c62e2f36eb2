/**
 * @file config_env.cpp
 * @brief Environment variable overrides
 */

#include "config_manager.h"
#include "../debug/log_system.h"

#include <climits>
#include <cstdlib>

static const char* TAG = "CFG_ENV";

static const char* envValue(const char* name) {
    const char* value = getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

static bool envInt(const char* name, long minValue, long maxValue, long* out, int base = 10) {
    const char* value = envValue(name);
    if (value == nullptr) {
        return false;
    }
    if (!parseConfigInt(value, minValue, maxValue, out, base)) {
        MK_LOGW(TAG, "Ignoring invalid %s='%s'", name, value);
        return false;
    }
    return true;
}

void ConfigManager::applyEnvironment() {
    long number = 0;
    const char* value = nullptr;

    // Display
    if ((value = envValue("MARKOSHKALCD_TRANSPORT"))) {
        setTransport(value);
    }
    if ((value = envValue("MARKOSHKALCD_PORT"))) {
        setSerialPort(value);
    }
    if (envInt("MARKOSHKALCD_BAUD", 1200, 115200, &number)) {
        setBaud(static_cast<int>(number));
    }
    if (envInt("MARKOSHKALCD_I2C_BUS", 0, 255, &number)) {
        setI2cBus(static_cast<int>(number));
    }
    if (envInt("MARKOSHKALCD_ADDR", 0x08, 0x77, &number, 0)) {
        setI2cAddress(static_cast<uint8_t>(number));
    }
    if ((value = envValue("MARKOSHKALCD_CHARSET"))) {
        setCharset(value);
    }

    // Input
    if ((value = envValue("MARKOSHKALCD_GPIO_CHIP"))) {
        setGpioChip(value);
    }
    if (envInt("MARKOSHKALCD_BUTTON_PIN", MIN_GPIO_LINE, MAX_GPIO_LINE, &number)) {
        setButtonPin(static_cast<int>(number));
    }
    if (envInt("MARKOSHKALCD_WEATHER_PIN", MIN_GPIO_LINE, MAX_GPIO_LINE, &number)) {
        setWeatherPin(static_cast<int>(number));
    }
    if ((value = envValue("MARKOSHKALCD_CONSOLE_INPUT"))) {
        bool enabled = false;
        if (parseConfigBool(value, &enabled)) {
            setConsoleInput(enabled);
        } else {
            MK_LOGW(TAG, "Ignoring invalid MARKOSHKALCD_CONSOLE_INPUT='%s'", value);
        }
    }

    // Content
    if ((value = envValue("MARKOSHKALCD_CATALOGUE"))) {
        setCataloguePath(value);
    }

    // Logging
    if ((value = envValue("MARKOSHKALCD_LOG_LEVEL"))) {
        LogLevel level = LOG_LEVEL_INFO;
        if (log_system_parse_level(value, &level)) {
            setLogLevel(value);
        } else {
            MK_LOGW(TAG, "Ignoring invalid MARKOSHKALCD_LOG_LEVEL='%s'", value);
        }
    }

    // Weather
    if ((value = envValue("OPENWEATHER_API_KEY"))) {
        setWeatherApiKey(value);
    }
    if ((value = envValue("WEATHER_CITY"))) {
        setWeatherCity(value);
    }
    if ((value = envValue("WEATHER_LAT"))) {
        setWeatherLatitude(value);
    }
    if ((value = envValue("WEATHER_LON"))) {
        setWeatherLongitude(value);
    }
}
