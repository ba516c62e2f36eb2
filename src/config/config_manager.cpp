/**
 * @file config_manager.cpp
 * @brief Configuration Manager Implementation
 */

#include "config_manager.h"
#include "config_macros.h"
#include "../debug/log_system.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <strings.h>

static const char* TAG = "CONFIG";

ConfigManager::ConfigManager()
    : transport(DEFAULT_TRANSPORT),
      serial_port(DEFAULT_SERIAL_PORT),
      baud(DEFAULT_SERIAL_BAUD),
      i2c_bus(DEFAULT_I2C_BUS),
      i2c_address(DEFAULT_I2C_ADDRESS),
      charset(DEFAULT_CHARSET),
      gpio_chip(DEFAULT_GPIO_CHIP),
      button_pin(DEFAULT_BUTTON_PIN),
      weather_pin(DEFAULT_WEATHER_PIN),
      button_hold_ms(DEFAULT_BUTTON_HOLD_MS),
      console_input(false),
      refresh_interval_ms(DEFAULT_REFRESH_INTERVAL_MS),
      poll_interval_ms(DEFAULT_POLL_INTERVAL_MS),
      overlay_ms(DEFAULT_OVERLAY_MS),
      category_hold_ms(DEFAULT_CATEGORY_HOLD_MS),
      scroll_delay_ms(DEFAULT_SCROLL_DELAY_MS),
      weather_city(DEFAULT_WEATHER_CITY),
      weather_lat(DEFAULT_WEATHER_LAT),
      weather_lon(DEFAULT_WEATHER_LON),
      log_level(DEFAULT_LOG_LEVEL) {}

bool ConfigManager::begin(const char* configPath) {
    std::string path = configPath ? configPath : "";
    if (path.empty()) {
        const char* fromEnv = getenv(CONFIG_PATH_ENV);
        path = fromEnv ? fromEnv : "";
    }

    if (!path.empty() && !loadFile(path)) {
        return false;
    }

    applyEnvironment();
    return true;
}

bool ConfigManager::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        MK_LOGI(TAG, "No config file at %s, using defaults", path.c_str());
        return true;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    if (!importConfig(contents.str())) {
        MK_LOGE(TAG, "Config file %s is malformed", path.c_str());
        return false;
    }

    MK_LOGI(TAG, "Loaded config from %s", path.c_str());
    return true;
}

// Display Configuration

CONFIG_STRING_GETTER(Transport, transport)
CONFIG_STRING_SETTER(Transport, transport)
CONFIG_STRING_GETTER(SerialPort, serial_port)
CONFIG_STRING_SETTER(SerialPort, serial_port)
CONFIG_INT_GETTER(Baud, int, baud)
CONFIG_INT_SETTER_MIN(Baud, int, baud, 1200)
CONFIG_INT_GETTER(I2cBus, int, i2c_bus)
CONFIG_INT_SETTER_MIN(I2cBus, int, i2c_bus, 0)
CONFIG_INT_GETTER(I2cAddress, uint8_t, i2c_address)

void ConfigManager::setI2cAddress(uint8_t address) {
    // 7-bit addresses only; 0x00-0x07 and 0x78-0x7F are reserved
    if (address < 0x08 || address > 0x77) {
        MK_LOGW(TAG, "I2C address 0x%02X out of range, keeping 0x%02X", address, i2c_address);
        return;
    }
    i2c_address = address;
}

CONFIG_STRING_GETTER(Charset, charset)
CONFIG_STRING_SETTER(Charset, charset)

// Input Configuration

CONFIG_STRING_GETTER(GpioChip, gpio_chip)
CONFIG_STRING_SETTER(GpioChip, gpio_chip)
CONFIG_INT_GETTER(ButtonPin, int, button_pin)
CONFIG_INT_SETTER_MIN(ButtonPin, int, button_pin, MIN_GPIO_LINE)
CONFIG_INT_GETTER(WeatherPin, int, weather_pin)
CONFIG_INT_SETTER_MIN(WeatherPin, int, weather_pin, MIN_GPIO_LINE)
CONFIG_INT_GETTER(ButtonHoldMs, unsigned long, button_hold_ms)
CONFIG_INT_SETTER_MIN(ButtonHoldMs, unsigned long, button_hold_ms, 100UL)
CONFIG_BOOL_GETTER(ConsoleInput, console_input)
CONFIG_BOOL_SETTER(ConsoleInput, console_input)

// Content Configuration

CONFIG_STRING_GETTER(CataloguePath, catalogue_path)
CONFIG_STRING_SETTER(CataloguePath, catalogue_path)

// Timing Configuration

CONFIG_INT_GETTER(RefreshIntervalMs, unsigned long, refresh_interval_ms)
CONFIG_INT_SETTER_MIN(RefreshIntervalMs, unsigned long, refresh_interval_ms, MIN_REFRESH_INTERVAL_MS)
CONFIG_INT_GETTER(PollIntervalMs, unsigned long, poll_interval_ms)
CONFIG_INT_SETTER_MIN(PollIntervalMs, unsigned long, poll_interval_ms, MIN_POLL_INTERVAL_MS)
CONFIG_INT_GETTER(OverlayMs, unsigned long, overlay_ms)
CONFIG_INT_SETTER(OverlayMs, unsigned long, overlay_ms)
CONFIG_INT_GETTER(CategoryHoldMs, unsigned long, category_hold_ms)
CONFIG_INT_SETTER(CategoryHoldMs, unsigned long, category_hold_ms)
CONFIG_INT_GETTER(ScrollDelayMs, unsigned long, scroll_delay_ms)
CONFIG_INT_SETTER(ScrollDelayMs, unsigned long, scroll_delay_ms)

// Weather Configuration

CONFIG_STRING_GETTER(WeatherApiKey, weather_api_key)
CONFIG_STRING_SETTER(WeatherApiKey, weather_api_key)
CONFIG_STRING_GETTER(WeatherCity, weather_city)
CONFIG_STRING_SETTER(WeatherCity, weather_city)
CONFIG_STRING_GETTER(WeatherLatitude, weather_lat)
CONFIG_STRING_SETTER(WeatherLatitude, weather_lat)
CONFIG_STRING_GETTER(WeatherLongitude, weather_lon)
CONFIG_STRING_SETTER(WeatherLongitude, weather_lon)

// Logging

CONFIG_STRING_GETTER(LogLevel, log_level)
CONFIG_STRING_SETTER(LogLevel, log_level)

// Collaborator settings

DisplaySettings ConfigManager::getDisplaySettings() const {
    DisplaySettings settings;
    settings.transport = TransportLookup::getTransport(transport.c_str());
    settings.serial_port = serial_port;
    settings.baud = baud;
    settings.i2c_bus = i2c_bus;
    settings.i2c_address = i2c_address;

    settings.charset = CharsetLookup::getCharset(charset.c_str());
    if (settings.charset == Charset::UNKNOWN) {
        MK_LOGW(TAG, "Unknown charset '%s', using %s", charset.c_str(), DEFAULT_CHARSET);
        settings.charset = Charset::CP866;
    }
    return settings;
}

WeatherConfig ConfigManager::getWeatherConfig() const {
    WeatherConfig config;
    config.api_key = weather_api_key;
    config.city = weather_city.empty() ? std::string(DEFAULT_WEATHER_CITY) : weather_city;
    config.latitude = weather_lat;
    config.longitude = weather_lon;
    return config;
}

ButtonConfig ConfigManager::getModeButtonConfig() const {
    ButtonConfig config;
    config.chip_path = gpio_chip;
    config.line = button_pin;
    config.hold_ms = button_hold_ms;
    config.label = "markoshka-mode";
    return config;
}

ButtonConfig ConfigManager::getWeatherButtonConfig() const {
    ButtonConfig config;
    config.chip_path = gpio_chip;
    config.line = weather_pin;
    config.hold_ms = button_hold_ms;
    config.label = "markoshka-weather";
    return config;
}

// Parsing helpers

bool parseConfigInt(const char* text, long minValue, long maxValue, long* out, int base) {
    if (text == nullptr || text[0] == '\0' || out == nullptr) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const long value = strtol(text, &end, base);
    if (errno != 0 || end == text) {
        return false;
    }
    while (*end == ' ' || *end == '\t') {
        end++;
    }
    if (*end != '\0' || value < minValue || value > maxValue) {
        return false;
    }

    *out = value;
    return true;
}

bool parseConfigBool(const char* text, bool* out) {
    if (text == nullptr || out == nullptr) {
        return false;
    }
    static const char* const TRUE_WORDS[] = {"1", "true", "yes", "on"};
    static const char* const FALSE_WORDS[] = {"0", "false", "no", "off"};

    for (const char* word : TRUE_WORDS) {
        if (strcasecmp(text, word) == 0) {
            *out = true;
            return true;
        }
    }
    for (const char* word : FALSE_WORDS) {
        if (strcasecmp(text, word) == 0) {
            *out = false;
            return true;
        }
    }
    return false;
}
