/**
 * @file config_manager.h
 * @brief Layered configuration: defaults, JSON file, environment
 */

#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <cstdint>
#include <string>

#include "pin_config.h"
#include "../display/display_factory.h"
#include "../input/button_manager.h"
#include "../weather/weather_client.h"

// Environment variable that names the config file when no argument is given
#define CONFIG_PATH_ENV "MARKOSHKALCD_CONFIG"

// Default values
#define DEFAULT_TRANSPORT "serial"
#define DEFAULT_SERIAL_PORT "/dev/ttyUSB0"
#define DEFAULT_SERIAL_BAUD 9600
#define DEFAULT_I2C_BUS 1
#define DEFAULT_I2C_ADDRESS 0x27
#define DEFAULT_CHARSET "cp866"
#define DEFAULT_LOG_LEVEL "info"
#define DEFAULT_REFRESH_INTERVAL_MS 5000UL   // Content refresh period
#define DEFAULT_POLL_INTERVAL_MS 100UL       // Main loop tick
#define DEFAULT_OVERLAY_MS 1500UL            // Mode/category overlay hold
#define DEFAULT_CATEGORY_HOLD_MS 5000UL      // Category announcement hold
#define DEFAULT_SCROLL_DELAY_MS 800UL        // Per scroll frame

#define MIN_REFRESH_INTERVAL_MS 1000UL
#define MIN_POLL_INTERVAL_MS 10UL

/**
 * @brief Configuration Manager Class
 *
 * Values start at the compiled defaults; begin() layers the optional JSON
 * file and then the environment on top. Never persisted.
 */
class ConfigManager {
public:
    ConfigManager();

    /**
     * @brief Load the config file (if any) and environment overrides
     * @param configPath File path; nullptr or empty falls back to MARKOSHKALCD_CONFIG
     * @return false on a malformed config file (configuration error)
     */
    bool begin(const char* configPath);

    /**
     * @brief Merge a JSON config file
     * @return true when the file is missing (defaults stay) or parsed; false when malformed
     */
    bool loadFile(const std::string& path);

    /**
     * @brief Apply MARKOSHKALCD_* and weather environment variables
     *
     * Invalid numeric values are ignored with a warning.
     */
    void applyEnvironment();

    // Display Configuration
    std::string getTransport() const;
    void setTransport(const std::string& transport);
    std::string getSerialPort() const;
    void setSerialPort(const std::string& port);
    int getBaud() const;
    void setBaud(int baud);
    int getI2cBus() const;
    void setI2cBus(int bus);
    uint8_t getI2cAddress() const;
    void setI2cAddress(uint8_t address);
    std::string getCharset() const;
    void setCharset(const std::string& charset);

    // Input Configuration
    std::string getGpioChip() const;
    void setGpioChip(const std::string& chip);
    int getButtonPin() const;
    void setButtonPin(int pin);
    int getWeatherPin() const;
    void setWeatherPin(int pin);
    unsigned long getButtonHoldMs() const;
    void setButtonHoldMs(unsigned long hold_ms);
    bool getConsoleInput() const;
    void setConsoleInput(bool enabled);

    // Content Configuration
    std::string getCataloguePath() const;
    void setCataloguePath(const std::string& path);

    // Timing Configuration
    unsigned long getRefreshIntervalMs() const;
    void setRefreshIntervalMs(unsigned long interval_ms);
    unsigned long getPollIntervalMs() const;
    void setPollIntervalMs(unsigned long interval_ms);
    unsigned long getOverlayMs() const;
    void setOverlayMs(unsigned long hold_ms);
    unsigned long getCategoryHoldMs() const;
    void setCategoryHoldMs(unsigned long hold_ms);
    unsigned long getScrollDelayMs() const;
    void setScrollDelayMs(unsigned long delay_ms);

    // Weather Configuration
    std::string getWeatherApiKey() const;
    void setWeatherApiKey(const std::string& key);
    std::string getWeatherCity() const;
    void setWeatherCity(const std::string& city);
    std::string getWeatherLatitude() const;
    void setWeatherLatitude(const std::string& latitude);
    std::string getWeatherLongitude() const;
    void setWeatherLongitude(const std::string& longitude);

    // Logging
    std::string getLogLevel() const;
    void setLogLevel(const std::string& level);

    // Collaborator settings assembled from the values above
    DisplaySettings getDisplaySettings() const;
    WeatherConfig getWeatherConfig() const;
    ButtonConfig getModeButtonConfig() const;
    ButtonConfig getWeatherButtonConfig() const;

    // Export/Import configuration as JSON
    std::string exportConfig() const;
    bool importConfig(const std::string& json);

private:
    // Display
    std::string transport;
    std::string serial_port;
    int baud;
    int i2c_bus;
    uint8_t i2c_address;
    std::string charset;

    // Input
    std::string gpio_chip;
    int button_pin;
    int weather_pin;
    unsigned long button_hold_ms;
    bool console_input;

    // Content
    std::string catalogue_path;

    // Timing
    unsigned long refresh_interval_ms;
    unsigned long poll_interval_ms;
    unsigned long overlay_ms;
    unsigned long category_hold_ms;
    unsigned long scroll_delay_ms;

    // Weather
    std::string weather_api_key;
    std::string weather_city;
    std::string weather_lat;
    std::string weather_lon;

    std::string log_level;
};

/**
 * @brief Parse an integer
 * @param base 10, or 0 to auto-detect a "0x"/"0" prefix (used for I2C addresses)
 * @return false for empty input, trailing garbage or out-of-range values
 */
bool parseConfigInt(const char* text, long minValue, long maxValue, long* out, int base = 10);

/**
 * @brief Parse a boolean ("1/0", "true/false", "yes/no", "on/off")
 */
bool parseConfigBool(const char* text, bool* out);

#endif // CONFIG_MANAGER_H
