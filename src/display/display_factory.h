/**
 * @file display_factory.h
 * @brief Builds the display driver named by configuration, with fallbacks
 *
 * Fallback chains:
 *   serial  -> serial VFD, I2C LCD, console
 *   i2c     -> I2C LCD, console
 *   console -> console
 * The console driver is always available, so create() never returns null.
 */

#ifndef DISPLAY_FACTORY_H
#define DISPLAY_FACTORY_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "display_driver.h"
#include "../common/lookup_tables.h"

/**
 * @brief Everything the factory needs to build any transport
 */
struct DisplaySettings {
    DisplayTransport transport = DisplayTransport::SERIAL_VFD;
    std::string serial_port = "/dev/ttyUSB0";
    int baud = 9600;
    int i2c_bus = 1;
    uint8_t i2c_address = 0x27;
    Charset charset = Charset::CP866;
};

class DisplayFactory {
public:
    virtual ~DisplayFactory() = default;

    /**
     * @brief Build and begin() the first driver in the chain that succeeds
     */
    std::unique_ptr<DisplayDriver> create(const DisplaySettings& settings);

    /**
     * @brief Transports tried for a requested transport, in order
     */
    static std::vector<DisplayTransport> fallbackChain(DisplayTransport requested);

protected:
    // Overridden in tests to avoid touching real devices
    virtual std::unique_ptr<DisplayDriver> makeDriver(DisplayTransport transport,
                                                      const DisplaySettings& settings);
};

#endif // DISPLAY_FACTORY_H
