/**
 * @file display_factory.cpp
 * @brief Display transport selection
 */

#include "display_factory.h"
#include "console_display.h"
#include "lcd_i2c_display.h"
#include "vfd_serial_display.h"
#include "../debug/log_system.h"

static const char* TAG = "DISPLAY";

std::vector<DisplayTransport> DisplayFactory::fallbackChain(DisplayTransport requested) {
    switch (requested) {
        case DisplayTransport::I2C_LCD:
            return {DisplayTransport::I2C_LCD, DisplayTransport::CONSOLE};
        case DisplayTransport::CONSOLE:
            return {DisplayTransport::CONSOLE};
        case DisplayTransport::SERIAL_VFD:
        case DisplayTransport::UNKNOWN:
            break;
    }
    return {DisplayTransport::SERIAL_VFD, DisplayTransport::I2C_LCD, DisplayTransport::CONSOLE};
}

std::unique_ptr<DisplayDriver> DisplayFactory::makeDriver(DisplayTransport transport,
                                                          const DisplaySettings& settings) {
    switch (transport) {
        case DisplayTransport::SERIAL_VFD:
            return std::unique_ptr<DisplayDriver>(
                new VfdSerialDisplay(settings.serial_port, settings.baud, settings.charset));
        case DisplayTransport::I2C_LCD:
            return std::unique_ptr<DisplayDriver>(
                new LcdI2cDisplay(settings.i2c_bus, settings.i2c_address, settings.charset));
        case DisplayTransport::CONSOLE:
        case DisplayTransport::UNKNOWN:
            break;
    }
    return std::unique_ptr<DisplayDriver>(new ConsoleDisplay());
}

std::unique_ptr<DisplayDriver> DisplayFactory::create(const DisplaySettings& settings) {
    if (settings.transport == DisplayTransport::UNKNOWN) {
        MK_LOGW(TAG, "Unknown display transport, using serial");
    }

    for (DisplayTransport transport : fallbackChain(settings.transport)) {
        std::unique_ptr<DisplayDriver> driver = makeDriver(transport, settings);
        if (driver && driver->begin()) {
            MK_LOGI(TAG, "Using %s display", driver->name());
            return driver;
        }
        MK_LOGW(TAG, "%s display unavailable, trying next transport",
                TransportLookup::getName(transport));
    }

    // Console never fails to begin with stdout; this covers a closed stdout
    MK_LOGE(TAG, "No display transport available, output goes nowhere");
    return std::unique_ptr<DisplayDriver>(new ConsoleDisplay(nullptr));
}
