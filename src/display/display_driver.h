/**
 * @file display_driver.h
 * @brief Output contract shared by every display transport
 */

#ifndef DISPLAY_DRIVER_H
#define DISPLAY_DRIVER_H

#include "display_frame.h"

/**
 * @brief A 20x2 character display
 *
 * write() is fire-and-forget: transport errors are logged by the driver and
 * never reported back to the loop.
 */
class DisplayDriver {
public:
    virtual ~DisplayDriver() = default;

    /**
     * @brief Acquire the hardware
     * @return false when the device is missing or cannot be configured
     */
    virtual bool begin() = 0;

    /**
     * @brief Show a normalized frame
     */
    virtual void write(const DisplayFrame& frame) = 0;

    /**
     * @brief Short name for logs
     */
    virtual const char* name() const = 0;
};

#endif // DISPLAY_DRIVER_H
