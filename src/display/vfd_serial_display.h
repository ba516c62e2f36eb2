/**
 * @file vfd_serial_display.h
 * @brief PD2800-class 20x2 customer display (VFD) on a serial port
 *
 * Command subset used:
 *   ESC '@'  initialize (clears the screen, cursor home)
 *   0x0B     cursor home; the next 40 bytes fill row 1 then row 2
 */

#ifndef VFD_SERIAL_DISPLAY_H
#define VFD_SERIAL_DISPLAY_H

#include <string>

#include "display_driver.h"
#include "../common/lookup_tables.h"

class VfdSerialDisplay : public DisplayDriver {
public:
    VfdSerialDisplay(const std::string& port, int baud, Charset charset);
    ~VfdSerialDisplay() override;

    VfdSerialDisplay(const VfdSerialDisplay&) = delete;
    VfdSerialDisplay& operator=(const VfdSerialDisplay&) = delete;

    bool begin() override;
    void write(const DisplayFrame& frame) override;
    const char* name() const override { return "serial-vfd"; }

private:
    bool writeAll(const std::string& bytes);
    void closePort();

    std::string _port;
    int _baud;
    Charset _charset;
    int _fd;
    bool _writeFailed;
};

/**
 * @brief Map a numeric baud rate to a termios speed constant
 * @return false for rates the driver does not support
 */
bool baudToSpeed(int baud, unsigned int* speed);

#endif // VFD_SERIAL_DISPLAY_H
