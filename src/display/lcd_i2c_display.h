/**
 * @file lcd_i2c_display.h
 * @brief HD44780 20x2 LCD behind a PCF8574 I2C backpack
 *
 * Backpack wiring (the common "LCM1602 IIC" board):
 *   P0 = RS, P1 = RW, P2 = EN, P3 = backlight, P4..P7 = D4..D7
 */

#ifndef LCD_I2C_DISPLAY_H
#define LCD_I2C_DISPLAY_H

#include <cstdint>

#include "display_driver.h"
#include "../common/lookup_tables.h"

class LcdI2cDisplay : public DisplayDriver {
public:
    LcdI2cDisplay(int bus, uint8_t address, Charset charset);
    ~LcdI2cDisplay() override;

    LcdI2cDisplay(const LcdI2cDisplay&) = delete;
    LcdI2cDisplay& operator=(const LcdI2cDisplay&) = delete;

    bool begin() override;
    void write(const DisplayFrame& frame) override;
    const char* name() const override { return "i2c-lcd"; }

private:
    bool expanderWrite(uint8_t data);
    bool pulseEnable(uint8_t data);
    bool writeNibble(uint8_t nibble);
    bool send(uint8_t value, uint8_t mode);
    bool command(uint8_t value);
    void closeDevice();

    int _bus;
    uint8_t _address;
    Charset _charset;
    int _fd;
    bool _writeFailed;
};

#endif // LCD_I2C_DISPLAY_H
