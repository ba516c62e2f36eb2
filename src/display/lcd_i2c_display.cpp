/**
 * @file lcd_i2c_display.cpp
 * @brief HD44780 over PCF8574 through Linux i2c-dev
 */

#include "lcd_i2c_display.h"
#include "text_codec.h"
#include "../debug/log_system.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <string>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>

static const char* TAG = "LCD";

// PCF8574 pins
static constexpr uint8_t PIN_RS = 0x01;
static constexpr uint8_t PIN_EN = 0x04;
static constexpr uint8_t PIN_BACKLIGHT = 0x08;

// HD44780 commands
static constexpr uint8_t CMD_CLEAR = 0x01;
static constexpr uint8_t CMD_ENTRY_MODE = 0x06;     // Increment, no shift
static constexpr uint8_t CMD_DISPLAY_ON = 0x0C;     // Display on, cursor off, blink off
static constexpr uint8_t CMD_FUNCTION_SET = 0x28;   // 4-bit, 2 lines, 5x8 font
static constexpr uint8_t CMD_SET_DDRAM = 0x80;

static constexpr uint8_t ROW_OFFSETS[DISPLAY_HEIGHT] = {0x00, 0x40};

static void sleepUs(unsigned int us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

LcdI2cDisplay::LcdI2cDisplay(int bus, uint8_t address, Charset charset)
    : _bus(bus), _address(address), _charset(charset), _fd(-1), _writeFailed(false) {}

LcdI2cDisplay::~LcdI2cDisplay() {
    closeDevice();
}

void LcdI2cDisplay::closeDevice() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

bool LcdI2cDisplay::begin() {
    closeDevice();

    const std::string path = "/dev/i2c-" + std::to_string(_bus);
    _fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (_fd < 0) {
        MK_LOGW(TAG, "Cannot open %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    if (ioctl(_fd, I2C_SLAVE, _address) < 0) {
        MK_LOGW(TAG, "Cannot select I2C address 0x%02X: %s", _address, strerror(errno));
        closeDevice();
        return false;
    }

    // Probe: a missing backpack NAKs the first write
    if (!expanderWrite(PIN_BACKLIGHT)) {
        MK_LOGW(TAG, "No device at 0x%02X on %s", _address, path.c_str());
        closeDevice();
        return false;
    }

    // HD44780 4-bit initialization by instruction
    sleepUs(50000);
    bool ok = writeNibble(0x30);
    sleepUs(4500);
    ok = ok && writeNibble(0x30);
    sleepUs(4500);
    ok = ok && writeNibble(0x30);
    sleepUs(150);
    ok = ok && writeNibble(0x20);

    ok = ok && command(CMD_FUNCTION_SET);
    ok = ok && command(CMD_DISPLAY_ON);
    ok = ok && command(CMD_CLEAR);
    sleepUs(2000);
    ok = ok && command(CMD_ENTRY_MODE);

    if (!ok) {
        MK_LOGW(TAG, "Initialization sequence failed at 0x%02X", _address);
        closeDevice();
        return false;
    }

    _writeFailed = false;
    MK_LOGI(TAG, "LCD ready on %s at 0x%02X", path.c_str(), _address);
    return true;
}

void LcdI2cDisplay::write(const DisplayFrame& frame) {
    if (_fd < 0) {
        return;
    }

    bool ok = true;
    for (size_t row = 0; row < DISPLAY_HEIGHT && ok; row++) {
        ok = command(CMD_SET_DDRAM | ROW_OFFSETS[row]);
        const std::string bytes = encodeText(frame.lines[row], _charset);
        for (size_t col = 0; col < DISPLAY_WIDTH && ok; col++) {
            const uint8_t value = col < bytes.size() ? static_cast<uint8_t>(bytes[col]) : ' ';
            ok = send(value, PIN_RS);
        }
    }

    // One log line per outage
    if (!ok && !_writeFailed) {
        MK_LOGW(TAG, "Write failed: %s", strerror(errno));
    } else if (ok && _writeFailed) {
        MK_LOGI(TAG, "Write recovered");
    }
    _writeFailed = !ok;
}

bool LcdI2cDisplay::expanderWrite(uint8_t data) {
    const uint8_t value = data | PIN_BACKLIGHT;
    return ::write(_fd, &value, 1) == 1;
}

bool LcdI2cDisplay::pulseEnable(uint8_t data) {
    if (!expanderWrite(data | PIN_EN)) {
        return false;
    }
    sleepUs(1);
    if (!expanderWrite(static_cast<uint8_t>(data & ~PIN_EN))) {
        return false;
    }
    sleepUs(50);
    return true;
}

bool LcdI2cDisplay::writeNibble(uint8_t nibble) {
    return expanderWrite(nibble) && pulseEnable(nibble);
}

bool LcdI2cDisplay::send(uint8_t value, uint8_t mode) {
    const uint8_t high = value & 0xF0;
    const uint8_t low = static_cast<uint8_t>((value << 4) & 0xF0);
    return writeNibble(high | mode) && writeNibble(low | mode);
}

bool LcdI2cDisplay::command(uint8_t value) {
    return send(value, 0);
}
