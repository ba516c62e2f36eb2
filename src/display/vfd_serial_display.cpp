/**
 * @file vfd_serial_display.cpp
 * @brief Serial VFD driver (termios, raw 8N1)
 */

#include "vfd_serial_display.h"
#include "text_codec.h"
#include "../debug/log_system.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

static const char* TAG = "VFD";

static constexpr char VFD_ESC = 0x1B;
static constexpr char VFD_INIT = '@';
static constexpr char VFD_HOME = 0x0B;

bool baudToSpeed(int baud, unsigned int* speed) {
    if (speed == nullptr) {
        return false;
    }
    switch (baud) {
        case 1200:   *speed = B1200; return true;
        case 2400:   *speed = B2400; return true;
        case 4800:   *speed = B4800; return true;
        case 9600:   *speed = B9600; return true;
        case 19200:  *speed = B19200; return true;
        case 38400:  *speed = B38400; return true;
        case 57600:  *speed = B57600; return true;
        case 115200: *speed = B115200; return true;
        default: return false;
    }
}

VfdSerialDisplay::VfdSerialDisplay(const std::string& port, int baud, Charset charset)
    : _port(port), _baud(baud), _charset(charset), _fd(-1), _writeFailed(false) {}

VfdSerialDisplay::~VfdSerialDisplay() {
    closePort();
}

void VfdSerialDisplay::closePort() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

bool VfdSerialDisplay::begin() {
    closePort();

    unsigned int speed = 0;
    if (!baudToSpeed(_baud, &speed)) {
        MK_LOGW(TAG, "Unsupported baud rate %d", _baud);
        return false;
    }

    _fd = ::open(_port.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (_fd < 0) {
        MK_LOGW(TAG, "Cannot open %s: %s", _port.c_str(), strerror(errno));
        return false;
    }

    struct termios tty;
    if (tcgetattr(_fd, &tty) != 0) {
        MK_LOGW(TAG, "%s is not a serial port: %s", _port.c_str(), strerror(errno));
        closePort();
        return false;
    }

    cfmakeraw(&tty);
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tty.c_cflag |= CS8 | CLOCAL | CREAD;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    cfsetispeed(&tty, static_cast<speed_t>(speed));
    cfsetospeed(&tty, static_cast<speed_t>(speed));

    if (tcsetattr(_fd, TCSANOW, &tty) != 0) {
        MK_LOGW(TAG, "Cannot configure %s: %s", _port.c_str(), strerror(errno));
        closePort();
        return false;
    }

    const std::string init = {VFD_ESC, VFD_INIT};
    if (!writeAll(init)) {
        MK_LOGW(TAG, "Initialize command failed on %s: %s", _port.c_str(), strerror(errno));
        closePort();
        return false;
    }

    _writeFailed = false;
    MK_LOGI(TAG, "VFD ready on %s at %d baud", _port.c_str(), _baud);
    return true;
}

void VfdSerialDisplay::write(const DisplayFrame& frame) {
    if (_fd < 0) {
        return;
    }

    std::string bytes(1, VFD_HOME);
    bytes.reserve(1 + DISPLAY_WIDTH * DISPLAY_HEIGHT);
    for (const std::string& row : frame.lines) {
        std::string encoded = encodeText(row, _charset);
        encoded.resize(DISPLAY_WIDTH, ' ');
        bytes += encoded;
    }

    const bool ok = writeAll(bytes);
    if (!ok && !_writeFailed) {
        MK_LOGW(TAG, "Write to %s failed: %s", _port.c_str(), strerror(errno));
    } else if (ok && _writeFailed) {
        MK_LOGI(TAG, "Write to %s recovered", _port.c_str());
    }
    _writeFailed = !ok;
}

bool VfdSerialDisplay::writeAll(const std::string& bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        const ssize_t n = ::write(_fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return tcdrain(_fd) == 0;
}
