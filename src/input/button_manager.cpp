/**
 * @file button_manager.cpp
 * @brief GPIO button reader (gpio chardev line events)
 */

#include "button_manager.h"
#include "../debug/log_system.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/gpio.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>

static const char* TAG = "BUTTON";

// Reader wakes this often to notice close()
static constexpr int POLL_TIMEOUT_MS = 100;

// =============================================================================
// PressDetector
// =============================================================================

PressDetector::PressDetector(unsigned long holdMs, unsigned long debounceMs)
    : _holdMs(holdMs), _debounceMs(debounceMs), _pressed(false), _pressedAt(0) {}

void PressDetector::onPressed(unsigned long timeMs) {
    _pressed = true;
    _pressedAt = timeMs;
}

PressType PressDetector::onReleased(unsigned long timeMs) {
    if (!_pressed) {
        return PressType::NONE;
    }
    _pressed = false;

    const unsigned long duration = timeMs - _pressedAt;
    if (duration < _debounceMs) {
        return PressType::NONE;
    }
    return duration >= _holdMs ? PressType::LONG : PressType::SHORT;
}

// =============================================================================
// ButtonManager
// =============================================================================

ButtonManager::ButtonManager(const ButtonConfig& config, ButtonCallback onShort, ButtonCallback onLong)
    : _config(config),
      _onShort(std::move(onShort)),
      _onLong(std::move(onLong)),
      _lineFd(-1),
      _stop(false) {}

ButtonManager::~ButtonManager() {
    close();
}

bool ButtonManager::begin() {
    if (_lineFd >= 0) {
        return true;
    }
    if (_config.line < 0) {
        MK_LOGW(TAG, "No GPIO line configured, button disabled");
        return false;
    }

    const int chipFd = ::open(_config.chip_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (chipFd < 0) {
        MK_LOGW(TAG, "Cannot open %s: %s; button on line %d disabled",
                _config.chip_path.c_str(), strerror(errno), _config.line);
        return false;
    }

    struct gpioevent_request request;
    memset(&request, 0, sizeof(request));
    request.lineoffset = static_cast<__u32>(_config.line);
    request.handleflags = GPIOHANDLE_REQUEST_INPUT | GPIOHANDLE_REQUEST_BIAS_PULL_UP;
    request.eventflags = GPIOEVENT_REQUEST_BOTH_EDGES;
    strncpy(request.consumer_label, _config.label.c_str(), sizeof(request.consumer_label) - 1);

    const int result = ioctl(chipFd, GPIO_GET_LINEEVENT_IOCTL, &request);
    const int savedErrno = errno;
    ::close(chipFd);

    if (result < 0) {
        MK_LOGW(TAG, "Cannot request line %d on %s: %s; button disabled",
                _config.line, _config.chip_path.c_str(), strerror(savedErrno));
        return false;
    }

    _lineFd = request.fd;
    _stop = false;
    _reader = std::thread(&ButtonManager::readerLoop, this);

    MK_LOGI(TAG, "Button on %s line %d (hold %lu ms)",
            _config.chip_path.c_str(), _config.line, _config.hold_ms);
    return true;
}

void ButtonManager::close() {
    _stop = true;
    if (_reader.joinable()) {
        _reader.join();
    }
    if (_lineFd >= 0) {
        ::close(_lineFd);
        _lineFd = -1;
    }
}

void ButtonManager::dispatch(PressType press) {
    switch (press) {
        case PressType::SHORT:
            DEBUG_INPUT("Line %d short press", _config.line);
            if (_onShort) _onShort();
            break;
        case PressType::LONG:
            DEBUG_INPUT("Line %d long press", _config.line);
            if (_onLong) _onLong();
            break;
        case PressType::NONE:
            break;
    }
}

void ButtonManager::readerLoop() {
    PressDetector detector(_config.hold_ms, _config.debounce_ms);

    while (!_stop) {
        struct pollfd pfd;
        pfd.fd = _lineFd;
        pfd.events = POLLIN | POLLPRI;
        pfd.revents = 0;

        const int ready = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            MK_LOGE(TAG, "poll on line %d failed: %s; button stopped", _config.line, strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }

        struct gpioevent_data event;
        const ssize_t n = ::read(_lineFd, &event, sizeof(event));
        if (n != static_cast<ssize_t>(sizeof(event))) {
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            MK_LOGE(TAG, "Event read on line %d failed; button stopped", _config.line);
            return;
        }

        const unsigned long timeMs = static_cast<unsigned long>(event.timestamp / 1000000ULL);
        if (event.id == GPIOEVENT_EVENT_FALLING_EDGE) {
            detector.onPressed(timeMs);
        } else if (event.id == GPIOEVENT_EVENT_RISING_EDGE) {
            dispatch(detector.onReleased(timeMs));
        }
    }
}
