/**
 * @file button_manager.h
 * @brief Push button on a Linux GPIO character device
 *
 * The button pulls the line to ground (active low, internal pull-up).
 * A reader thread waits for edge events and classifies each press by its
 * duration:
 *   shorter than debounce_ms -> ignored (contact bounce)
 *   shorter than hold_ms     -> short press
 *   otherwise                -> long press (reported on release)
 */

#ifndef BUTTON_MANAGER_H
#define BUTTON_MANAGER_H

#include <atomic>
#include <functional>
#include <string>
#include <thread>

// Defaults
#define DEFAULT_BUTTON_HOLD_MS 1200
#define DEFAULT_BUTTON_DEBOUNCE_MS 30

enum class PressType {
    NONE,
    SHORT,
    LONG
};

/**
 * @brief Edge-to-press classifier (no I/O)
 */
class PressDetector {
public:
    PressDetector(unsigned long holdMs, unsigned long debounceMs);

    void onPressed(unsigned long timeMs);

    /**
     * @return The completed press, or NONE for bounce or a release without press
     */
    PressType onReleased(unsigned long timeMs);

    bool isPressed() const { return _pressed; }

private:
    unsigned long _holdMs;
    unsigned long _debounceMs;
    bool _pressed;
    unsigned long _pressedAt;
};

struct ButtonConfig {
    std::string chip_path = "/dev/gpiochip0";
    int line = -1;
    unsigned long hold_ms = DEFAULT_BUTTON_HOLD_MS;
    unsigned long debounce_ms = DEFAULT_BUTTON_DEBOUNCE_MS;
    std::string label = "markoshka";
};

using ButtonCallback = std::function<void()>;

class ButtonManager {
public:
    ButtonManager(const ButtonConfig& config, ButtonCallback onShort, ButtonCallback onLong);
    ~ButtonManager();

    ButtonManager(const ButtonManager&) = delete;
    ButtonManager& operator=(const ButtonManager&) = delete;

    /**
     * @brief Request the line and start the reader thread
     * @return false when the chip or line is unavailable (button stays disabled)
     */
    bool begin();

    /**
     * @brief Stop the reader thread and release the line (idempotent)
     */
    void close();

    bool isEnabled() const { return _lineFd >= 0; }
    int line() const { return _config.line; }

private:
    void readerLoop();
    void dispatch(PressType press);

    ButtonConfig _config;
    ButtonCallback _onShort;
    ButtonCallback _onLong;
    int _lineFd;
    std::atomic<bool> _stop;
    std::thread _reader;
};

#endif // BUTTON_MANAGER_H
