/**
 * @file intent_queue.h
 * @brief Hand-off of button presses from input threads to the main loop
 *
 * Button and console readers run on their own threads. They never touch
 * mode or cursor state; they push an intent here and the main loop applies
 * it between ticks.
 */

#ifndef INTENT_QUEUE_H
#define INTENT_QUEUE_H

#include <cstddef>
#include <cstdint>
#include <mutex>

/**
 * @brief User actions coming from the controls
 */
enum class UserIntent : uint8_t {
    SHORT_PRESS = 0,        // Primary button, short: next mode
    LONG_PRESS = 1,         // Primary button, long: next category
    WEATHER_PRESS = 2,      // Secondary button, short: weather on/off
    WEATHER_LONG_PRESS = 3  // Secondary button, long: reserved
};

/**
 * @brief Name for logs
 */
const char* getIntentName(UserIntent intent);

/**
 * @brief Bounded multi-producer, single-consumer FIFO
 *
 * Fixed ring buffer, no allocation after construction. When full, the
 * newest intent is dropped.
 */
class IntentQueue {
public:
    static constexpr uint8_t CAPACITY = 8;

    IntentQueue();

    /**
     * @brief Append an intent (any thread)
     * @return false if the queue was full and the intent was dropped
     */
    bool push(UserIntent intent);

    /**
     * @brief Remove the oldest intent (consumer thread)
     * @return false if the queue was empty
     */
    bool pop(UserIntent* intent);

    size_t size() const;
    uint32_t droppedCount() const;

private:
    mutable std::mutex _mutex;
    UserIntent _items[CAPACITY];
    uint8_t _head;
    uint8_t _count;
    uint32_t _dropped;
};

#endif // INTENT_QUEUE_H
