/**
 * @file intent_queue.cpp
 * @brief Intent ring buffer
 */

#include "intent_queue.h"
#include "../debug/log_system.h"

static const char* TAG = "INTENT";

const char* getIntentName(UserIntent intent) {
    switch (intent) {
        case UserIntent::SHORT_PRESS:        return "short";
        case UserIntent::LONG_PRESS:         return "long";
        case UserIntent::WEATHER_PRESS:      return "weather";
        case UserIntent::WEATHER_LONG_PRESS: return "weather-long";
    }
    return "unknown";
}

IntentQueue::IntentQueue()
    : _items{}, _head(0), _count(0), _dropped(0) {}

bool IntentQueue::push(UserIntent intent) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_count < CAPACITY) {
            const uint8_t tail = (_head + _count) % CAPACITY;
            _items[tail] = intent;
            _count++;
            return true;
        }
        _dropped++;
    }
    MK_LOGW(TAG, "Intent queue full, dropping %s press", getIntentName(intent));
    return false;
}

bool IntentQueue::pop(UserIntent* intent) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_count == 0) {
        return false;
    }
    if (intent) {
        *intent = _items[_head];
    }
    _head = (_head + 1) % CAPACITY;
    _count--;
    return true;
}

size_t IntentQueue::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _count;
}

uint32_t IntentQueue::droppedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _dropped;
}
