/**
 * @file console_input.cpp
 * @brief stdin command reader
 */

#include "console_input.h"
#include "../debug/log_system.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <utility>

static const char* TAG = "CONSOLE";

static constexpr int POLL_TIMEOUT_MS = 100;

static std::string normalize(const std::string& line) {
    size_t start = 0;
    size_t end = line.size();
    while (start < end && std::isspace(static_cast<unsigned char>(line[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1]))) end--;

    std::string word = line.substr(start, end - start);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return word;
}

ConsoleCommand parseConsoleCommand(const std::string& line, UserIntent* intent) {
    const std::string word = normalize(line);

    if (word.empty()) {
        return ConsoleCommand::EMPTY;
    }
    if (word == "s" || word == "short") {
        if (intent) *intent = UserIntent::SHORT_PRESS;
        return ConsoleCommand::INTENT;
    }
    if (word == "l" || word == "long") {
        if (intent) *intent = UserIntent::LONG_PRESS;
        return ConsoleCommand::INTENT;
    }
    if (word == "w" || word == "weather") {
        if (intent) *intent = UserIntent::WEATHER_PRESS;
        return ConsoleCommand::INTENT;
    }
    if (word == "q" || word == "quit" || word == "exit") {
        return ConsoleCommand::QUIT;
    }
    if (word == "h" || word == "help" || word == "?") {
        return ConsoleCommand::HELP;
    }
    return ConsoleCommand::UNKNOWN;
}

ConsoleInput::ConsoleInput(IntentHandler onIntent, QuitHandler onQuit, int fd)
    : _onIntent(std::move(onIntent)), _onQuit(std::move(onQuit)), _fd(fd), _stop(false) {}

ConsoleInput::~ConsoleInput() {
    close();
}

void ConsoleInput::printHelp() {
    printf("\nCommands:\n");
    printf("  s, short     - Next display mode\n");
    printf("  l, long      - Next category\n");
    printf("  w, weather   - Weather on/off\n");
    printf("  q, quit      - Exit\n");
    printf("  h, help      - Show this help\n\n");
    fflush(stdout);
}

bool ConsoleInput::begin() {
    if (_reader.joinable()) {
        return true;
    }
    if (!isatty(_fd)) {
        MK_LOGI(TAG, "Input is not a terminal, reading commands anyway");
    }
    _stop = false;
    _reader = std::thread(&ConsoleInput::readerLoop, this);
    MK_LOGI(TAG, "Console commands enabled (type 'h' for help)");
    return true;
}

void ConsoleInput::close() {
    _stop = true;
    if (_reader.joinable()) {
        _reader.join();
    }
}

void ConsoleInput::handleLine(const std::string& line) {
    UserIntent intent = UserIntent::SHORT_PRESS;
    switch (parseConsoleCommand(line, &intent)) {
        case ConsoleCommand::INTENT:
            DEBUG_INPUT("Console: %s", getIntentName(intent));
            if (_onIntent) _onIntent(intent);
            break;
        case ConsoleCommand::QUIT:
            MK_LOGI(TAG, "Quit requested");
            if (_onQuit) _onQuit();
            break;
        case ConsoleCommand::HELP:
            printHelp();
            break;
        case ConsoleCommand::EMPTY:
            break;
        case ConsoleCommand::UNKNOWN:
            MK_LOGW(TAG, "Unknown command: %s (type 'h' for help)", line.c_str());
            break;
    }
}

void ConsoleInput::readerLoop() {
    std::string pending;
    char buffer[128];

    while (!_stop) {
        struct pollfd pfd;
        pfd.fd = _fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int ready = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            MK_LOGE(TAG, "poll failed: %s; console input stopped", strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = ::read(_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            MK_LOGE(TAG, "read failed: %s; console input stopped", strerror(errno));
            return;
        }
        if (n == 0) {
            MK_LOGI(TAG, "End of input, console commands disabled");
            return;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            handleLine(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }
}
