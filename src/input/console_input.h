/**
 * @file console_input.h
 * @brief Keyboard stand-in for the buttons (bench use without GPIO)
 *
 * Commands, one per line:
 *   s, short     primary button short press
 *   l, long      primary button long press
 *   w, weather   weather button
 *   q, quit      stop the program
 *   h, help      list commands
 */

#ifndef CONSOLE_INPUT_H
#define CONSOLE_INPUT_H

#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "../content/intent_queue.h"

enum class ConsoleCommand {
    INTENT,
    QUIT,
    HELP,
    EMPTY,
    UNKNOWN
};

/**
 * @brief Parse one input line (surrounding whitespace and case ignored)
 * @param intent Receives the intent when the result is INTENT
 */
ConsoleCommand parseConsoleCommand(const std::string& line, UserIntent* intent);

class ConsoleInput {
public:
    using IntentHandler = std::function<void(UserIntent)>;
    using QuitHandler = std::function<void()>;

    /**
     * @param fd Input descriptor (stdin by default)
     */
    ConsoleInput(IntentHandler onIntent, QuitHandler onQuit, int fd = 0);
    ~ConsoleInput();

    ConsoleInput(const ConsoleInput&) = delete;
    ConsoleInput& operator=(const ConsoleInput&) = delete;

    bool begin();
    void close();

    /**
     * @brief Handle one line as if it had been typed
     */
    void handleLine(const std::string& line);

    static void printHelp();

private:
    void readerLoop();

    IntentHandler _onIntent;
    QuitHandler _onQuit;
    int _fd;
    std::atomic<bool> _stop;
    std::thread _reader;
};

#endif // CONSOLE_INPUT_H
