/**
 * @file display_text.cpp
 * @brief Word wrapping and static frames
 */

#include "display_text.h"
#include "display_driver.h"
#include "../common/utf8_utils.h"

static bool isCollapsibleSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

static std::vector<std::string> splitWords(const std::string& segment) {
    std::vector<std::string> words;
    std::string word;
    for (char c : segment) {
        if (isCollapsibleSpace(c)) {
            if (!word.empty()) {
                words.push_back(word);
                word.clear();
            }
        } else {
            word += c;
        }
    }
    if (!word.empty()) {
        words.push_back(word);
    }
    return words;
}

// Greedy fill; a word wider than the display is cut into width-sized pieces
static void wrapSegment(const std::string& segment, std::vector<std::string>& out) {
    const std::vector<std::string> words = splitWords(segment);
    if (words.empty()) {
        out.push_back("");
        return;
    }

    std::string line;
    size_t line_len = 0;

    for (const std::string& word : words) {
        const size_t word_len = utf8Length(word);

        if (word_len > DISPLAY_WIDTH) {
            if (line_len > 0) {
                out.push_back(line);
            }
            std::vector<std::string> pieces = utf8Chunks(word, DISPLAY_WIDTH);
            for (size_t i = 0; i + 1 < pieces.size(); i++) {
                out.push_back(pieces[i]);
            }
            line = pieces.back();
            line_len = utf8Length(line);
            continue;
        }

        if (line_len == 0) {
            line = word;
            line_len = word_len;
        } else if (line_len + 1 + word_len <= DISPLAY_WIDTH) {
            line += ' ';
            line += word;
            line_len += 1 + word_len;
        } else {
            out.push_back(line);
            line = word;
            line_len = word_len;
        }
    }

    out.push_back(line);
}

std::vector<std::string> wrapMessageLines(const std::string& message) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        const size_t newline = message.find('\n', start);
        if (newline == std::string::npos) {
            wrapSegment(message.substr(start), lines);
            break;
        }
        wrapSegment(message.substr(start, newline - start), lines);
        start = newline + 1;
    }
    return lines;
}

DisplayFrame frameFromLines(const std::string& first, const std::string& second) {
    DisplayFrame frame;
    frame.lines[0] = utf8FitWidth(first, DISPLAY_WIDTH);
    frame.lines[1] = utf8FitWidth(second, DISPLAY_WIDTH);
    return frame;
}

DisplayFrame staticFrame(const std::string& message) {
    const std::vector<std::string> lines = wrapMessageLines(message);
    const std::string& first = lines[0];
    const std::string second = lines.size() > 1 ? lines[1] : std::string();
    return frameFromLines(first, second);
}

void showStaticMessage(DisplayDriver& driver, const std::string& message) {
    driver.write(staticFrame(message));
}
