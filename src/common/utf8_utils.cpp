/**
 * @file utf8_utils.cpp
 * @brief UTF-8 helper implementation
 */

#include "utf8_utils.h"

static inline bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte offset just past the code point starting at pos
static size_t nextBoundary(const std::string& text, size_t pos) {
    size_t next = pos + 1;
    while (next < text.size() && isContinuation(static_cast<unsigned char>(text[next]))) {
        next++;
    }
    return next;
}

// Same stepping as utf8Truncate, so a stray continuation run counts as one
size_t utf8Length(const std::string& text) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        pos = nextBoundary(text, pos);
        count++;
    }
    return count;
}

std::string utf8Truncate(const std::string& text, size_t maxChars) {
    size_t pos = 0;
    size_t chars = 0;
    while (pos < text.size() && chars < maxChars) {
        pos = nextBoundary(text, pos);
        chars++;
    }
    return text.substr(0, pos);
}

std::string utf8FitWidth(const std::string& text, size_t width) {
    std::string fitted = utf8Truncate(text, width);
    const size_t len = utf8Length(fitted);
    if (len < width) {
        fitted.append(width - len, ' ');
    }
    return fitted;
}

std::vector<std::string> utf8Chunks(const std::string& text, size_t chunkChars) {
    std::vector<std::string> chunks;
    if (chunkChars == 0) {
        return chunks;
    }
    size_t start = 0;
    while (start < text.size()) {
        size_t end = start;
        size_t chars = 0;
        while (end < text.size() && chars < chunkChars) {
            end = nextBoundary(text, end);
            chars++;
        }
        chunks.push_back(text.substr(start, end - start));
        start = end;
    }
    return chunks;
}

bool utf8Next(const std::string& text, size_t& pos, uint32_t& codepoint) {
    if (pos >= text.size()) {
        return false;
    }

    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t extra = 0;
    uint32_t value = 0;

    if (lead < 0x80) {
        codepoint = lead;
        pos++;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        value = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        value = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        value = lead & 0x07;
    } else {
        // Stray continuation byte or invalid lead
        codepoint = 0xFFFD;
        pos = nextBoundary(text, pos);
        return true;
    }

    const size_t end = nextBoundary(text, pos);
    if (end - pos != extra + 1) {
        codepoint = 0xFFFD;
        pos = end;
        return true;
    }

    for (size_t i = 1; i <= extra; i++) {
        value = (value << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
    }
    codepoint = value;
    pos = end;
    return true;
}
