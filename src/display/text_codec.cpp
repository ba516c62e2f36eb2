/**
 * @file text_codec.cpp
 * @brief UTF-8 to cp866 / cp1251 / ASCII
 */

#include "text_codec.h"
#include "../common/utf8_utils.h"

static constexpr uint8_t UNMAPPED = '?';
static constexpr uint32_t DEGREE_SIGN = 0x00B0;

static uint8_t encodeCp866(uint32_t cp) {
    if (cp >= 0x0410 && cp <= 0x043F) {       // А..Я, а..п
        return static_cast<uint8_t>(0x80 + (cp - 0x0410));
    }
    if (cp >= 0x0440 && cp <= 0x044F) {       // р..я
        return static_cast<uint8_t>(0xE0 + (cp - 0x0440));
    }
    switch (cp) {
        case 0x0401: return 0xF0;             // Ё
        case 0x0451: return 0xF1;             // ё
        case DEGREE_SIGN: return 0xF8;
        case 0x00B7: return 0xFA;             // middle dot
        case 0x2116: return 0xFC;             // №
        default: return UNMAPPED;
    }
}

static uint8_t encodeCp1251(uint32_t cp) {
    if (cp >= 0x0410 && cp <= 0x044F) {       // А..я
        return static_cast<uint8_t>(0xC0 + (cp - 0x0410));
    }
    switch (cp) {
        case 0x0401: return 0xA8;             // Ё
        case 0x0451: return 0xB8;             // ё
        case DEGREE_SIGN: return 0xB0;
        case 0x00AB: return 0xAB;             // «
        case 0x00BB: return 0xBB;             // »
        case 0x2013: return 0x96;             // en dash
        case 0x2014: return 0x97;             // em dash
        case 0x2116: return 0xB9;             // №
        default: return UNMAPPED;
    }
}

uint8_t encodeCodepoint(uint32_t codepoint, Charset charset) {
    if (codepoint >= 0x20 && codepoint < 0x7F) {
        return static_cast<uint8_t>(codepoint);
    }
    if (codepoint < 0x80) {
        return UNMAPPED;                      // Control characters
    }

    switch (charset) {
        case Charset::CP866:  return encodeCp866(codepoint);
        case Charset::CP1251: return encodeCp1251(codepoint);
        case Charset::ASCII:
        case Charset::UNKNOWN:
            break;
    }
    return UNMAPPED;
}

std::string encodeText(const std::string& utf8, Charset charset) {
    std::string out;
    out.reserve(utf8.size());
    size_t pos = 0;
    uint32_t codepoint = 0;
    while (utf8Next(utf8, pos, codepoint)) {
        out += static_cast<char>(encodeCodepoint(codepoint, charset));
    }
    return out;
}
