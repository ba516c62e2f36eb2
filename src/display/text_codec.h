/**
 * @file text_codec.h
 * @brief UTF-8 to single-byte character set conversion for display hardware
 *
 * Character modules have a fixed font ROM; Cyrillic is reached through a
 * DOS (cp866) or Windows (cp1251) code page depending on the module.
 */

#ifndef TEXT_CODEC_H
#define TEXT_CODEC_H

#include <cstdint>
#include <string>

#include "../common/lookup_tables.h"

/**
 * @brief Encode one code point
 * @return Device byte, or '?' when the charset has no glyph for it
 */
uint8_t encodeCodepoint(uint32_t codepoint, Charset charset);

/**
 * @brief Encode UTF-8 text, one output byte per code point
 */
std::string encodeText(const std::string& utf8, Charset charset);

#endif // TEXT_CODEC_H
