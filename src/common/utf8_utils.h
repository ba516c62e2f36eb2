/**
 * @file utf8_utils.h
 * @brief UTF-8 helpers for fixed-width character displays
 *
 * Character displays count glyphs, not bytes. Every width computation in
 * the renderer goes through these helpers so Cyrillic text (two bytes per
 * letter) is measured the same way as ASCII.
 *
 * Malformed input is tolerated: each byte that is not a continuation byte
 * starts a new code point.
 */

#ifndef UTF8_UTILS_H
#define UTF8_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Number of code points in text
 *
 * A malformed sequence counts as one, the same as utf8Truncate and utf8Next.
 */
size_t utf8Length(const std::string& text);

/**
 * @brief Keep at most maxChars code points
 */
std::string utf8Truncate(const std::string& text, size_t maxChars);

/**
 * @brief Truncate to width code points, then right-pad with spaces to width
 */
std::string utf8FitWidth(const std::string& text, size_t width);

/**
 * @brief Split text into consecutive pieces of at most chunkChars code points
 * @return Empty vector for empty text
 */
std::vector<std::string> utf8Chunks(const std::string& text, size_t chunkChars);

/**
 * @brief Decode the code point starting at pos and advance pos past it
 * @param text UTF-8 text
 * @param pos Byte offset; advanced by the length of the sequence
 * @param codepoint Decoded value (0xFFFD for a malformed sequence)
 * @return false when pos is already at the end of text
 */
bool utf8Next(const std::string& text, size_t& pos, uint32_t& codepoint);

#endif // UTF8_UTILS_H
