/**
 * @file url_utils.h
 * @brief URL Encoding Utilities
 *
 * Query parameter encoding for the weather requests (city names may be
 * Cyrillic, API keys may contain reserved characters).
 */

#ifndef URL_UTILS_H
#define URL_UTILS_H

#include <cctype>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief URL-encode a string per RFC 3986
 *
 * Encodes all characters except unreserved characters: A-Z, a-z, 0-9, -, _, ., ~
 * Space is encoded as %20 (not +, which is application/x-www-form-urlencoded).
 * UTF-8 input is encoded byte by byte.
 *
 * @param str String to URL-encode
 * @return URL-encoded string
 */
inline std::string urlEncode(const std::string& str) {
    static const char HEX_DIGITS[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(str.size() * 3);

    for (unsigned char c : str) {
        // Unreserved characters per RFC 3986
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += HEX_DIGITS[(c >> 4) & 0xF];
            encoded += HEX_DIGITS[c & 0xF];
        }
    }
    return encoded;
}

/**
 * @brief Append name=value pairs to a base URL as a query string
 *
 * @param base URL without query
 * @param params Parameters, encoded with urlEncode()
 * @return base?name=value&...
 */
inline std::string buildUrl(const std::string& base,
                            const std::vector<std::pair<std::string, std::string>>& params) {
    std::string url = base;
    char separator = base.find('?') == std::string::npos ? '?' : '&';
    for (const auto& param : params) {
        url += separator;
        url += urlEncode(param.first);
        url += '=';
        url += urlEncode(param.second);
        separator = '&';
    }
    return url;
}

#endif // URL_UTILS_H
