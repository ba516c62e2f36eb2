/**
 * @file lookup_tables.h
 * @brief Compile-time lookup tables for string/enum mappings
 *
 * Small constexpr tables with linear search, used for configuration names
 * and on-screen abbreviations.
 *
 * Usage:
 *   const char* day = WeekdayLookup::getAbbrev(1);          // "Пн"
 *   DisplayTransport t = TransportLookup::getTransport("i2c");
 *   Charset cs = CharsetLookup::getCharset("cp866");
 */

#ifndef LOOKUP_TABLES_H
#define LOOKUP_TABLES_H

#include <cstddef>
#include <cstdint>
#include <strings.h>

// ============================================================================
// Weekday Abbreviations
// ============================================================================

namespace WeekdayLookup {

/**
 * Two-letter Russian weekday abbreviations, indexed like std::tm::tm_wday
 * (0 = Sunday).
 */
constexpr const char* WEEKDAY_ABBREV[] = {
    "Вс",  // 0 - Sunday
    "Пн",  // 1
    "Вт",  // 2
    "Ср",  // 3
    "Чт",  // 4
    "Пт",  // 5
    "Сб",  // 6
};

/**
 * Get weekday abbreviation
 * @param wday Day of week, 0 = Sunday (std::tm::tm_wday)
 * @return Abbreviation, or "??" for out-of-range values
 */
inline const char* getAbbrev(int wday) {
    if (wday < 0 || wday > 6) {
        return "??";
    }
    return WEEKDAY_ABBREV[wday];
}

} // namespace WeekdayLookup

// ============================================================================
// Display Transport Lookup
// ============================================================================

/**
 * Display transports the factory knows how to build
 */
enum class DisplayTransport : uint8_t {
    SERIAL_VFD = 0,
    I2C_LCD = 1,
    CONSOLE = 2,
    UNKNOWN = 255
};

namespace TransportLookup {

struct TransportEntry {
    const char* name;
    DisplayTransport transport;
};

constexpr TransportEntry TRANSPORT_TABLE[] = {
    {"serial",  DisplayTransport::SERIAL_VFD},
    {"uart",    DisplayTransport::SERIAL_VFD},
    {"vfd",     DisplayTransport::SERIAL_VFD},
    {"i2c",     DisplayTransport::I2C_LCD},
    {"lcd",     DisplayTransport::I2C_LCD},
    {"console", DisplayTransport::CONSOLE},
    {"stdout",  DisplayTransport::CONSOLE},
};

constexpr size_t TRANSPORT_TABLE_SIZE = sizeof(TRANSPORT_TABLE) / sizeof(TRANSPORT_TABLE[0]);

/**
 * Get transport for a configuration name (case-insensitive)
 * @return DisplayTransport::UNKNOWN for unrecognized names
 */
inline DisplayTransport getTransport(const char* name) {
    if (!name || name[0] == '\0') {
        return DisplayTransport::UNKNOWN;
    }
    for (size_t i = 0; i < TRANSPORT_TABLE_SIZE; i++) {
        if (strcasecmp(TRANSPORT_TABLE[i].name, name) == 0) {
            return TRANSPORT_TABLE[i].transport;
        }
    }
    return DisplayTransport::UNKNOWN;
}

/**
 * Canonical name for a transport
 */
inline const char* getName(DisplayTransport transport) {
    switch (transport) {
        case DisplayTransport::SERIAL_VFD: return "serial";
        case DisplayTransport::I2C_LCD:    return "i2c";
        case DisplayTransport::CONSOLE:    return "console";
        case DisplayTransport::UNKNOWN:    break;
    }
    return "unknown";
}

} // namespace TransportLookup

// ============================================================================
// Display Charset Lookup
// ============================================================================

/**
 * Single-byte character sets understood by the hardware drivers
 */
enum class Charset : uint8_t {
    CP866 = 0,
    CP1251 = 1,
    ASCII = 2,
    UNKNOWN = 255
};

namespace CharsetLookup {

struct CharsetEntry {
    const char* name;
    Charset charset;
};

constexpr CharsetEntry CHARSET_TABLE[] = {
    {"cp866",   Charset::CP866},
    {"ibm866",  Charset::CP866},
    {"cp1251",  Charset::CP1251},
    {"win1251", Charset::CP1251},
    {"ascii",   Charset::ASCII},
};

constexpr size_t CHARSET_TABLE_SIZE = sizeof(CHARSET_TABLE) / sizeof(CHARSET_TABLE[0]);

/**
 * Get charset for a configuration name (case-insensitive)
 * @return Charset::UNKNOWN for unrecognized names
 */
inline Charset getCharset(const char* name) {
    if (!name || name[0] == '\0') {
        return Charset::UNKNOWN;
    }
    for (size_t i = 0; i < CHARSET_TABLE_SIZE; i++) {
        if (strcasecmp(CHARSET_TABLE[i].name, name) == 0) {
            return CHARSET_TABLE[i].charset;
        }
    }
    return Charset::UNKNOWN;
}

} // namespace CharsetLookup

#endif // LOOKUP_TABLES_H
