/**
 * @file test_lookup_tables.cpp
 * @brief Unit tests for Lookup Tables
 *
 * Tests verify that all lookup tables return correct values and handle
 * edge cases properly.
 */

#ifdef UNIT_TEST

#include <unity.h>
#include <cstring>

#include "common/lookup_tables.h"

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// WeekdayLookup Tests
// ============================================================================

void test_weekday_sunday_is_zero() {
    TEST_ASSERT_EQUAL_STRING("Вс", WeekdayLookup::getAbbrev(0));
}

void test_weekday_all_days() {
    const char* expected[] = {"Вс", "Пн", "Вт", "Ср", "Чт", "Пт", "Сб"};
    for (int i = 0; i < 7; i++) {
        TEST_ASSERT_EQUAL_STRING(expected[i], WeekdayLookup::getAbbrev(i));
    }
}

void test_weekday_out_of_range() {
    TEST_ASSERT_EQUAL_STRING("??", WeekdayLookup::getAbbrev(-1));
    TEST_ASSERT_EQUAL_STRING("??", WeekdayLookup::getAbbrev(7));
}

// ============================================================================
// TransportLookup Tests
// ============================================================================

void test_transport_serial_aliases() {
    TEST_ASSERT_TRUE(TransportLookup::getTransport("serial") == DisplayTransport::SERIAL_VFD);
    TEST_ASSERT_TRUE(TransportLookup::getTransport("uart") == DisplayTransport::SERIAL_VFD);
    TEST_ASSERT_TRUE(TransportLookup::getTransport("vfd") == DisplayTransport::SERIAL_VFD);
}

void test_transport_i2c_and_console() {
    TEST_ASSERT_TRUE(TransportLookup::getTransport("i2c") == DisplayTransport::I2C_LCD);
    TEST_ASSERT_TRUE(TransportLookup::getTransport("lcd") == DisplayTransport::I2C_LCD);
    TEST_ASSERT_TRUE(TransportLookup::getTransport("console") == DisplayTransport::CONSOLE);
    TEST_ASSERT_TRUE(TransportLookup::getTransport("stdout") == DisplayTransport::CONSOLE);
}

void test_transport_case_insensitive() {
    TEST_ASSERT_TRUE(TransportLookup::getTransport("I2C") == DisplayTransport::I2C_LCD);
    TEST_ASSERT_TRUE(TransportLookup::getTransport("Serial") == DisplayTransport::SERIAL_VFD);
}

void test_transport_unknown() {
    TEST_ASSERT_TRUE(TransportLookup::getTransport("spi") == DisplayTransport::UNKNOWN);
    TEST_ASSERT_TRUE(TransportLookup::getTransport("") == DisplayTransport::UNKNOWN);
    TEST_ASSERT_TRUE(TransportLookup::getTransport(nullptr) == DisplayTransport::UNKNOWN);
}

void test_transport_names() {
    TEST_ASSERT_EQUAL_STRING("serial", TransportLookup::getName(DisplayTransport::SERIAL_VFD));
    TEST_ASSERT_EQUAL_STRING("i2c", TransportLookup::getName(DisplayTransport::I2C_LCD));
    TEST_ASSERT_EQUAL_STRING("console", TransportLookup::getName(DisplayTransport::CONSOLE));
    TEST_ASSERT_EQUAL_STRING("unknown", TransportLookup::getName(DisplayTransport::UNKNOWN));
}

// ============================================================================
// CharsetLookup Tests
// ============================================================================

void test_charset_names() {
    TEST_ASSERT_TRUE(CharsetLookup::getCharset("cp866") == Charset::CP866);
    TEST_ASSERT_TRUE(CharsetLookup::getCharset("IBM866") == Charset::CP866);
    TEST_ASSERT_TRUE(CharsetLookup::getCharset("cp1251") == Charset::CP1251);
    TEST_ASSERT_TRUE(CharsetLookup::getCharset("win1251") == Charset::CP1251);
    TEST_ASSERT_TRUE(CharsetLookup::getCharset("ascii") == Charset::ASCII);
}

void test_charset_unknown() {
    TEST_ASSERT_TRUE(CharsetLookup::getCharset("koi8-r") == Charset::UNKNOWN);
    TEST_ASSERT_TRUE(CharsetLookup::getCharset(nullptr) == Charset::UNKNOWN);
}

// ============================================================================
// Test Runner
// ============================================================================

int runUnityTests() {
    UNITY_BEGIN();

    // WeekdayLookup
    RUN_TEST(test_weekday_sunday_is_zero);
    RUN_TEST(test_weekday_all_days);
    RUN_TEST(test_weekday_out_of_range);

    // TransportLookup
    RUN_TEST(test_transport_serial_aliases);
    RUN_TEST(test_transport_i2c_and_console);
    RUN_TEST(test_transport_case_insensitive);
    RUN_TEST(test_transport_unknown);
    RUN_TEST(test_transport_names);

    // CharsetLookup
    RUN_TEST(test_charset_names);
    RUN_TEST(test_charset_unknown);

    return UNITY_END();
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    return runUnityTests();
}

#endif // UNIT_TEST
