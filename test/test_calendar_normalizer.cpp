/**
 * @file test_calendar_normalizer.cpp
 * @brief Unit tests for CalendarNormalizer - program day boundaries and date arithmetic
 */

#include <unity.h>
#include <string.h>
#include "src/services/calendar_normalizer.h"
#include "test_helpers.h"

void setUp(void)
{
    // No setup needed for this test
}

void tearDown(void)
{
    // No teardown needed
}

static ProgramDay date(int year, int month, int dayOfMonth)
{
    return CalendarNormalizer::fromCalendarDate(year, month, dayOfMonth);
}

/**
 * Test: Known calendar dates map to the expected epoch day
 */
void test_epoch_day_anchors(void)
{
    TEST_ASSERT_EQUAL_INT32(0, date(1970, 1, 1).epochDay);
    TEST_ASSERT_EQUAL_INT32(10957, date(2000, 1, 1).epochDay);
    TEST_ASSERT_EQUAL_INT32(18628, date(2021, 1, 1).epochDay);
    TEST_ASSERT_EQUAL_INT32(19782, date(2024, 2, 29).epochDay);
}

void test_invalid_calendar_dates_are_unset(void)
{
    TEST_ASSERT_FALSE(date(2023, 2, 29).isSet());
    TEST_ASSERT_FALSE(date(2024, 2, 30).isSet());
    TEST_ASSERT_FALSE(date(2024, 13, 1).isSet());
    TEST_ASSERT_FALSE(date(2024, 4, 31).isSet());
    TEST_ASSERT_TRUE(date(2000, 2, 29).isSet());
}

/**
 * Test: Midnight boundary puts 23:59 and 00:00 on different days
 */
void test_midnight_boundary(void)
{
    time_t lateEvening = CalendarNormalizer::localTimeOf(2024, 3, 9, 23, 59);
    time_t midnight = CalendarNormalizer::localTimeOf(2024, 3, 10, 0, 0);

    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(lateEvening, 0) == date(2024, 3, 9));
    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(midnight, 0) == date(2024, 3, 10));
}

/**
 * Test: With a 04:00 boundary a late-night session counts for the previous day
 */
void test_custom_boundary_shifts_early_hours_back(void)
{
    time_t beforeBoundary = CalendarNormalizer::localTimeOf(2024, 3, 10, 3, 59);
    time_t atBoundary = CalendarNormalizer::localTimeOf(2024, 3, 10, 4, 0);

    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(beforeBoundary, 4) == date(2024, 3, 9));
    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(atBoundary, 4) == date(2024, 3, 10));
}

void test_boundary_across_month_and_year(void)
{
    time_t newYearEarly = CalendarNormalizer::localTimeOf(2025, 1, 1, 2, 30);
    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(newYearEarly, 5) == date(2024, 12, 31));

    time_t leapMorning = CalendarNormalizer::localTimeOf(2024, 3, 1, 1, 0);
    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(leapMorning, 2) == date(2024, 2, 29));
}

/**
 * Test: Out-of-range boundary hours are clamped instead of rejected
 */
void test_invalid_boundary_is_clamped(void)
{
    time_t lateEvening = CalendarNormalizer::localTimeOf(2024, 3, 10, 22, 0);

    // 30 behaves like 23: 22:00 is still before the boundary
    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(lateEvening, 30) == date(2024, 3, 9));
    // -5 behaves like 0
    TEST_ASSERT_TRUE(CalendarNormalizer::programDay(lateEvening, -5) == date(2024, 3, 10));

    TEST_ASSERT_FALSE(CalendarNormalizer::isValidBoundaryHour(24));
    TEST_ASSERT_FALSE(CalendarNormalizer::isValidBoundaryHour(-1));
    TEST_ASSERT_TRUE(CalendarNormalizer::isValidBoundaryHour(0));
    TEST_ASSERT_TRUE(CalendarNormalizer::isValidBoundaryHour(23));
}

void test_pre_epoch_timestamps_floor(void)
{
    TEST_ASSERT_EQUAL_INT32(-1, CalendarNormalizer::programDay((time_t)-1, 0).epochDay);
    TEST_ASSERT_EQUAL_INT32(-1, CalendarNormalizer::programDay((time_t)-86400, 0).epochDay);
    TEST_ASSERT_EQUAL_INT32(-2, CalendarNormalizer::programDay((time_t)-86401, 0).epochDay);
}

/**
 * Test: Timezone offset is applied before the boundary
 */
void test_program_day_from_clock_with_offset(void)
{
    FixedTimeProvider clock;
    clock.setUtc(2024, 3, 10, 2, 0);

    // UTC+3: 05:00 local, past a 04:00 boundary
    TEST_ASSERT_TRUE(CalendarNormalizer::programDayAt(clock, 180, 4) == date(2024, 3, 10));
    // UTC-3: 23:00 local on the 9th
    TEST_ASSERT_TRUE(CalendarNormalizer::programDayAt(clock, -180, 4) == date(2024, 3, 9));
    // UTC: 02:00, before the boundary
    TEST_ASSERT_TRUE(CalendarNormalizer::programDayAt(clock, 0, 4) == date(2024, 3, 9));
}

void test_same_day_and_difference(void)
{
    ProgramDay a = date(2024, 2, 27);
    ProgramDay b = date(2024, 3, 2);

    TEST_ASSERT_TRUE(CalendarNormalizer::isSameDay(a, a));
    TEST_ASSERT_FALSE(CalendarNormalizer::isSameDay(a, b));
    TEST_ASSERT_FALSE(CalendarNormalizer::isSameDay(ProgramDay(), ProgramDay()));

    TEST_ASSERT_EQUAL_INT32(4, CalendarNormalizer::daysBetween(a, b));
    TEST_ASSERT_EQUAL_INT32(-4, CalendarNormalizer::daysBetween(b, a));
    TEST_ASSERT_EQUAL_INT32(0, CalendarNormalizer::daysBetween(ProgramDay(), b));

    TEST_ASSERT_TRUE(CalendarNormalizer::addDays(a, 4) == b);
    TEST_ASSERT_FALSE(CalendarNormalizer::addDays(ProgramDay(), 4).isSet());
}

/**
 * Test: Unset orders before every real day
 */
void test_unset_orders_first(void)
{
    ProgramDay unset;
    TEST_ASSERT_FALSE(unset.isSet());
    TEST_ASSERT_TRUE(unset < date(1970, 1, 1));
    TEST_ASSERT_TRUE(unset < ProgramDay(-100000));
}

void test_format_iso(void)
{
    char buffer[16];

    TEST_ASSERT_EQUAL_STRING("2024-02-29", CalendarNormalizer::formatIso(date(2024, 2, 29), buffer, sizeof(buffer)));
    TEST_ASSERT_EQUAL_STRING("1969-12-31", CalendarNormalizer::formatIso(ProgramDay(-1), buffer, sizeof(buffer)));
    TEST_ASSERT_EQUAL_STRING("never", CalendarNormalizer::formatIso(ProgramDay(), buffer, sizeof(buffer)));

    int year = 0, month = 0, dayOfMonth = 0;
    TEST_ASSERT_TRUE(CalendarNormalizer::toCalendarDate(date(2031, 7, 15), &year, &month, &dayOfMonth));
    TEST_ASSERT_EQUAL(2031, year);
    TEST_ASSERT_EQUAL(7, month);
    TEST_ASSERT_EQUAL(15, dayOfMonth);
}

int runUnityTests(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_epoch_day_anchors);
    RUN_TEST(test_invalid_calendar_dates_are_unset);
    RUN_TEST(test_midnight_boundary);
    RUN_TEST(test_custom_boundary_shifts_early_hours_back);
    RUN_TEST(test_boundary_across_month_and_year);
    RUN_TEST(test_invalid_boundary_is_clamped);
    RUN_TEST(test_pre_epoch_timestamps_floor);
    RUN_TEST(test_program_day_from_clock_with_offset);
    RUN_TEST(test_same_day_and_difference);
    RUN_TEST(test_unset_orders_first);
    RUN_TEST(test_format_iso);

    return UNITY_END();
}

#ifdef ARDUINO
#include <Arduino.h>

void setup()
{
    delay(2000); // Wait for serial monitor
    runUnityTests();
}

void loop()
{
    // Nothing to do here
}
#else
int main(void)
{
    return runUnityTests();
}
#endif
