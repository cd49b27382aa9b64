/**
 * @file calendar_normalizer.cpp
 * @brief Implementation of program-day arithmetic
 */

#include "calendar_normalizer.h"
#include "../core/logging.h"
#include <stdio.h>

static const char *const TAG = "calendar";

ProgramDay CalendarNormalizer::programDay(time_t localTime, int boundaryHour)
{
    if (!isValidBoundaryHour(boundaryHour))
    {
        int clamped = boundaryHour < MIN_BOUNDARY_HOUR ? MIN_BOUNDARY_HOUR : MAX_BOUNDARY_HOUR;
        LOG_W(TAG, "Invalid day boundary hour %d - clamping to %d", boundaryHour, clamped);
        boundaryHour = clamped;
    }

    // Floor division so timestamps before 1970 still land on the right day
    int64_t seconds = (int64_t)localTime;
    int64_t day = seconds / SECONDS_PER_DAY;
    int64_t secondOfDay = seconds % SECONDS_PER_DAY;
    if (secondOfDay < 0)
    {
        secondOfDay += SECONDS_PER_DAY;
        day--;
    }

    int hour = (int)(secondOfDay / 3600);
    if (hour < boundaryHour)
    {
        day--;
    }

    return ProgramDay((int32_t)day);
}

ProgramDay CalendarNormalizer::programDayAt(const ITimeProvider &clock, int timezoneOffsetMinutes, int boundaryHour)
{
    time_t localTime = clock.getCurrentTime() + (time_t)timezoneOffsetMinutes * 60;
    return programDay(localTime, boundaryHour);
}

bool CalendarNormalizer::isSameDay(ProgramDay a, ProgramDay b)
{
    return a.isSet() && b.isSet() && a == b;
}

int32_t CalendarNormalizer::daysBetween(ProgramDay from, ProgramDay to)
{
    if (!from.isSet() || !to.isSet())
        return 0;

    return to.epochDay - from.epochDay;
}

ProgramDay CalendarNormalizer::addDays(ProgramDay day, int32_t days)
{
    if (!day.isSet())
        return day;

    return ProgramDay(day.epochDay + days);
}

ProgramDay CalendarNormalizer::fromCalendarDate(int year, int month, int dayOfMonth)
{
    if (month < 1 || month > 12 || dayOfMonth < 1 || dayOfMonth > daysInMonth(year, month))
    {
        LOG_W(TAG, "Invalid calendar date %04d-%02d-%02d", year, month, dayOfMonth);
        return ProgramDay();
    }

    return ProgramDay(daysFromCivil(year, month, dayOfMonth));
}

bool CalendarNormalizer::toCalendarDate(ProgramDay day, int *year, int *month, int *dayOfMonth)
{
    if (!day.isSet() || !year || !month || !dayOfMonth)
        return false;

    civilFromDays(day.epochDay, year, month, dayOfMonth);
    return true;
}

time_t CalendarNormalizer::localTimeOf(int year, int month, int dayOfMonth, int hour, int minute)
{
    int64_t days = daysFromCivil(year, month, dayOfMonth);
    return (time_t)(days * SECONDS_PER_DAY + hour * 3600 + minute * 60);
}

const char *CalendarNormalizer::formatIso(ProgramDay day, char *buffer, size_t size)
{
    if (!buffer || size == 0)
        return "";

    int year, month, dayOfMonth;
    if (!toCalendarDate(day, &year, &month, &dayOfMonth))
    {
        snprintf(buffer, size, "never");
        return buffer;
    }

    snprintf(buffer, size, "%04d-%02d-%02d", year, month, dayOfMonth);
    return buffer;
}

bool CalendarNormalizer::isValidBoundaryHour(int hour)
{
    return hour >= MIN_BOUNDARY_HOUR && hour <= MAX_BOUNDARY_HOUR;
}

bool CalendarNormalizer::isValidTimezoneOffset(int offsetMinutes)
{
    return offsetMinutes >= MIN_TIMEZONE_OFFSET_MINUTES && offsetMinutes <= MAX_TIMEZONE_OFFSET_MINUTES;
}

// Days since 1970-01-01 in the proleptic Gregorian calendar (era-based, 400-year cycles)
int32_t CalendarNormalizer::daysFromCivil(int year, int month, int dayOfMonth)
{
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const int yearOfEra = year - era * 400;
    const int dayOfYear = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + dayOfMonth - 1;
    const int dayOfEra = yearOfEra * 365 + yearOfEra / 4 - yearOfEra / 100 + dayOfYear;
    return era * 146097 + dayOfEra - 719468;
}

void CalendarNormalizer::civilFromDays(int32_t days, int *year, int *month, int *dayOfMonth)
{
    int32_t z = days + 719468;
    const int32_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int32_t dayOfEra = z - era * 146097;
    const int32_t yearOfEra = (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) / 365;
    const int32_t dayOfYear = dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
    const int32_t mp = (5 * dayOfYear + 2) / 153;

    *dayOfMonth = (int)(dayOfYear - (153 * mp + 2) / 5 + 1);
    *month = (int)(mp < 10 ? mp + 3 : mp - 9);
    *year = (int)(yearOfEra + era * 400 + (*month <= 2 ? 1 : 0));
}

int CalendarNormalizer::daysInMonth(int year, int month)
{
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2)
    {
        bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        return leap ? 29 : 28;
    }
    return DAYS[month - 1];
}
