/**
 * @file calendar_normalizer.h
 * @brief Program-day arithmetic with a configurable day-boundary hour
 *
 * A "program day" is the calendar date in local time, shifted back by one
 * for hours before the day-boundary hour. With a boundary of 3, a workout
 * opened at 01:30 still belongs to the previous day.
 *
 * Every date comparison in the progress services goes through this module.
 * Local time is the UTC time of an ITimeProvider plus a fixed offset in
 * minutes.
 */

#ifndef CALENDAR_NORMALIZER_H
#define CALENDAR_NORMALIZER_H

#include <stddef.h>
#include <stdint.h>
#include <time.h>
#include "../core/progress_types.h"
#include "../adapters/time_provider.h"

/**
 * @class CalendarNormalizer
 * @brief Converts timestamps to ProgramDay values and compares them
 */
class CalendarNormalizer
{
public:
    static const int MIN_BOUNDARY_HOUR = 0;
    static const int MAX_BOUNDARY_HOUR = 23;
    static const int32_t SECONDS_PER_DAY = 86400;
    static const int MIN_TIMEZONE_OFFSET_MINUTES = -720; // UTC-12:00
    static const int MAX_TIMEZONE_OFFSET_MINUTES = 840;  // UTC+14:00

    /**
     * @brief Map a local timestamp to its program day
     *
     * @param localTime Local time as seconds since epoch (UTC + offset)
     * @param boundaryHour Hour (0-23) at which a new program day starts.
     *                     Out-of-range values are clamped and logged.
     * @return Program day of localTime
     */
    static ProgramDay programDay(time_t localTime, int boundaryHour);

    /**
     * @brief Program day of "now" for a clock
     *
     * @param clock Time source (UTC)
     * @param timezoneOffsetMinutes Offset from UTC in minutes (positive for east)
     * @param boundaryHour Day-boundary hour (0-23)
     */
    static ProgramDay programDayAt(const ITimeProvider &clock, int timezoneOffsetMinutes, int boundaryHour);

    /**
     * @brief True when both values are set and denote the same program day
     */
    static bool isSameDay(ProgramDay a, ProgramDay b);

    /**
     * @brief Signed whole-day difference (to - from)
     * @return 0 when either value is unset
     */
    static int32_t daysBetween(ProgramDay from, ProgramDay to);

    /**
     * @brief Shift a program day by a number of days (unset stays unset)
     */
    static ProgramDay addDays(ProgramDay day, int32_t days);

    /**
     * @brief Build a program day from a civil date
     * @return Unset ProgramDay when the date is invalid
     */
    static ProgramDay fromCalendarDate(int year, int month, int dayOfMonth);

    /**
     * @brief Convert a program day back to a civil date
     * @return false when day is unset
     */
    static bool toCalendarDate(ProgramDay day, int *year, int *month, int *dayOfMonth);

    /**
     * @brief Local timestamp for a civil date and time (seconds since epoch)
     *
     * Inverse of programDay() with boundary 0. Used by hosts and tests to
     * describe a wall-clock moment.
     */
    static time_t localTimeOf(int year, int month, int dayOfMonth, int hour, int minute);

    /**
     * @brief Format as YYYY-MM-DD ("never" when unset)
     * @return buffer, for direct use in printf arguments
     */
    static const char *formatIso(ProgramDay day, char *buffer, size_t size);

    /**
     * @brief Validate a day-boundary hour
     * @return true for 0-23
     */
    static bool isValidBoundaryHour(int hour);
    static bool isValidTimezoneOffset(int offsetMinutes);

private:
    static int32_t daysFromCivil(int year, int month, int dayOfMonth);
    static void civilFromDays(int32_t days, int *year, int *month, int *dayOfMonth);
    static int daysInMonth(int year, int month);

    // Private constructor - static-only class
    CalendarNormalizer() = delete;
};

#endif // CALENDAR_NORMALIZER_H
