/**
 * @file time_provider.h
 * @brief Clock that program days are derived from
 *
 * The engine asks a clock for two things only: the current UTC time and
 * whether that time may be turned into a program day. While it may not, no
 * "today" exists and every transition is rejected with TIME_NOT_SYNCED.
 * Timezone offset and day boundary are applied by CalendarNormalizer.
 *
 * Implementations:
 * - NTPTimeProvider: SNTP on the device
 * - FixedTimeProvider: hand-set clock in unit tests
 */

#ifndef TIME_PROVIDER_H
#define TIME_PROVIDER_H

#include <time.h>

/**
 * @class ITimeProvider
 * @brief UTC time source with a validity gate
 */
class ITimeProvider
{
public:
    // 2021-01-01 00:00:00 UTC; anything earlier is an unset RTC
    static const time_t MIN_VALID_EPOCH = 1609459200;

    virtual ~ITimeProvider() = default;

    /**
     * @brief Current UTC time as a Unix timestamp
     */
    virtual time_t getCurrentTime() const = 0;

    /**
     * @brief Whether getCurrentTime() can be used to compute a program day
     *
     * The default only rejects clocks before MIN_VALID_EPOCH. Network-synced
     * providers additionally require a completed sync.
     */
    virtual bool isTimeValid() const
    {
        return getCurrentTime() >= MIN_VALID_EPOCH;
    }

    /**
     * @brief Ask the provider to refresh its time source (no-op by default)
     */
    virtual void requestSync() {}
};

#endif // TIME_PROVIDER_H
