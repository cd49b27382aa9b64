/**
 * @file ntp_time_provider.h
 * @brief SNTP clock for program-day tracking on ESP32
 *
 * The RTC keeps counting across a soft reset, so a plausible time alone is
 * not trusted: the clock becomes valid only once SNTP completes a sync in
 * this boot. After that it stays valid and SNTP is restarted periodically
 * so the day boundary is not judged on a drifted clock.
 */

#ifndef NTP_TIME_PROVIDER_H
#define NTP_TIME_PROVIDER_H

#include "../time_provider.h"

/**
 * @class NTPTimeProvider
 * @brief ITimeProvider backed by the ESP32 SNTP client
 */
class NTPTimeProvider : public ITimeProvider
{
public:
    NTPTimeProvider();
    ~NTPTimeProvider() override = default;

    /**
     * @brief Start SNTP in UTC and wait up to SYNC_TIMEOUT_MS for the first sync
     * @param ntpServer NTP server hostname or IP
     */
    void begin(const char *ntpServer);

    /**
     * @brief Pick up background syncs, retry while unsynced, refresh while synced
     *
     * Call from the main loop. Only the retry before the first sync blocks.
     */
    void loop();

    bool isTimeValid() const override;
    time_t getCurrentTime() const override;

    /**
     * @brief Restart SNTP and block until it syncs or SYNC_TIMEOUT_MS passes
     */
    void requestSync() override;

    /**
     * @brief UTC time of the last completed sync, 0 if none this boot
     */
    time_t lastSyncTime() const { return m_lastSyncTime; }

private:
    void startSntp();
    bool pollSyncStatus();

    bool m_synced;
    const char *m_ntpServer;
    unsigned long m_lastSyncAttempt;
    time_t m_lastSyncTime;

    static const unsigned long SYNC_TIMEOUT_MS = 10000;
    static const unsigned long RETRY_INTERVAL_MS = 60000;
    static const unsigned long REFRESH_INTERVAL_MS = 6UL * 60UL * 60UL * 1000UL; // 6 hours
};

#endif // NTP_TIME_PROVIDER_H
