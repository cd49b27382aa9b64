/**
 * @file ntp_time_provider.cpp
 * @brief Implementation of the SNTP clock
 */

#include "ntp_time_provider.h"
#include "../../core/logging.h"
#include <Arduino.h>
#include <esp_sntp.h>

static const char *const TAG = "ntp";

NTPTimeProvider::NTPTimeProvider()
    : m_synced(false), m_ntpServer(nullptr), m_lastSyncAttempt(0), m_lastSyncTime(0)
{
}

void NTPTimeProvider::begin(const char *ntpServer)
{
    m_ntpServer = ntpServer;
    LOG_I(TAG, "Using NTP server %s", ntpServer);
    requestSync();
}

void NTPTimeProvider::loop()
{
    if (m_ntpServer == nullptr)
        return;

    pollSyncStatus();

    unsigned long elapsed = millis() - m_lastSyncAttempt;
    if (!m_synced && elapsed >= RETRY_INTERVAL_MS)
    {
        requestSync();
    }
    else if (m_synced && elapsed >= REFRESH_INTERVAL_MS)
    {
        LOG_D(TAG, "Refreshing clock");
        startSntp();
    }
}

void NTPTimeProvider::requestSync()
{
    if (m_ntpServer == nullptr)
    {
        LOG_W(TAG, "Sync requested before begin()");
        return;
    }

    startSntp();

    unsigned long waitStart = millis();
    while (millis() - waitStart < SYNC_TIMEOUT_MS)
    {
        if (pollSyncStatus())
        {
            LOG_I(TAG, "Sync completed after %lu ms", (unsigned long)(millis() - waitStart));
            return;
        }
        delay(200);
    }

    if (m_synced)
    {
        LOG_W(TAG, "Refresh timed out, keeping the clock from the last sync");
    }
    else
    {
        LOG_W(TAG, "No sync after %lu ms, program day tracking stays paused", SYNC_TIMEOUT_MS);
    }
}

bool NTPTimeProvider::isTimeValid() const
{
    return m_synced && ITimeProvider::isTimeValid();
}

time_t NTPTimeProvider::getCurrentTime() const
{
    return time(nullptr);
}

void NTPTimeProvider::startSntp()
{
    m_lastSyncAttempt = millis();
    // UTC only; the configured offset is applied when computing the program day
    configTzTime("UTC0", m_ntpServer);
}

bool NTPTimeProvider::pollSyncStatus()
{
    // Reading COMPLETED resets the status, so each sync is seen once
    if (sntp_get_sync_status() != SNTP_SYNC_STATUS_COMPLETED)
        return false;

    time_t now = time(nullptr);
    if (now < MIN_VALID_EPOCH)
        return false;

    if (m_lastSyncTime != 0 && now < m_lastSyncTime)
    {
        LOG_W(TAG, "Clock moved back %ld s at sync, day transitions wait until it catches up",
              (long)(m_lastSyncTime - now));
    }

    if (!m_synced)
    {
        struct tm utc;
        gmtime_r(&now, &utc);
        LOG_I(TAG, "Clock valid (%04d-%02d-%02d %02d:%02d UTC), program day tracking is ACTIVE",
              utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min);
    }

    m_synced = true;
    m_lastSyncTime = now;
    return true;
}
