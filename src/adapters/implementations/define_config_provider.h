/**
 * @file define_config_provider.h
 * @brief Configuration provider using compile-time defines from private.h
 *
 * This is the implementation for the firmware build that reads
 * configuration from preprocessor defines in private.h
 */

#ifndef DEFINE_CONFIG_PROVIDER_H
#define DEFINE_CONFIG_PROVIDER_H

#include "../config_provider.h"
#include "private.h"

// Defaults for settings that may be omitted from private.h
#ifndef PROFILE_ID
#define PROFILE_ID 1
#endif

#ifndef EXECUTION_MODE
#define EXECUTION_MODE 0 // 0 = single plan, 1 = cycle
#endif

#ifndef DAY_BOUNDARY_HOUR
#define DAY_BOUNDARY_HOUR 0
#endif

#ifndef TIMEZONE_OFFSET_MINUTES
#define TIMEZONE_OFFSET_MINUTES 0
#endif

#ifndef PLAN_LAYOUT
#define PLAN_LAYOUT ""
#endif

#ifndef CYCLE_LAYOUT
#define CYCLE_LAYOUT ""
#endif

#ifndef secret_local_timeclock_server
#define secret_local_timeclock_server "pool.ntp.org"
#endif

/**
 * @class DefineConfigProvider
 * @brief Configuration provider using #defines from private.h
 *
 * Provides configuration values from compile-time defines.
 */
class DefineConfigProvider : public IConfigProvider
{
public:
        DefineConfigProvider() = default;
        ~DefineConfigProvider() override = default;

        EntityId getProfileId() const override { return (EntityId)PROFILE_ID; }

        ExecutionMode getExecutionMode() const override
        {
                return EXECUTION_MODE != 0 ? MODE_CYCLE : MODE_SINGLE_PLAN;
        }

        int getDayBoundaryHour() const override { return DAY_BOUNDARY_HOUR; }
        int getTimezoneOffsetMinutes() const override { return TIMEZONE_OFFSET_MINUTES; }

        const char *getPlanLayout() const override { return PLAN_LAYOUT; }
        const char *getCycleLayout() const override { return CYCLE_LAYOUT; }

        const char *getWiFiSSID() const override { return secret_wifi_ssid; }
        const char *getWiFiPassword() const override { return secret_wifi_password; }
        const char *getNtpServer() const override { return secret_local_timeclock_server; }
};

#endif // DEFINE_CONFIG_PROVIDER_H
