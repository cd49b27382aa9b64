/**
 * @file config_provider.h
 * @brief Abstract interface for configuration access
 *
 * Provides a platform-agnostic way to access configuration parameters.
 * This allows the progress engine to work with different configuration
 * sources (compile-time defines, a settings screen, test fixtures, etc.)
 *
 * Implementations:
 * - DefineConfigProvider: Uses compile-time #defines from private.h (firmware)
 */

#ifndef CONFIG_PROVIDER_H
#define CONFIG_PROVIDER_H

#include <stdint.h>
#include "../core/progress_types.h"

/**
 * @class IConfigProvider
 * @brief Abstract interface for accessing configuration parameters
 *
 * All configuration access should go through this interface to enable
 * different configuration backends.
 */
class IConfigProvider
{
public:
    virtual ~IConfigProvider() = default;

    // Profile selection
    virtual EntityId getProfileId() const = 0;
    virtual ExecutionMode getExecutionMode() const = 0;

    // Calendar configuration
    virtual int getDayBoundaryHour() const = 0;
    virtual int getTimezoneOffsetMinutes() const = 0;

    // Program layout ("5,6,R,4" per plan, plans separated by '|' in a cycle)
    virtual const char *getPlanLayout() const = 0;
    virtual const char *getCycleLayout() const = 0;

    // Network configuration (firmware only)
    virtual const char *getWiFiSSID() const = 0;
    virtual const char *getWiFiPassword() const = 0;
    virtual const char *getNtpServer() const = 0;
};

#endif // CONFIG_PROVIDER_H
