// Copy this file to `include/private.h` and change the values as needed.

// WiFi credentials
#define secret_wifi_ssid "xxxx"        // WiFi SSID (Network Name)
#define secret_wifi_password "xxxxxxx" // WiFi Password

// NTP server for time synchronization
#define secret_local_timeclock_server "pool.ntp.org" // NTP Server Address

// Profile whose progress this device tracks. Must be non-zero.
// If omitted, defaults to 1.
// #define PROFILE_ID 1

// Execution mode: 0 = follow a single plan, 1 = rotate through a cycle of plans
// If omitted, defaults to 0.
#define EXECUTION_MODE 0

// Simple time zone offset (minutes from UTC). Examples:
//  0     = UTC
//  60    = UTC+1
//  -300  = UTC-5
// If omitted, defaults to 0 (UTC). Valid range is -720 to 840.
// #define TIMEZONE_OFFSET_MINUTES 0

// Local hour (0-23) at which a new program day starts. With 4, a workout
// logged at 01:30 still counts for the previous day.
// If omitted, defaults to 0 (midnight).
// #define DAY_BOUNDARY_HOUR 4

// Plan layout: comma-separated days in order. A number is the exercise count
// of a training day (0-99), R marks a rest day.
#define PLAN_LAYOUT "5,6,R,4"

// Cycle layout: plan layouts separated by '|', rotated in order.
// Only used when EXECUTION_MODE is 1. An empty plan is allowed and skipped.
// #define CYCLE_LAYOUT "5,6,R,4|3,3,3|R,R"

// Clear stored progress on next boot
// IMPORTANT: set back to 0 after one boot, otherwise progress is lost on every restart.
#define CLEAR_STORAGE_ON_BOOT 0

// Sets planned per exercise when a day is materialized. Defaults to 3.
// #define SETS_PER_EXERCISE 3
