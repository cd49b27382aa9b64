/**
 * @file logging.h
 * @brief Cross-platform logging macros for firmware and host builds
 *
 * LOGGING GUIDE:
 * ==============
 *
 * 1. Include header:
 *    #include "../core/logging.h"
 *
 * 2. Define a per-module TAG at file scope:
 *    static const char *const TAG = "plan_progress";
 *
 * 3. Use LOG_* macros (printf-style):
 *    LOG_D(TAG, "Debug: value=%d", val);   // [D][plan_progress] Debug: value=42
 *    LOG_I(TAG, "Info: %s", msg);          // [I][plan_progress] Info: OK
 *    LOG_W(TAG, "Warning: %s", warn);      // [W][plan_progress] Warning: ...
 *    LOG_E(TAG, "Error: %s", err);         // [E][plan_progress] Error: ...
 *    LOG_V(TAG, "Verbose trace");          // [V][plan_progress] Verbose trace
 *
 * TARGETS:
 * ========
 * - Arduino (ESP8266/ESP32 firmware): expands to Serial.printf, USB logs only
 * - Host builds (unit tests, simulators): expands to fprintf(stderr)
 *
 * Verbose output is compiled out unless TRAINING_LOG_VERBOSE is defined.
 */

#pragma once

#if defined(ARDUINO)
// ============================================================================
// FIRMWARE MODE: Serial output as "[L][tag] message"
// ============================================================================
// Format: [Level][tag] message
#include <Arduino.h>

#define LOG_D(tag, format, ...) Serial.printf("[D][%s] " format "\n", tag, ##__VA_ARGS__)
#define LOG_I(tag, format, ...) Serial.printf("[I][%s] " format "\n", tag, ##__VA_ARGS__)
#define LOG_W(tag, format, ...) Serial.printf("[W][%s] " format "\n", tag, ##__VA_ARGS__)
#define LOG_E(tag, format, ...) Serial.printf("[E][%s] " format "\n", tag, ##__VA_ARGS__)
#ifdef TRAINING_LOG_VERBOSE
#define LOG_V(tag, format, ...) Serial.printf("[V][%s] " format "\n", tag, ##__VA_ARGS__)
#else
#define LOG_V(tag, format, ...) ((void)0)
#endif

#else
// ============================================================================
// HOST MODE: Same format on stderr so test output stays clean on stdout
// ============================================================================
#include <cstdio>

#define LOG_D(tag, format, ...) std::fprintf(stderr, "[D][%s] " format "\n", tag, ##__VA_ARGS__)
#define LOG_I(tag, format, ...) std::fprintf(stderr, "[I][%s] " format "\n", tag, ##__VA_ARGS__)
#define LOG_W(tag, format, ...) std::fprintf(stderr, "[W][%s] " format "\n", tag, ##__VA_ARGS__)
#define LOG_E(tag, format, ...) std::fprintf(stderr, "[E][%s] " format "\n", tag, ##__VA_ARGS__)
#ifdef TRAINING_LOG_VERBOSE
#define LOG_V(tag, format, ...) std::fprintf(stderr, "[V][%s] " format "\n", tag, ##__VA_ARGS__)
#else
#define LOG_V(tag, format, ...) ((void)0)
#endif
#endif
