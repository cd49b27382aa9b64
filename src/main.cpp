/*
 * Project: Training Progress ESP32
 * Description: Tracks where a profile stands in its training plan or cycle of plans, one program day at a time.
 *              Progress survives restarts in NVS and today's workout is printed on the serial console.
 *
 * Hardware Requirements:
 * - ESP32
 *
 * Features:
 * - NTP-backed program day with configurable day boundary and timezone offset
 * - Single-plan and cycle execution modes
 * - Serial console commands for completions, backfills and manual day changes
 * - Wi-Fi connectivity watchdog with LED feedback
 */

#include "private.h" // Include private configuration (Wi-Fi, layouts, etc.)
#include <WiFi.h>
#include <Arduino.h>

#include "core/logging.h"
#include "adapters/implementations/define_config_provider.h"
#include "adapters/implementations/memory_plan_store.h"
#include "adapters/implementations/ntp_time_provider.h"
#include "services/calendar_normalizer.h"
#include "services/progress_engine.h"
#include "services/progress_registry.h"
#include "services/storage_abstraction.h"

// Define the LED_BUILTIN pin if missing
#ifndef LED_BUILTIN
#define LED_BUILTIN 2 // Change this pin if needed
#endif

#ifndef CLEAR_STORAGE_ON_BOOT
#define CLEAR_STORAGE_ON_BOOT 0
#endif

#ifndef SETS_PER_EXERCISE
#define SETS_PER_EXERCISE MemoryPlanStore::DEFAULT_SETS_PER_EXERCISE
#endif

static const char *const TAG = "main";

// ------------------------------
// Connectivity watchdog settings
// ------------------------------
// Maximum time to wait for Wi-Fi to connect before forcing a retry
static const unsigned long WIFI_CONNECT_TIMEOUT_MS = 30000UL; // 30s
// If the device stays offline for too long, perform a safety reboot (set to 0 to disable)
static const unsigned long OFFLINE_REBOOT_AFTER_MS = 6UL * 60UL * 60UL * 1000UL; // 6 hours
// LED blink while offline (visual feedback)
static const unsigned long OFFLINE_LED_BLINK_MS = 500UL;
// How often to check whether the program day rolled over
static const unsigned long DAY_CHECK_INTERVAL_MS = 30000UL;

static DefineConfigProvider config;
static NTPTimeProvider timeProvider;
static MemoryPlanStore planStore;
static ProgressRegistry registry;
static ProgressEngine engine(&config, &timeProvider, &planStore, &registry);

static EntityId g_profileId = INVALID_ENTITY_ID;
static EntityId g_planId = INVALID_ENTITY_ID;
static EntityId g_cycleId = INVALID_ENTITY_ID;
static ProgramDay g_lastProgramDay;
static bool g_ntpStarted = false;

static unsigned long g_wifiAttemptStartMs = 0;
static unsigned long g_wifiOfflineSince = 0;
static unsigned long g_lastConnLogMs = 0;
static unsigned long g_lastLedBlinkMs = 0;
static unsigned long g_lastDayCheckMs = 0;
static bool g_ledState = false;
static bool g_prevWifiUp = false;

static String g_commandBuffer;

static const char *wifiStatusToString(wl_status_t st)
{
  switch (st)
  {
  case WL_IDLE_STATUS:
    return "IDLE";
  case WL_NO_SSID_AVAIL:
    return "NO_SSID";
  case WL_CONNECTED:
    return "CONNECTED";
  case WL_CONNECT_FAILED:
    return "CONNECT_FAILED";
  case WL_CONNECTION_LOST:
    return "CONNECTION_LOST";
  case WL_DISCONNECTED:
    return "DISCONNECTED";
  default:
    return "UNKNOWN";
  }
}

// Blink LED forever to signal a fatal error
static void haltWithBlink()
{
  while (true)
  {
    digitalWrite(LED_BUILTIN, LOW);
    delay(200);
    digitalWrite(LED_BUILTIN, HIGH);
    delay(200);
  }
}

// ============================================================================
// Persistence
// ============================================================================

static void persistProgress()
{
  if (g_cycleId != INVALID_ENTITY_ID)
  {
    CycleProgressState state;
    {
      CycleProgressLease lease = registry.acquireCycle(g_profileId, g_cycleId);
      state = *lease;
    }
    if (!StorageAbstraction::saveCycleProgress(state))
    {
      LOG_W(TAG, "Cycle progress not persisted");
    }
  }

  if (g_planId != INVALID_ENTITY_ID)
  {
    PlanProgressState state;
    {
      PlanProgressLease lease = registry.acquirePlan(g_profileId, g_planId);
      state = *lease;
    }
    if (!StorageAbstraction::savePlanProgress(state))
    {
      LOG_W(TAG, "Plan progress not persisted");
    }
  }
}

static void restoreProgress()
{
  PlanProgressState planState;
  if (g_planId != INVALID_ENTITY_ID && StorageAbstraction::loadPlanProgress(g_profileId, g_planId, &planState))
  {
    registry.restorePlan(planState);
  }

  CycleProgressState cycleState;
  if (g_cycleId != INVALID_ENTITY_ID && StorageAbstraction::loadCycleProgress(g_profileId, g_cycleId, &cycleState))
  {
    registry.restoreCycle(cycleState);
  }
}

// ============================================================================
// Reporting
// ============================================================================

static void printWorkout()
{
  char dateBuf[16];
  ProgramDay today = engine.today();

  TodayWorkout workout;
  if (!engine.todayWorkout(g_profileId, &workout))
  {
    Serial.printf("[Today %s] No workout configured\n", CalendarNormalizer::formatIso(today, dateBuf, sizeof(dateBuf)));
    return;
  }

  if (workout.itemIndex >= 0)
  {
    Serial.printf("[Today %s] Plan %d of cycle, day %d/%d: ", CalendarNormalizer::formatIso(today, dateBuf, sizeof(dateBuf)),
                  workout.itemIndex + 1, workout.dayIndex, workout.totalDays);
  }
  else
  {
    Serial.printf("[Today %s] Day %d/%d: ", CalendarNormalizer::formatIso(today, dateBuf, sizeof(dateBuf)),
                  workout.dayIndex, workout.totalDays);
  }

  if (workout.day.isRestDay)
    Serial.println("rest day");
  else
    Serial.printf("%d exercises\n", workout.day.exerciseCount);

  DayPreview tomorrow = engine.preview(g_profileId, CalendarNormalizer::addDays(today, 1));
  if (tomorrow.available)
  {
    Serial.printf("[Tomorrow] Day %d/%d: ", tomorrow.dayIndex, tomorrow.totalDays);
    if (tomorrow.isRestDay)
      Serial.println("rest day");
    else
      Serial.printf("%d exercises\n", tomorrow.exerciseCount);
  }
}

// ============================================================================
// Program day handling
// ============================================================================

// Runs the app-open flow whenever the program day changes
static void checkProgramDay(bool force)
{
  ProgramDay today = engine.today();
  if (!today.isSet())
    return;

  if (!force && today == g_lastProgramDay)
    return;

  char dateBuf[16];
  LOG_I(TAG, "Program day: %s", CalendarNormalizer::formatIso(today, dateBuf, sizeof(dateBuf)));

  TransitionOutcome outcome = engine.onAppOpenAt(g_profileId, today);
  g_lastProgramDay = today;
  if (!outcome.rejected())
    persistProgress();

  printWorkout();
}

// ============================================================================
// Serial console
// ============================================================================

static void printHelp()
{
  Serial.println("Commands:");
  Serial.println("  status          show today's workout and tomorrow's preview");
  Serial.println("  done            complete today's workout");
  Serial.println("  backfill N      log a completed workout N days ago");
  Serial.println("  change N [skip] replace today's workout with day N");
  Serial.println("  advance         complete the cycle day and move on (cycle mode)");
  Serial.println("  reset           restart the cycle from its first plan (cycle mode)");
}

static void handleCommand(const String &line)
{
  ProgramDay today = engine.today();

  if (line == "help")
  {
    printHelp();
    return;
  }

  if (line == "status")
  {
    printWorkout();
    return;
  }

  if (!today.isSet())
  {
    Serial.println("ERROR: Clock not synchronized yet, try again once NTP is up");
    return;
  }

  if (line == "done")
  {
    if (!planStore.completeWorkout(g_profileId, today))
    {
      Serial.println("ERROR: No workout recorded for today");
      return;
    }
    Serial.println("✓ Workout completed. The next day is served on the next program day.");
    return;
  }

  if (line.startsWith("backfill "))
  {
    int daysAgo = line.substring(9).toInt();
    if (daysAgo <= 0)
    {
      Serial.println("ERROR: backfill expects a positive number of days");
      return;
    }

    TransitionOutcome outcome = engine.recordCompletion(g_profileId, CalendarNormalizer::addDays(today, -daysAgo));
    if (outcome.moved())
      persistProgress();
    printWorkout();
    return;
  }

  if (line.startsWith("change "))
  {
    String args = line.substring(7);
    bool skip = args.endsWith(" skip");
    int dayNumber = args.toInt();
    if (dayNumber <= 0)
    {
      Serial.println("ERROR: change expects a day number starting at 1");
      return;
    }

    // Cycle days are 0-indexed internally
    int newDayIndex = (g_cycleId != INVALID_ENTITY_ID) ? dayNumber - 1 : dayNumber;
    TransitionOutcome outcome = engine.changeDay(g_profileId, newDayIndex, skip);
    if (outcome.rejected())
    {
      Serial.printf("ERROR: %s\n", progressErrorToString(outcome.error));
      return;
    }
    persistProgress();
    printWorkout();
    return;
  }

  if (line == "advance")
  {
    TransitionOutcome outcome = engine.advanceCycle(g_profileId);
    if (outcome.rejected())
    {
      Serial.printf("ERROR: %s\n", progressErrorToString(outcome.error));
      return;
    }
    persistProgress();
    printWorkout();
    return;
  }

  if (line == "reset")
  {
    if (!engine.resetCycle(g_profileId))
    {
      Serial.println("ERROR: No active cycle");
      return;
    }
    persistProgress();
    printWorkout();
    return;
  }

  Serial.printf("Unknown command '%s'. Type 'help'.\n", line.c_str());
}

static void pollSerial()
{
  while (Serial.available() > 0)
  {
    char c = (char)Serial.read();
    if (c == '\r')
      continue;

    if (c != '\n')
    {
      if (g_commandBuffer.length() < 64)
        g_commandBuffer += c;
      continue;
    }

    g_commandBuffer.trim();
    if (g_commandBuffer.length() > 0)
      handleCommand(g_commandBuffer);
    g_commandBuffer = "";
  }
}

// ============================================================================
// Setup
// ============================================================================

/**
 * @brief Validate configuration parameters at startup
 *
 * Performs startup validation of configuration parameters to fail fast
 * on invalid settings. Checks:
 * - PROFILE_ID (must be non-zero)
 * - DAY_BOUNDARY_HOUR (must be 0-23)
 * - TIMEZONE_OFFSET_MINUTES (must be -720 to 840)
 * - PLAN_LAYOUT / CYCLE_LAYOUT (must parse, the active one must be set)
 *
 * Logs validation results to serial console with ✓ or ERROR markers.
 *
 * @return true if all validations passed, false if any parameter is invalid
 */
bool validateConfiguration()
{
  bool valid = true;

  Serial.println("\n=== Configuration Validation ===");

  if (config.getProfileId() == INVALID_ENTITY_ID)
  {
    Serial.println("ERROR: PROFILE_ID must be non-zero");
    valid = false;
  }
  else
  {
    Serial.printf("✓ PROFILE_ID: %lu\n", (unsigned long)config.getProfileId());
  }

  if (!CalendarNormalizer::isValidBoundaryHour(config.getDayBoundaryHour()))
  {
    Serial.printf("ERROR: Invalid DAY_BOUNDARY_HOUR=%d (expected 0-23)\n", config.getDayBoundaryHour());
    valid = false;
  }
  else
  {
    Serial.printf("✓ Day boundary: %02d:00 local time\n", config.getDayBoundaryHour());
  }

  int offset = config.getTimezoneOffsetMinutes();
  if (!CalendarNormalizer::isValidTimezoneOffset(offset))
  {
    Serial.printf("ERROR: Invalid TIMEZONE_OFFSET_MINUTES=%d (expected %d to %d)\n", offset,
                  CalendarNormalizer::MIN_TIMEZONE_OFFSET_MINUTES, CalendarNormalizer::MAX_TIMEZONE_OFFSET_MINUTES);
    valid = false;
  }
  else
  {
    Serial.printf("✓ Timezone offset: %d minutes\n", offset);
  }

  const char *planLayout = config.getPlanLayout();
  if (!MemoryPlanStore::isValidPlanLayout(planLayout))
  {
    Serial.printf("ERROR: Invalid PLAN_LAYOUT '%s'\n", planLayout);
    Serial.println("       Expected comma-separated exercise counts (0-99) or R for rest, e.g. \"5,6,R,4\"");
    valid = false;
  }
  else
  {
    Serial.printf("✓ PLAN_LAYOUT: '%s'\n", planLayout);
  }

  if (config.getExecutionMode() == MODE_CYCLE)
  {
    const char *cycleLayout = config.getCycleLayout();
    if (!MemoryPlanStore::isValidCycleLayout(cycleLayout))
    {
      Serial.printf("ERROR: Invalid CYCLE_LAYOUT '%s'\n", cycleLayout);
      Serial.println("       Expected plan layouts separated by '|', e.g. \"5,6,R|4,4\"");
      valid = false;
    }
    else
    {
      Serial.printf("✓ CYCLE_LAYOUT: '%s'\n", cycleLayout);
    }
  }
  else if (planLayout[0] == '\0')
  {
    Serial.println("WARNING: PLAN_LAYOUT is empty. No workout will be served until a plan has days.");
  }

  Serial.printf("✓ Execution mode: %s\n", executionModeToString(config.getExecutionMode()));
  Serial.println("================================\n");

  return valid;
}

// Function: setup
// Description: Initializes serial, validates configuration, builds the program and restores stored progress.
void setup()
{
  Serial.begin(115200);
  Serial.println("\n");
  // Give Serial a moment to initialize
  delay(100);

  // On platforms with native USB Serial wait briefly for host to open the port
  unsigned long serialWaitStart = millis();
  while (!Serial && millis() - serialWaitStart < 1000)
  {
    delay(10);
  }
  Serial.println("Training Progress ESP32 Starting...");

  pinMode(LED_BUILTIN, OUTPUT);
  digitalWrite(LED_BUILTIN, LOW); // turned on to start with

  // Validate configuration before proceeding
  if (!validateConfiguration())
  {
    Serial.println("\n*** FATAL: Configuration validation failed! ***");
    Serial.println("*** Fix the errors in private.h and reflash ***");
    Serial.println("*** Device halted - will not continue ***\n");
    haltWithBlink();
  }

  Serial.println("✓ Configuration valid - proceeding with initialization\n");

  // Initialize persistent storage
  if (!StorageAbstraction::begin())
  {
    Serial.println("WARNING: Persistent storage unavailable. Progress will reset on reboot.");
  }

#if CLEAR_STORAGE_ON_BOOT
  Serial.println("> CLEARING STORED PROGRESS (CLEAR_STORAGE_ON_BOOT = 1)...");
  StorageAbstraction::clearAll();
  Serial.println("> Storage cleared. Remember to set CLEAR_STORAGE_ON_BOOT = 0!");
#endif

  // Build the program. Layout order is fixed so identities are stable across boots.
  planStore.setSetsPerExercise(SETS_PER_EXERCISE);
  g_profileId = config.getProfileId();
  engine.begin();

  if (config.getExecutionMode() == MODE_CYCLE)
  {
    g_cycleId = planStore.createCycleFromLayout(config.getCycleLayout());
    if (g_cycleId == INVALID_ENTITY_ID)
    {
      Serial.println("FATAL ERROR: Could not build the cycle from CYCLE_LAYOUT");
      haltWithBlink();
    }
    engine.setActiveCycle(g_profileId, g_cycleId);
    Serial.printf("> Cycle with %u plans ready\n", (unsigned)planStore.itemsOf(g_cycleId).size());
  }
  else
  {
    g_planId = planStore.createPlanFromLayout(config.getPlanLayout());
    if (g_planId == INVALID_ENTITY_ID)
    {
      Serial.println("FATAL ERROR: Could not build the plan from PLAN_LAYOUT");
      haltWithBlink();
    }
    engine.setActivePlan(g_profileId, g_planId);
    Serial.printf("> Plan with %u days ready\n", (unsigned)planStore.daysOf(g_planId).size());
  }

  restoreProgress();

  WiFi.mode(WIFI_STA);
  WiFi.begin(config.getWiFiSSID(), config.getWiFiPassword());

  // Initialize connectivity watchdog timers
  g_wifiAttemptStartMs = millis();
  g_wifiOfflineSince = 0;
  g_lastConnLogMs = 0;
  g_lastLedBlinkMs = millis();

  Serial.println("> Waiting for Wi-Fi... timeout enabled (30s). Will retry automatically.");
  Serial.println("> Type 'help' for console commands.");
}

// ============================================================================
// Main Loop
// ============================================================================

/**
 * @brief Main loop function
 *
 * Handles serial commands, program day rollover and the Wi-Fi watchdog.
 */
void loop()
{
  pollSerial();

  const bool wifiUp = (WiFi.status() == WL_CONNECTED);

  // Log transitions to connected state (one-time per connect)
  if (wifiUp && !g_prevWifiUp)
  {
    Serial.printf("[Wi-Fi] Connected to '%s' (IP: %s, RSSI: %d dBm)\n",
                  WiFi.SSID().c_str(), WiFi.localIP().toString().c_str(), WiFi.RSSI());

    if (!g_ntpStarted)
    {
      timeProvider.begin(config.getNtpServer());
      g_ntpStarted = true;
      checkProgramDay(true);
    }
  }
  g_prevWifiUp = wifiUp;

  if (g_ntpStarted)
  {
    timeProvider.loop();

    if (millis() - g_lastDayCheckMs >= DAY_CHECK_INTERVAL_MS)
    {
      g_lastDayCheckMs = millis();
      checkProgramDay(false);
    }
  }

  if (!wifiUp)
  {
    if (g_wifiOfflineSince == 0)
      g_wifiOfflineSince = millis();
    if (g_wifiAttemptStartMs == 0)
      g_wifiAttemptStartMs = millis();

    // Blink LED while offline
    if (millis() - g_lastLedBlinkMs >= OFFLINE_LED_BLINK_MS)
    {
      g_ledState = !g_ledState;
      digitalWrite(LED_BUILTIN, g_ledState ? LOW : HIGH); // active-low on many boards
      g_lastLedBlinkMs = millis();
    }

    // Periodic status log every ~5s so it doesn't look hung
    if (g_lastConnLogMs == 0 || millis() - g_lastConnLogMs > 5000)
    {
      wl_status_t st = WiFi.status();
      Serial.printf("[Wi-Fi] Connecting to '%s'... (status=%d: %s)\n", config.getWiFiSSID(), (int)st,
                    wifiStatusToString(st));
      g_lastConnLogMs = millis();
    }

    // If a single attempt seems to stall for too long, force a fresh begin
    if (millis() - g_wifiAttemptStartMs > WIFI_CONNECT_TIMEOUT_MS)
    {
      Serial.println("[Wi-Fi] Connection attempt timed out. Forcing reconnect...");
      WiFi.disconnect(true);
      delay(50);
      WiFi.mode(WIFI_STA);
      WiFi.begin(config.getWiFiSSID(), config.getWiFiPassword());
      g_wifiAttemptStartMs = millis();
    }

    // Safety reboot if offline too long. Progress is already in NVS.
    if (OFFLINE_REBOOT_AFTER_MS > 0 && (millis() - g_wifiOfflineSince) > OFFLINE_REBOOT_AFTER_MS)
    {
      Serial.println("[Wi-Fi] Offline too long. Rebooting device to recover...");
      delay(200);
      ESP.restart();
    }
    return;
  }

  // Wi-Fi is up, LED steady off
  if (g_ledState)
  {
    digitalWrite(LED_BUILTIN, HIGH);
    g_ledState = false;
  }
  g_wifiAttemptStartMs = 0;
  g_wifiOfflineSince = 0;
  g_lastConnLogMs = 0;
}
