/**
 * @file test_storage_records.cpp
 * @brief Unit tests for the persisted progress record format
 */

#include <unity.h>
#include <string.h>
#include "src/services/calendar_normalizer.h"
#include "src/services/storage_abstraction.h"

static uint8_t g_buffer[StorageAbstraction::CYCLE_RECORD_SIZE];

void setUp(void)
{
    memset(g_buffer, 0, sizeof(g_buffer));
}

void tearDown(void)
{
}

static PlanProgressState samplePlan()
{
    PlanProgressState state(3, 17);
    state.currentDayIndex = 5;
    state.lastOpenedDate = CalendarNormalizer::fromCalendarDate(2024, 5, 12);
    return state;
}

static CycleProgressState sampleCycle()
{
    CycleProgressState state(3, 21);
    state.currentItemIndex = 2;
    state.currentDayIndex = 1;
    state.lastAdvancedAt = 1717000000;
    state.lastCompletedDate = CalendarNormalizer::fromCalendarDate(2024, 5, 30);
    return state;
}

/**
 * Test: A plan record keeps every field, including unset dates
 */
void test_plan_record_keeps_fields(void)
{
    PlanProgressState original = samplePlan();
    TEST_ASSERT_EQUAL(StorageAbstraction::PLAN_RECORD_SIZE,
                      StorageAbstraction::encodePlanRecord(original, g_buffer, sizeof(g_buffer)));

    PlanProgressState decoded;
    TEST_ASSERT_TRUE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, &decoded));
    TEST_ASSERT_EQUAL(3, decoded.profileId);
    TEST_ASSERT_EQUAL(17, decoded.planId);
    TEST_ASSERT_EQUAL(5, decoded.currentDayIndex);
    TEST_ASSERT_TRUE(decoded.lastOpenedDate == original.lastOpenedDate);
    TEST_ASSERT_FALSE(decoded.lastCompletedDate.isSet());
}

void test_plan_record_is_little_endian(void)
{
    StorageAbstraction::encodePlanRecord(samplePlan(), g_buffer, sizeof(g_buffer));

    TEST_ASSERT_EQUAL_HEX8(0x52, g_buffer[0]);
    TEST_ASSERT_EQUAL_HEX8(0x50, g_buffer[1]);
    TEST_ASSERT_EQUAL(StorageAbstraction::RECORD_VERSION, g_buffer[2]);
    TEST_ASSERT_EQUAL(17, g_buffer[8]);
    TEST_ASSERT_EQUAL(5, g_buffer[12]);
}

void test_encode_rejects_small_buffer(void)
{
    TEST_ASSERT_EQUAL(0, StorageAbstraction::encodePlanRecord(samplePlan(), g_buffer, 10));
    TEST_ASSERT_EQUAL(0, StorageAbstraction::encodeCycleRecord(sampleCycle(), g_buffer, 30));
    TEST_ASSERT_EQUAL(0, StorageAbstraction::encodePlanRecord(samplePlan(), NULL, 64));
}

/**
 * Test: Damaged or foreign plan records are rejected and the output is untouched
 */
void test_plan_record_rejects_corruption(void)
{
    PlanProgressState untouched(9, 9);
    PlanProgressState out = untouched;

    StorageAbstraction::encodePlanRecord(samplePlan(), g_buffer, sizeof(g_buffer));
    g_buffer[0] ^= 0xFF;
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, &out));

    StorageAbstraction::encodePlanRecord(samplePlan(), g_buffer, sizeof(g_buffer));
    g_buffer[2] = StorageAbstraction::RECORD_VERSION + 1;
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, &out));

    StorageAbstraction::encodePlanRecord(samplePlan(), g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE - 1, &out));
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, NULL));

    TEST_ASSERT_EQUAL(9, out.profileId);
    TEST_ASSERT_EQUAL(1, out.currentDayIndex);
}

void test_plan_record_rejects_out_of_range_values(void)
{
    PlanProgressState out;

    PlanProgressState noProfile = samplePlan();
    noProfile.profileId = INVALID_ENTITY_ID;
    StorageAbstraction::encodePlanRecord(noProfile, g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, &out));

    PlanProgressState zeroDay = samplePlan();
    zeroDay.currentDayIndex = 0;
    StorageAbstraction::encodePlanRecord(zeroDay, g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, &out));

    PlanProgressState hugeDay = samplePlan();
    hugeDay.currentDayIndex = StorageAbstraction::MAX_STORED_INDEX + 1;
    StorageAbstraction::encodePlanRecord(hugeDay, g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, &out));

    PlanProgressState badDate = samplePlan();
    badDate.lastCompletedDate = ProgramDay(-5);
    StorageAbstraction::encodePlanRecord(badDate, g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodePlanRecord(g_buffer, StorageAbstraction::PLAN_RECORD_SIZE, &out));
}

void test_cycle_record_keeps_fields(void)
{
    CycleProgressState original = sampleCycle();
    TEST_ASSERT_EQUAL(StorageAbstraction::CYCLE_RECORD_SIZE,
                      StorageAbstraction::encodeCycleRecord(original, g_buffer, sizeof(g_buffer)));

    CycleProgressState decoded;
    TEST_ASSERT_TRUE(StorageAbstraction::decodeCycleRecord(g_buffer, sizeof(g_buffer), &decoded));
    TEST_ASSERT_EQUAL(21, decoded.cycleId);
    TEST_ASSERT_EQUAL(2, decoded.currentItemIndex);
    TEST_ASSERT_EQUAL(1, decoded.currentDayIndex);
    TEST_ASSERT_TRUE(decoded.lastAdvancedAt == original.lastAdvancedAt);
    TEST_ASSERT_FALSE(decoded.lastOpenedDate.isSet());
    TEST_ASSERT_TRUE(decoded.lastCompletedDate == original.lastCompletedDate);
}

void test_cycle_record_rejects_bad_values(void)
{
    CycleProgressState out;

    StorageAbstraction::encodePlanRecord(samplePlan(), g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodeCycleRecord(g_buffer, sizeof(g_buffer), &out));

    CycleProgressState negativeItem = sampleCycle();
    negativeItem.currentItemIndex = -1;
    StorageAbstraction::encodeCycleRecord(negativeItem, g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodeCycleRecord(g_buffer, sizeof(g_buffer), &out));

    CycleProgressState negativeTime = sampleCycle();
    negativeTime.lastAdvancedAt = -1;
    StorageAbstraction::encodeCycleRecord(negativeTime, g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodeCycleRecord(g_buffer, sizeof(g_buffer), &out));

    CycleProgressState noCycle = sampleCycle();
    noCycle.cycleId = INVALID_ENTITY_ID;
    StorageAbstraction::encodeCycleRecord(noCycle, g_buffer, sizeof(g_buffer));
    TEST_ASSERT_FALSE(StorageAbstraction::decodeCycleRecord(g_buffer, sizeof(g_buffer), &out));
}

/**
 * Test: Storage keys fit the NVS key limit and separate plans from cycles
 */
void test_storage_keys(void)
{
    char a[StorageAbstraction::KEY_SIZE];
    char b[StorageAbstraction::KEY_SIZE];
    char c[StorageAbstraction::KEY_SIZE];

    StorageAbstraction::makeKey('p', 1, 2, a, sizeof(a));
    StorageAbstraction::makeKey('p', 1, 2, b, sizeof(b));
    TEST_ASSERT_EQUAL_STRING(a, b);
    TEST_ASSERT_TRUE(strlen(a) <= 15);
    TEST_ASSERT_EQUAL('p', a[0]);

    StorageAbstraction::makeKey('p', 2, 1, c, sizeof(c));
    TEST_ASSERT_TRUE(strcmp(a, c) != 0);

    StorageAbstraction::makeKey('c', 1, 2, c, sizeof(c));
    TEST_ASSERT_EQUAL('c', c[0]);
    TEST_ASSERT_EQUAL_STRING(a + 1, c + 1);
}

#ifndef ESP32
void test_host_has_no_backend(void)
{
    PlanProgressState loaded;

    TEST_ASSERT_FALSE(StorageAbstraction::begin());
    TEST_ASSERT_FALSE(StorageAbstraction::savePlanProgress(samplePlan()));
    TEST_ASSERT_FALSE(StorageAbstraction::loadPlanProgress(3, 17, &loaded));
    TEST_ASSERT_FALSE(StorageAbstraction::clearAll());
}
#endif

int runUnityTests(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_plan_record_keeps_fields);
    RUN_TEST(test_plan_record_is_little_endian);
    RUN_TEST(test_encode_rejects_small_buffer);
    RUN_TEST(test_plan_record_rejects_corruption);
    RUN_TEST(test_plan_record_rejects_out_of_range_values);
    RUN_TEST(test_cycle_record_keeps_fields);
    RUN_TEST(test_cycle_record_rejects_bad_values);
    RUN_TEST(test_storage_keys);
#ifndef ESP32
    RUN_TEST(test_host_has_no_backend);
#endif

    return UNITY_END();
}

#ifdef ARDUINO
#include <Arduino.h>

void setup()
{
    delay(2000); // Wait for serial monitor
    runUnityTests();
}

void loop()
{
    // Nothing to do here
}
#else
int main(void)
{
    return runUnityTests();
}
#endif
