/**
 * @file test_plan_progress.cpp
 * @brief Unit tests for PlanProgress - single-plan advancement, rescue and manual day changes
 */

#include <unity.h>
#include <memory>
#include "src/adapters/implementations/memory_plan_store.h"
#include "src/services/calendar_normalizer.h"
#include "src/services/plan_progress.h"

static const EntityId PROFILE = 7;

static std::unique_ptr<MemoryPlanStore> g_store;
static EntityId g_planId = INVALID_ENTITY_ID;

void setUp(void)
{
    g_store.reset(new MemoryPlanStore());
    g_planId = g_store->createPlanFromLayout("5,6,7,8");
}

void tearDown(void)
{
    g_store.reset();
}

static ProgramDay day(int dayOfMonth)
{
    return CalendarNormalizer::fromCalendarDate(2024, 5, dayOfMonth);
}

static EntityId dayIdAt(EntityId planId, int position)
{
    return g_store->daysOf(planId)[position - 1].id;
}

static void logCompleteWorkout(EntityId planId, int position, ProgramDay date)
{
    g_store->putWorkoutRecord(PROFILE, planId, dayIdAt(planId, position), date, 15, 15);
}

/**
 * Test: The very first open remembers the day and never advances
 */
void test_first_open_does_not_advance(void)
{
    PlanProgressState state(PROFILE, g_planId);

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(1));

    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_EQUAL(1, state.currentDayIndex);
    TEST_ASSERT_TRUE(state.lastOpenedDate == day(1));
    TEST_ASSERT_FALSE(state.lastCompletedDate.isSet());
}

/**
 * Test: 4-day plan at day 3, completed workout on the last opened day,
 * opened two days later at 02:00, re-opened at 02:01, then an older backfill
 */
void test_four_day_plan_scenario(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 3;
    state.lastOpenedDate = day(10);
    logCompleteWorkout(g_planId, 3, day(10));

    ProgramDay openDay = CalendarNormalizer::programDay(CalendarNormalizer::localTimeOf(2024, 5, 12, 2, 0), 0);
    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, openDay);
    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, outcome.result);
    TEST_ASSERT_EQUAL(4, state.currentDayIndex);
    TEST_ASSERT_TRUE(state.lastCompletedDate == day(10));
    TEST_ASSERT_TRUE(state.lastOpenedDate == day(12));

    ProgramDay reopenDay = CalendarNormalizer::programDay(CalendarNormalizer::localTimeOf(2024, 5, 12, 2, 1), 0);
    outcome = PlanProgress::handleAppOpen(*g_store, state, reopenDay);
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_EQUAL(4, state.currentDayIndex);

    outcome = PlanProgress::recordCompletion(*g_store, state, day(9));
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_EQUAL(4, state.currentDayIndex);
}

void test_same_day_open_is_idempotent(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 2;
    state.lastOpenedDate = day(3);
    logCompleteWorkout(g_planId, 2, day(3));

    PlanProgress::handleAppOpen(*g_store, state, day(4));
    TEST_ASSERT_EQUAL(3, state.currentDayIndex);

    for (int i = 0; i < 5; i++)
    {
        TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(4));
        TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
        TEST_ASSERT_EQUAL(3, state.currentDayIndex);
    }
}

/**
 * Test: Advancing from the last day wraps to day 1
 */
void test_wraparound_from_last_day(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 4;
    state.lastOpenedDate = day(3);
    logCompleteWorkout(g_planId, 4, day(3));

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(4));

    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, outcome.result);
    TEST_ASSERT_EQUAL(1, state.currentDayIndex);
    TEST_ASSERT_EQUAL(1, outcome.dayIndex);
}

/**
 * Test: A partially logged workout is discarded and the same day offered again
 */
void test_incomplete_record_is_deleted(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 2;
    state.lastOpenedDate = day(3);
    g_store->putWorkoutRecord(PROFILE, g_planId, dayIdAt(g_planId, 2), day(3), 18, 4);

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(5));

    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_TRUE(outcome.staleRecordDeleted);
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);
    TEST_ASSERT_EQUAL(RECORD_ABSENT, g_store->workoutRecordStatus(PROFILE, g_planId, day(3)));
    TEST_ASSERT_TRUE(state.lastOpenedDate == day(5));
}

void test_absent_record_keeps_day(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 2;
    state.lastOpenedDate = day(3);

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(4));

    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_FALSE(outcome.staleRecordDeleted);
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);
}

/**
 * Test: Rest days advance on the next open even without any record
 */
void test_rest_day_advances_without_record(void)
{
    EntityId planId = g_store->createPlanFromLayout("5,R,6");
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 2;
    state.lastOpenedDate = day(3);

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(4));

    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, outcome.result);
    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
    TEST_ASSERT_FALSE(state.lastCompletedDate.isSet());
}

/**
 * Test: A completion already credited through a backfill is not counted again on open
 */
void test_backfilled_completion_not_counted_twice(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 1;
    state.lastOpenedDate = day(3);
    logCompleteWorkout(g_planId, 1, day(3));

    TransitionOutcome outcome = PlanProgress::recordCompletion(*g_store, state, day(3));
    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, outcome.result);
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);

    outcome = PlanProgress::handleAppOpen(*g_store, state, day(4));
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);
}

/**
 * Test: Completions only advance when strictly newer than every previous one
 */
void test_monotonic_rescue(void)
{
    PlanProgressState state(PROFILE, g_planId);

    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, PlanProgress::recordCompletion(*g_store, state, day(5)).result);
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, PlanProgress::recordCompletion(*g_store, state, day(2)).result);
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, PlanProgress::recordCompletion(*g_store, state, day(5)).result);
    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, PlanProgress::recordCompletion(*g_store, state, day(8)).result);
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, PlanProgress::recordCompletion(*g_store, state, day(7)).result);

    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
    TEST_ASSERT_TRUE(state.lastCompletedDate == day(8));
}

void test_clock_moving_backwards_changes_nothing(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 2;
    state.lastOpenedDate = day(10);
    logCompleteWorkout(g_planId, 2, day(10));

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(8));

    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);
    TEST_ASSERT_TRUE(state.lastOpenedDate == day(10));
}

/**
 * Test: Empty and missing plans are rejected without touching the state
 */
void test_empty_or_missing_plan_is_invalid(void)
{
    EntityId emptyPlan = g_store->createPlan();
    PlanProgressState state(PROFILE, emptyPlan);
    state.currentDayIndex = 3;

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, day(1));
    TEST_ASSERT_EQUAL(TRANSITION_INVALID, outcome.result);
    TEST_ASSERT_EQUAL(PROGRESS_EMPTY_PLAN, outcome.error);
    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
    TEST_ASSERT_FALSE(state.lastOpenedDate.isSet());

    PlanProgressState missing(PROFILE, 999);
    outcome = PlanProgress::recordCompletion(*g_store, missing, day(1));
    TEST_ASSERT_EQUAL(PROGRESS_PLAN_NOT_FOUND, outcome.error);
    TEST_ASSERT_EQUAL(1, missing.currentDayIndex);
}

void test_unset_today_is_rejected(void)
{
    PlanProgressState state(PROFILE, g_planId);

    TransitionOutcome outcome = PlanProgress::handleAppOpen(*g_store, state, ProgramDay());

    TEST_ASSERT_EQUAL(PROGRESS_TIME_NOT_SYNCED, outcome.error);
    TEST_ASSERT_FALSE(state.lastOpenedDate.isSet());
}

/**
 * Test: Changing the day is refused once sets are logged today
 */
void test_change_day_refused_when_in_progress(void)
{
    PlanProgressState state(PROFILE, g_planId);
    TEST_ASSERT_TRUE(g_store->materializeDay(PROFILE, g_planId, dayIdAt(g_planId, 1), day(6)));
    TEST_ASSERT_TRUE(g_store->logCompletedSets(PROFILE, day(6), 2));

    TransitionOutcome outcome = PlanProgress::changeDay(*g_store, state, day(6), 3, false);

    TEST_ASSERT_EQUAL(TRANSITION_INVALID, outcome.result);
    TEST_ASSERT_EQUAL(PROGRESS_DAY_IN_PROGRESS, outcome.error);
    TEST_ASSERT_EQUAL(dayIdAt(g_planId, 1), g_store->recordDayId(PROFILE, day(6)));
}

void test_change_day_without_skip_keeps_pointer(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 2;

    TransitionOutcome outcome = PlanProgress::changeDay(*g_store, state, day(6), 4, false);

    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);
    TEST_ASSERT_EQUAL(dayIdAt(g_planId, 4), g_store->recordDayId(PROFILE, day(6)));
}

/**
 * Test: Skip-and-advance continues after the chosen day, wrapping at the end
 */
void test_change_day_with_skip_continues_after_target(void)
{
    PlanProgressState state(PROFILE, g_planId);

    TransitionOutcome outcome = PlanProgress::changeDay(*g_store, state, day(6), 4, true);
    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, outcome.result);
    TEST_ASSERT_EQUAL(1, state.currentDayIndex);
    TEST_ASSERT_TRUE(state.lastOpenedDate == day(6));
    TEST_ASSERT_TRUE(state.lastCompletedDate == day(6));

    outcome = PlanProgress::changeDay(*g_store, state, day(6), 2, true);
    TEST_ASSERT_EQUAL(3, state.currentDayIndex);

    // The skipped day is credited, so the next open does not advance again
    g_store->completeWorkout(PROFILE, day(6));
    outcome = PlanProgress::handleAppOpen(*g_store, state, day(7));
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, outcome.result);
    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
}

void test_change_day_to_unknown_day(void)
{
    PlanProgressState state(PROFILE, g_planId);

    TransitionOutcome outcome = PlanProgress::changeDay(*g_store, state, day(6), 9, true);

    TEST_ASSERT_EQUAL(PROGRESS_DAY_NOT_FOUND, outcome.error);
    TEST_ASSERT_EQUAL(1, state.currentDayIndex);
    TEST_ASSERT_FALSE(g_store->hasWorkoutRecord(PROFILE, day(6)));
}

void test_start_at(void)
{
    PlanProgressState state(PROFILE, g_planId);

    TEST_ASSERT_EQUAL(TRANSITION_ADVANCED, PlanProgress::startAt(*g_store, state, 3).result);
    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
    TEST_ASSERT_EQUAL(TRANSITION_NO_OP, PlanProgress::startAt(*g_store, state, 3).result);
    TEST_ASSERT_EQUAL(PROGRESS_DAY_NOT_FOUND, PlanProgress::startAt(*g_store, state, 5).error);
    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
}

void test_next_day_index(void)
{
    TEST_ASSERT_EQUAL(2, PlanProgress::nextDayIndex(1, 4));
    TEST_ASSERT_EQUAL(1, PlanProgress::nextDayIndex(4, 4));
    TEST_ASSERT_EQUAL(2, PlanProgress::nextDayIndex(5, 4));
    TEST_ASSERT_EQUAL(3, PlanProgress::nextDayIndex(6, 4));
    TEST_ASSERT_EQUAL(1, PlanProgress::nextDayIndex(1, 1));
    TEST_ASSERT_EQUAL(NO_DAY_INDEX, PlanProgress::nextDayIndex(3, 0));
}

void test_current_day_resolves_by_position(void)
{
    PlanProgressState state(PROFILE, g_planId);
    state.currentDayIndex = 2;

    PlanDayInfo info;
    int total = 0;
    TEST_ASSERT_TRUE(PlanProgress::currentDay(*g_store, state, &info, &total));
    TEST_ASSERT_EQUAL(4, total);
    TEST_ASSERT_EQUAL(2, info.position);
    TEST_ASSERT_EQUAL(6, info.exerciseCount);

    state.currentDayIndex = 7;
    TEST_ASSERT_FALSE(PlanProgress::currentDay(*g_store, state, &info));
}

int runUnityTests(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_first_open_does_not_advance);
    RUN_TEST(test_four_day_plan_scenario);
    RUN_TEST(test_same_day_open_is_idempotent);
    RUN_TEST(test_wraparound_from_last_day);
    RUN_TEST(test_incomplete_record_is_deleted);
    RUN_TEST(test_absent_record_keeps_day);
    RUN_TEST(test_rest_day_advances_without_record);
    RUN_TEST(test_backfilled_completion_not_counted_twice);
    RUN_TEST(test_monotonic_rescue);
    RUN_TEST(test_clock_moving_backwards_changes_nothing);
    RUN_TEST(test_empty_or_missing_plan_is_invalid);
    RUN_TEST(test_unset_today_is_rejected);
    RUN_TEST(test_change_day_refused_when_in_progress);
    RUN_TEST(test_change_day_without_skip_keeps_pointer);
    RUN_TEST(test_change_day_with_skip_continues_after_target);
    RUN_TEST(test_change_day_to_unknown_day);
    RUN_TEST(test_start_at);
    RUN_TEST(test_next_day_index);
    RUN_TEST(test_current_day_resolves_by_position);

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
