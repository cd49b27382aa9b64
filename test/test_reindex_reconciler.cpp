/**
 * @file test_reindex_reconciler.cpp
 * @brief Unit tests for ReindexReconciler - pointer identity across day and item edits
 */

#include <unity.h>
#include <memory>
#include <vector>
#include "src/adapters/implementations/memory_plan_store.h"
#include "src/services/reindex_reconciler.h"

static const EntityId PROFILE = 1;

static std::unique_ptr<MemoryPlanStore> g_store;

void setUp(void)
{
    g_store.reset(new MemoryPlanStore());
}

void tearDown(void)
{
    g_store.reset();
}

static EntityId dayIdAt(EntityId planId, int position)
{
    const PlanDayInfo *day = ReindexReconciler::dayAtPosition(g_store->daysOf(planId), position);
    return day ? day->id : INVALID_ENTITY_ID;
}

static PlanDayInfo makeDay(EntityId id, int position)
{
    PlanDayInfo day = {id, position, false, 3};
    return day;
}

/**
 * Test: Deleting an earlier day keeps the pointer on the same day by identity
 */
void test_delete_earlier_day_keeps_identity(void)
{
    EntityId planId = g_store->createPlanFromLayout("1,2,3,4");
    EntityId current = dayIdAt(planId, 3);
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 3;

    g_store->removeDay(planId, dayIdAt(planId, 1));
    bool changed = ReindexReconciler::reindexPlan(*g_store, state);

    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);
    TEST_ASSERT_EQUAL(current, dayIdAt(planId, state.currentDayIndex));
}

void test_delete_later_day_changes_nothing(void)
{
    EntityId planId = g_store->createPlanFromLayout("1,2,3,4");
    EntityId current = dayIdAt(planId, 2);
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 2;

    g_store->removeDay(planId, dayIdAt(planId, 4));

    TEST_ASSERT_FALSE(ReindexReconciler::reindexPlan(*g_store, state));
    TEST_ASSERT_EQUAL(current, dayIdAt(planId, state.currentDayIndex));
}

/**
 * Test: Deleting the current day clamps the old index to the new range
 */
void test_delete_current_day_clamps(void)
{
    EntityId planId = g_store->createPlanFromLayout("1,2,3,4");
    EntityId following = dayIdAt(planId, 4);
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 3;

    g_store->removeDay(planId, dayIdAt(planId, 3));
    ReindexReconciler::reindexPlan(*g_store, state);

    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
    TEST_ASSERT_EQUAL(following, dayIdAt(planId, 3));
}

void test_delete_last_day_clamps_down(void)
{
    EntityId planId = g_store->createPlanFromLayout("1,2,3");
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 3;

    g_store->removeDay(planId, dayIdAt(planId, 3));

    TEST_ASSERT_TRUE(ReindexReconciler::reindexPlan(*g_store, state));
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);
}

/**
 * Test: Moving the current day follows it to its new position
 */
void test_move_current_day_follows_identity(void)
{
    EntityId planId = g_store->createPlanFromLayout("1,2,3,4");
    EntityId current = dayIdAt(planId, 3);
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 3;

    DayAnchor anchor = ReindexReconciler::capturePlanAnchor(*g_store, state);
    g_store->moveDay(planId, current, 1);

    TEST_ASSERT_TRUE(ReindexReconciler::restorePlanPointer(*g_store, state, anchor));
    TEST_ASSERT_EQUAL(1, state.currentDayIndex);
    TEST_ASSERT_EQUAL(current, dayIdAt(planId, 1));
}

void test_insert_before_current_day(void)
{
    EntityId planId = g_store->createPlanFromLayout("1,2,3");
    EntityId current = dayIdAt(planId, 2);
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 2;

    DayAnchor anchor = ReindexReconciler::capturePlanAnchor(*g_store, state);
    g_store->insertDay(planId, 1, 9);
    ReindexReconciler::restorePlanPointer(*g_store, state, anchor);

    TEST_ASSERT_EQUAL(3, state.currentDayIndex);
    TEST_ASSERT_EQUAL(current, dayIdAt(planId, 3));
}

/**
 * Test: An emptied plan keeps the stored pointer until days come back
 */
void test_empty_plan_keeps_pointer(void)
{
    EntityId planId = g_store->createPlanFromLayout("1,2");
    PlanProgressState state(PROFILE, planId);
    state.currentDayIndex = 2;

    g_store->removeDay(planId, dayIdAt(planId, 2));
    g_store->removeDay(planId, dayIdAt(planId, 1));

    TEST_ASSERT_FALSE(ReindexReconciler::reindexPlan(*g_store, state));
    TEST_ASSERT_EQUAL(2, state.currentDayIndex);

    PlanProgressState missing(PROFILE, 777);
    missing.currentDayIndex = 4;
    TEST_ASSERT_FALSE(ReindexReconciler::reindexPlan(*g_store, missing));
    TEST_ASSERT_EQUAL(4, missing.currentDayIndex);
}

void test_resolve_day_index_on_lists(void)
{
    std::vector<PlanDayInfo> days;
    days.push_back(makeDay(10, 1));
    days.push_back(makeDay(11, 2));
    days.push_back(makeDay(12, 3));

    DayAnchor anchor = ReindexReconciler::captureDayAnchor(days, 2);
    TEST_ASSERT_EQUAL(11, anchor.dayId);

    // Day 10 removed and the rest renumbered
    std::vector<PlanDayInfo> edited;
    edited.push_back(makeDay(11, 1));
    edited.push_back(makeDay(12, 2));
    TEST_ASSERT_EQUAL(1, ReindexReconciler::resolveDayIndex(edited, anchor));

    DayAnchor lost = {99, 7};
    TEST_ASSERT_EQUAL(2, ReindexReconciler::resolveDayIndex(edited, lost));
    DayAnchor low = {99, -3};
    TEST_ASSERT_EQUAL(1, ReindexReconciler::resolveDayIndex(edited, low));

    TEST_ASSERT_EQUAL(NO_DAY_INDEX, ReindexReconciler::resolveDayIndex(std::vector<PlanDayInfo>(), anchor));
}

/**
 * Test: Removing an earlier cycle item keeps the pointer on the same item and day
 */
void test_cycle_remove_earlier_item(void)
{
    EntityId cycleId = g_store->createCycleFromLayout("4|5,6|7");
    EntityId currentItem = g_store->itemsOf(cycleId)[1].id;
    CycleProgressState state(PROFILE, cycleId);
    state.currentItemIndex = 1;
    state.currentDayIndex = 1;

    CycleAnchor anchor = ReindexReconciler::captureCycleAnchor(*g_store, state);
    g_store->removeItem(cycleId, g_store->itemsOf(cycleId)[0].id);

    TEST_ASSERT_TRUE(ReindexReconciler::restoreCyclePointer(*g_store, state, anchor));
    TEST_ASSERT_EQUAL(0, state.currentItemIndex);
    TEST_ASSERT_EQUAL(1, state.currentDayIndex);
    TEST_ASSERT_EQUAL(currentItem, g_store->itemsOf(cycleId)[0].id);
}

void test_cycle_remove_current_item(void)
{
    EntityId cycleId = g_store->createCycleFromLayout("4|5,6|7,8");
    CycleProgressState state(PROFILE, cycleId);
    state.currentItemIndex = 1;
    state.currentDayIndex = 1;

    CycleAnchor anchor = ReindexReconciler::captureCycleAnchor(*g_store, state);
    g_store->removeItem(cycleId, g_store->itemsOf(cycleId)[1].id);
    ReindexReconciler::restoreCyclePointer(*g_store, state, anchor);

    // Lands on the item that followed, at its first day
    TEST_ASSERT_EQUAL(1, state.currentItemIndex);
    TEST_ASSERT_EQUAL(0, state.currentDayIndex);
}

void test_cycle_move_current_item(void)
{
    EntityId cycleId = g_store->createCycleFromLayout("4|5,6|7");
    EntityId currentItem = g_store->itemsOf(cycleId)[2].id;
    CycleProgressState state(PROFILE, cycleId);
    state.currentItemIndex = 2;
    state.currentDayIndex = 0;

    CycleAnchor anchor = ReindexReconciler::captureCycleAnchor(*g_store, state);
    g_store->moveItem(cycleId, currentItem, 0);
    ReindexReconciler::restoreCyclePointer(*g_store, state, anchor);

    TEST_ASSERT_EQUAL(0, state.currentItemIndex);
    TEST_ASSERT_EQUAL(currentItem, g_store->itemsOf(cycleId)[0].id);
}

void test_cycle_day_removed_inside_current_plan(void)
{
    EntityId cycleId = g_store->createCycleFromLayout("4|5,6,7");
    EntityId planId = g_store->itemsOf(cycleId)[1].planId;
    EntityId currentDay = g_store->daysOf(planId)[2].id;
    CycleProgressState state(PROFILE, cycleId);
    state.currentItemIndex = 1;
    state.currentDayIndex = 2;

    CycleAnchor anchor = ReindexReconciler::captureCycleAnchor(*g_store, state);
    g_store->removeDay(planId, g_store->daysOf(planId)[0].id);
    ReindexReconciler::restoreCyclePointer(*g_store, state, anchor);

    TEST_ASSERT_EQUAL(1, state.currentItemIndex);
    TEST_ASSERT_EQUAL(1, state.currentDayIndex);
    TEST_ASSERT_EQUAL(currentDay, g_store->daysOf(planId)[1].id);
}

void test_cycle_all_items_removed_resets(void)
{
    EntityId cycleId = g_store->createCycleFromLayout("4|5");
    CycleProgressState state(PROFILE, cycleId);
    state.currentItemIndex = 1;

    std::vector<CycleItemInfo> items = g_store->itemsOf(cycleId);
    for (size_t i = 0; i < items.size(); i++)
        g_store->removeItem(cycleId, items[i].id);

    TEST_ASSERT_TRUE(ReindexReconciler::reindexCycle(*g_store, state));
    TEST_ASSERT_EQUAL(0, state.currentItemIndex);
    TEST_ASSERT_EQUAL(0, state.currentDayIndex);
}

int runUnityTests(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_delete_earlier_day_keeps_identity);
    RUN_TEST(test_delete_later_day_changes_nothing);
    RUN_TEST(test_delete_current_day_clamps);
    RUN_TEST(test_delete_last_day_clamps_down);
    RUN_TEST(test_move_current_day_follows_identity);
    RUN_TEST(test_insert_before_current_day);
    RUN_TEST(test_empty_plan_keeps_pointer);
    RUN_TEST(test_resolve_day_index_on_lists);
    RUN_TEST(test_cycle_remove_earlier_item);
    RUN_TEST(test_cycle_remove_current_item);
    RUN_TEST(test_cycle_move_current_item);
    RUN_TEST(test_cycle_day_removed_inside_current_plan);
    RUN_TEST(test_cycle_all_items_removed_resets);

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
