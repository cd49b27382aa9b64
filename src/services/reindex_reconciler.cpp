/**
 * @file reindex_reconciler.cpp
 * @brief Implementation of identity-based pointer reconciliation
 */

#include "reindex_reconciler.h"
#include "../core/logging.h"

static const char *const TAG = "reindex";

const PlanDayInfo *ReindexReconciler::dayAtPosition(const std::vector<PlanDayInfo> &days, int position)
{
    for (size_t i = 0; i < days.size(); i++)
    {
        if (days[i].position == position)
            return &days[i];
    }
    return nullptr;
}

int ReindexReconciler::positionOfDay(const std::vector<PlanDayInfo> &days, EntityId dayId)
{
    if (dayId == INVALID_ENTITY_ID)
        return NO_DAY_INDEX;

    for (size_t i = 0; i < days.size(); i++)
    {
        if (days[i].id == dayId)
            return days[i].position;
    }
    return NO_DAY_INDEX;
}

int ReindexReconciler::slotOfDay(const std::vector<PlanDayInfo> &days, EntityId dayId)
{
    if (dayId == INVALID_ENTITY_ID)
        return -1;

    for (size_t i = 0; i < days.size(); i++)
    {
        if (days[i].id == dayId)
            return (int)i;
    }
    return -1;
}

int ReindexReconciler::slotOfItem(const std::vector<CycleItemInfo> &items, EntityId itemId)
{
    if (itemId == INVALID_ENTITY_ID)
        return -1;

    for (size_t i = 0; i < items.size(); i++)
    {
        if (items[i].id == itemId)
            return (int)i;
    }
    return -1;
}

DayAnchor ReindexReconciler::captureDayAnchor(const std::vector<PlanDayInfo> &days, int currentDayIndex)
{
    DayAnchor anchor;
    const PlanDayInfo *day = dayAtPosition(days, currentDayIndex);
    anchor.dayId = day ? day->id : INVALID_ENTITY_ID;
    anchor.oldIndex = currentDayIndex;
    return anchor;
}

int ReindexReconciler::resolveDayIndex(const std::vector<PlanDayInfo> &days, const DayAnchor &anchor)
{
    if (days.empty())
        return NO_DAY_INDEX;

    int position = positionOfDay(days, anchor.dayId);
    if (position != NO_DAY_INDEX)
        return position;

    return clamp(anchor.oldIndex, 1, (int)days.size());
}

DayAnchor ReindexReconciler::captureCycleDayAnchor(const std::vector<PlanDayInfo> &days, int currentDayIndex)
{
    DayAnchor anchor;
    bool inRange = currentDayIndex >= 0 && currentDayIndex < (int)days.size();
    anchor.dayId = inRange ? days[currentDayIndex].id : INVALID_ENTITY_ID;
    anchor.oldIndex = currentDayIndex;
    return anchor;
}

int ReindexReconciler::resolveCycleDayIndex(const std::vector<PlanDayInfo> &days, const DayAnchor &anchor)
{
    if (days.empty())
        return 0;

    int slot = slotOfDay(days, anchor.dayId);
    if (slot >= 0)
        return slot;

    return clamp(anchor.oldIndex, 0, (int)days.size() - 1);
}

int ReindexReconciler::resolveItemIndex(const std::vector<CycleItemInfo> &items, EntityId itemId, int oldItemIndex)
{
    if (items.empty())
        return 0;

    int slot = slotOfItem(items, itemId);
    if (slot >= 0)
        return slot;

    return clamp(oldItemIndex, 0, (int)items.size() - 1);
}

DayAnchor ReindexReconciler::capturePlanAnchor(const IPlanStore &store, const PlanProgressState &state)
{
    return captureDayAnchor(store.daysOf(state.planId), state.currentDayIndex);
}

bool ReindexReconciler::restorePlanPointer(IPlanStore &store, PlanProgressState &state, const DayAnchor &anchor)
{
    if (!store.reindexDays(state.planId))
    {
        LOG_W(TAG, "Plan %lu not found, pointer left at %d", (unsigned long)state.planId, state.currentDayIndex);
        return false;
    }

    std::vector<PlanDayInfo> days = store.daysOf(state.planId);
    if (days.empty())
    {
        // Keep the stored pointer so it survives until days are added again
        return false;
    }

    int resolved = resolveDayIndex(days, anchor);
    if (resolved == state.currentDayIndex)
        return false;

    if (positionOfDay(days, anchor.dayId) != NO_DAY_INDEX)
    {
        LOG_I(TAG, "Plan %lu: day %lu moved, pointer %d -> %d",
              (unsigned long)state.planId, (unsigned long)anchor.dayId, state.currentDayIndex, resolved);
    }
    else
    {
        LOG_I(TAG, "Plan %lu: current day removed, pointer clamped %d -> %d",
              (unsigned long)state.planId, state.currentDayIndex, resolved);
    }

    state.currentDayIndex = resolved;
    return true;
}

CycleAnchor ReindexReconciler::captureCycleAnchor(const IPlanStore &store, const CycleProgressState &state)
{
    CycleAnchor anchor;
    anchor.itemId = INVALID_ENTITY_ID;
    anchor.planId = INVALID_ENTITY_ID;
    anchor.oldItemIndex = state.currentItemIndex;
    anchor.day.dayId = INVALID_ENTITY_ID;
    anchor.day.oldIndex = state.currentDayIndex;

    std::vector<CycleItemInfo> items = store.itemsOf(state.cycleId);
    if (state.currentItemIndex < 0 || state.currentItemIndex >= (int)items.size())
        return anchor;

    const CycleItemInfo &item = items[state.currentItemIndex];
    anchor.itemId = item.id;
    anchor.planId = item.planId;
    anchor.day = captureCycleDayAnchor(store.daysOf(item.planId), state.currentDayIndex);
    return anchor;
}

bool ReindexReconciler::restoreCyclePointer(IPlanStore &store, CycleProgressState &state, const CycleAnchor &anchor)
{
    if (!store.reindexItems(state.cycleId))
    {
        LOG_W(TAG, "Cycle %lu not found, pointer left at (%d, %d)",
              (unsigned long)state.cycleId, state.currentItemIndex, state.currentDayIndex);
        return false;
    }

    const int oldItem = state.currentItemIndex;
    const int oldDay = state.currentDayIndex;

    std::vector<CycleItemInfo> items = store.itemsOf(state.cycleId);
    if (items.empty())
    {
        state.currentItemIndex = 0;
        state.currentDayIndex = 0;
    }
    else
    {
        int itemSlot = slotOfItem(items, anchor.itemId);
        state.currentItemIndex = resolveItemIndex(items, anchor.itemId, anchor.oldItemIndex);

        const CycleItemInfo &item = items[state.currentItemIndex];
        store.reindexDays(item.planId);
        std::vector<PlanDayInfo> days = store.daysOf(item.planId);

        if (itemSlot >= 0 && item.planId == anchor.planId)
        {
            state.currentDayIndex = resolveCycleDayIndex(days, anchor.day);
        }
        else
        {
            // Landed on a different item: its plan starts from the first day
            state.currentDayIndex = 0;
        }
    }

    bool changed = state.currentItemIndex != oldItem || state.currentDayIndex != oldDay;
    if (changed)
    {
        LOG_I(TAG, "Cycle %lu: pointer (%d, %d) -> (%d, %d)", (unsigned long)state.cycleId,
              oldItem, oldDay, state.currentItemIndex, state.currentDayIndex);
    }
    return changed;
}

bool ReindexReconciler::reindexPlan(IPlanStore &store, PlanProgressState &state)
{
    DayAnchor anchor = capturePlanAnchor(store, state);
    return restorePlanPointer(store, state, anchor);
}

bool ReindexReconciler::reindexCycle(IPlanStore &store, CycleProgressState &state)
{
    CycleAnchor anchor = captureCycleAnchor(store, state);
    return restoreCyclePointer(store, state, anchor);
}

int ReindexReconciler::clamp(int value, int low, int high)
{
    if (value < low)
        return low;
    if (value > high)
        return high;
    return value;
}
