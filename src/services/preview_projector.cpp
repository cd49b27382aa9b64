/**
 * @file preview_projector.cpp
 * @brief Implementation of day previews
 */

#include "preview_projector.h"
#include "calendar_normalizer.h"
#include "reindex_reconciler.h"
#include <vector>

int PreviewProjector::previewDayIndex(int currentDayIndex, int totalDays, int32_t daysDifference)
{
    if (totalDays <= 0)
        return NO_DAY_INDEX;

    int64_t shifted = (int64_t)currentDayIndex - 1 + daysDifference;
    return (int)((shifted % totalDays + totalDays) % totalDays) + 1;
}

int PreviewProjector::previewCycleDayIndex(int currentDayIndex, int totalDays, int32_t daysDifference)
{
    if (totalDays <= 0)
        return -1;

    int64_t shifted = (int64_t)currentDayIndex + daysDifference;
    return (int)((shifted % totalDays + totalDays) % totalDays);
}

DayPreview PreviewProjector::previewPlanDay(const IPlanStore &store, const PlanProgressState &state,
                                            ProgramDay today, ProgramDay target)
{
    std::vector<PlanDayInfo> days = store.daysOf(state.planId);
    const int totalDays = (int)days.size();
    if (totalDays == 0 || !today.isSet() || !target.isSet())
        return unavailable();

    // The pointer is a position and positions may have gaps after a removal,
    // so project from the slot of the day it names
    int currentSlot = state.currentDayIndex - 1;
    const PlanDayInfo *current = ReindexReconciler::dayAtPosition(days, state.currentDayIndex);
    if (current)
        currentSlot = ReindexReconciler::slotOfDay(days, current->id);
    else if (currentSlot >= totalDays)
        currentSlot = totalDays - 1;
    else if (currentSlot < 0)
        currentSlot = 0;

    int index = previewDayIndex(currentSlot + 1, totalDays, CalendarNormalizer::daysBetween(today, target));
    const PlanDayInfo &day = days[index - 1];

    DayPreview preview;
    preview.available = true;
    preview.planId = state.planId;
    preview.dayId = day.id;
    preview.dayIndex = day.position;
    preview.totalDays = totalDays;
    preview.isRestDay = day.isRestDay;
    preview.exerciseCount = day.exerciseCount;
    return preview;
}

DayPreview PreviewProjector::previewCycleDay(const IPlanStore &store, const CycleProgressState &state,
                                             ProgramDay today, ProgramDay target)
{
    if (!today.isSet() || !target.isSet())
        return unavailable();

    std::vector<CycleItemInfo> items = store.itemsOf(state.cycleId);
    if (state.currentItemIndex < 0 || state.currentItemIndex >= (int)items.size())
        return unavailable();

    const EntityId planId = items[state.currentItemIndex].planId;
    std::vector<PlanDayInfo> days = store.daysOf(planId);
    const int totalDays = (int)days.size();
    if (totalDays == 0)
        return unavailable();

    int slot = previewCycleDayIndex(state.currentDayIndex, totalDays, CalendarNormalizer::daysBetween(today, target));
    const PlanDayInfo &day = days[slot];

    DayPreview preview;
    preview.available = true;
    preview.planId = planId;
    preview.dayId = day.id;
    preview.dayIndex = slot + 1;
    preview.totalDays = totalDays;
    preview.isRestDay = day.isRestDay;
    preview.exerciseCount = day.exerciseCount;
    return preview;
}

DayPreview PreviewProjector::unavailable()
{
    DayPreview preview = {false, INVALID_ENTITY_ID, INVALID_ENTITY_ID, NO_DAY_INDEX, 0, false, 0};
    return preview;
}
