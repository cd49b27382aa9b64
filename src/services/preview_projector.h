/**
 * @file preview_projector.h
 * @brief Forecast which day will be active on another program day
 *
 * Pure projections from the current pointer. Nothing here mutates progress
 * state or the plan store, so previews can be computed any number of times
 * without a lock beyond the one used to copy the state.
 */

#ifndef PREVIEW_PROJECTOR_H
#define PREVIEW_PROJECTOR_H

#include <stdint.h>
#include "../core/progress_types.h"
#include "../adapters/plan_store.h"

/**
 * @struct DayPreview
 * @brief Day expected on a target program day
 */
struct DayPreview
{
    bool available;
    EntityId planId;
    EntityId dayId;
    int dayIndex; ///< 1-indexed for display, in both single-plan and cycle mode
    int totalDays;
    bool isRestDay;
    int exerciseCount;
};

/**
 * @class PreviewProjector
 * @brief Day-index arithmetic for previews
 */
class PreviewProjector
{
public:
    /**
     * @brief Project a 1-indexed pointer by a signed number of days
     *
     * ((current - 1 + diff) mod total + total) mod total + 1
     *
     * @return NO_DAY_INDEX when totalDays <= 0
     */
    static int previewDayIndex(int currentDayIndex, int totalDays, int32_t daysDifference);

    /**
     * @brief Project a 0-indexed cycle day pointer by a signed number of days
     * @return -1 when totalDays <= 0
     */
    static int previewCycleDayIndex(int currentDayIndex, int totalDays, int32_t daysDifference);

    /**
     * @brief Day of the plan expected on target, seen from today
     *
     * Projects over the day list in order, so a gap left by a removal is
     * skipped. dayIndex of the result is the projected day's position.
     */
    static DayPreview previewPlanDay(const IPlanStore &store, const PlanProgressState &state,
                                     ProgramDay today, ProgramDay target);

    /**
     * @brief Day of the current cycle plan expected on target
     *
     * The projection stays within the current item's plan; it does not
     * model rotation to the next item.
     */
    static DayPreview previewCycleDay(const IPlanStore &store, const CycleProgressState &state,
                                      ProgramDay today, ProgramDay target);

private:
    static DayPreview unavailable();

    // Private constructor - static-only class
    PreviewProjector() = delete;
};

#endif // PREVIEW_PROJECTOR_H
