/**
 * @file cycle_progress.h
 * @brief Two-level pointer state machine for a profile rotating through plans
 *
 * A cycle is an ordered list of items, each referencing a plan. The pointer
 * is (currentItemIndex, currentDayIndex), both 0-indexed. Advancing walks the
 * days of the current plan, then moves to the next item whose plan exists and
 * has days. The skip scan is bounded by the number of items, so a cycle made
 * only of empty or deleted plans reports PROGRESS_NO_VALID_PLAN instead of
 * looping.
 *
 * Transitions are atomic: an INVALID outcome leaves the state exactly as it
 * was before the call.
 */

#ifndef CYCLE_PROGRESS_H
#define CYCLE_PROGRESS_H

#include <time.h>
#include <vector>
#include "../core/progress_types.h"
#include "../adapters/plan_store.h"

/**
 * @class CycleProgress
 * @brief Multi-plan rotation, open-time advancement and manual day change
 */
class CycleProgress
{
public:
    /**
     * @brief Move the pointer one day forward, rotating to the next usable plan
     *
     * @param now Timestamp stored in lastAdvancedAt on success
     */
    static TransitionOutcome advance(const IPlanStore &store, CycleProgressState &state, time_t now);

    /**
     * @brief App-open transition for "today"
     *
     * Same rules as single-plan mode: first run and same-day opens never
     * advance; a rest day or a complete, not yet credited record for the last
     * open advances once; an incomplete record is deleted and re-offered.
     * A pointer left on a missing or empty plan is repaired by advance().
     */
    static TransitionOutcome handleAppOpen(IPlanStore &store, CycleProgressState &state, ProgramDay today,
                                           time_t now);

    /**
     * @brief Rescue path: advance once for a completion newer than lastCompletedDate
     */
    static TransitionOutcome recordCompletion(const IPlanStore &store, CycleProgressState &state,
                                              ProgramDay completionDate, time_t now);

    /**
     * @brief Replace today's workout with another day of the current plan
     *
     * @param newDayIndex 0-indexed day within the current item's plan
     * @param skipAndAdvance Continue after the selected day on the next open
     */
    static TransitionOutcome changeDay(IPlanStore &store, CycleProgressState &state, ProgramDay today,
                                       int newDayIndex, bool skipAndAdvance, time_t now);

    /**
     * @brief Back to the first day of the first item, history cleared
     */
    static void reset(CycleProgressState &state);

    /**
     * @brief Resolve the current (item, day)
     *
     * @param item Output (optional): current cycle item
     * @param day Output (optional): current day of the item's plan
     * @param totalDays Output (optional): day count of the item's plan
     * @return false when either pointer is out of range or the plan is missing
     */
    static bool currentDay(const IPlanStore &store, const CycleProgressState &state,
                           CycleItemInfo *item, PlanDayInfo *day, int *totalDays = nullptr);

private:
    static int usableDayCount(const IPlanStore &store, EntityId planId);
    static bool moveToNextItem(const IPlanStore &store, CycleProgressState &state,
                               const std::vector<CycleItemInfo> &items);
    static bool skipEmptyPlans(const IPlanStore &store, CycleProgressState &state,
                               const std::vector<CycleItemInfo> &items);
    static bool loadItems(const IPlanStore &store, const CycleProgressState &state,
                          std::vector<CycleItemInfo> *items, ProgressError *error);

    // Private constructor - static-only class
    CycleProgress() = delete;
};

#endif // CYCLE_PROGRESS_H
