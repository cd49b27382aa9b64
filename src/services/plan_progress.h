/**
 * @file plan_progress.h
 * @brief Day pointer state machine for a profile following a single plan
 *
 * Decides which day of a plan is "today". The pointer moves at most once per
 * elapsed program day, and only when the previous day was a rest day or its
 * workout record is complete. Retroactive completions go through
 * recordCompletion(), which is monotonic and idempotent per date.
 *
 * All functions mutate only the PlanProgressState passed in. Callers hold
 * the per-key lease from ProgressRegistry while calling them.
 */

#ifndef PLAN_PROGRESS_H
#define PLAN_PROGRESS_H

#include <vector>
#include "../core/progress_types.h"
#include "../adapters/plan_store.h"

/**
 * @class PlanProgress
 * @brief Single-plan advancement, rescue and manual day change
 */
class PlanProgress
{
public:
    /**
     * @brief App-open transition for "today"
     *
     * - First run: records today, never advances
     * - Same program day as the last open: no-op
     * - New program day: advances if the previous day was a rest day or its
     *   record is complete and not already credited by recordCompletion().
     *   An incomplete record is deleted so the same day is offered again.
     *
     * @param store Plan store (records may be deleted)
     * @param state Progress to update
     * @param today Program day of the open
     * @return Outcome with the current 1-indexed day, or INVALID with
     *         NO_DAY_INDEX when the plan is missing or empty
     */
    static TransitionOutcome handleAppOpen(IPlanStore &store, PlanProgressState &state, ProgramDay today);

    /**
     * @brief Rescue path for a completion logged on another day
     *
     * Advances exactly one step when completionDate is strictly newer than
     * lastCompletedDate, otherwise no-op. Never regresses.
     */
    static TransitionOutcome recordCompletion(const IPlanStore &store, PlanProgressState &state,
                                              ProgramDay completionDate);

    /**
     * @brief Replace today's workout with another day of the plan
     *
     * Rejected without mutation when today's record already has completed
     * sets. With skipAndAdvance the pointer moves past the selected day and
     * today is credited so the next open does not advance a second time.
     *
     * @param newDayIndex 1-indexed position of the day to do today
     */
    static TransitionOutcome changeDay(IPlanStore &store, PlanProgressState &state, ProgramDay today,
                                       int newDayIndex, bool skipAndAdvance);

    /**
     * @brief Point the plan at a given day ("start at day N")
     */
    static TransitionOutcome startAt(const IPlanStore &store, PlanProgressState &state, int dayIndex);

    /**
     * @brief Resolve the day the pointer refers to
     *
     * @param day Output: current day (unchanged when false is returned)
     * @param totalDays Output (optional): number of days in the plan
     * @return false when the plan is missing/empty or the pointer falls in a gap
     */
    static bool currentDay(const IPlanStore &store, const PlanProgressState &state,
                           PlanDayInfo *day, int *totalDays = nullptr);

    /**
     * @brief One advancement step with 1-indexed wraparound
     *
     * (current mod total + total) mod total + 1, which also folds an index
     * left beyond a shrunk plan back into range. Returns NO_DAY_INDEX when
     * totalDays <= 0.
     */
    static int nextDayIndex(int currentDayIndex, int totalDays);

private:
    static bool loadDays(const IPlanStore &store, const PlanProgressState &state,
                         std::vector<PlanDayInfo> *days, ProgressError *error);

    // Private constructor - static-only class
    PlanProgress() = delete;
};

#endif // PLAN_PROGRESS_H
