/**
 * @file plan_progress.cpp
 * @brief Implementation of the single-plan day pointer state machine
 */

#include "plan_progress.h"
#include "calendar_normalizer.h"
#include "reindex_reconciler.h"
#include "../core/logging.h"

static const char *const TAG = "plan_progress";

TransitionOutcome PlanProgress::handleAppOpen(IPlanStore &store, PlanProgressState &state, ProgramDay today)
{
    std::vector<PlanDayInfo> days;
    ProgressError error;
    if (!loadDays(store, state, &days, &error))
    {
        LOG_W(TAG, "App open ignored for plan %lu: %s", (unsigned long)state.planId, progressErrorToString(error));
        return TransitionOutcome::invalid(error, NO_DAY_INDEX);
    }

    if (!today.isSet())
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, state.currentDayIndex);

    char todayStr[16];
    CalendarNormalizer::formatIso(today, todayStr, sizeof(todayStr));

    // First run: remember the day, never advance
    if (!state.lastOpenedDate.isSet())
    {
        state.lastOpenedDate = today;
        LOG_I(TAG, "First open of plan %lu on %s at day %d", (unsigned long)state.planId, todayStr,
              state.currentDayIndex);
        return TransitionOutcome::unchangedAt(state.currentDayIndex);
    }

    if (CalendarNormalizer::isSameDay(state.lastOpenedDate, today))
    {
        LOG_V(TAG, "Plan %lu already opened on %s", (unsigned long)state.planId, todayStr);
        return TransitionOutcome::unchangedAt(state.currentDayIndex);
    }

    if (today < state.lastOpenedDate)
    {
        char lastStr[16];
        LOG_W(TAG, "Clock moved back (%s before last open %s), plan %lu unchanged", todayStr,
              CalendarNormalizer::formatIso(state.lastOpenedDate, lastStr, sizeof(lastStr)),
              (unsigned long)state.planId);
        return TransitionOutcome::unchangedAt(state.currentDayIndex);
    }

    const ProgramDay previousOpen = state.lastOpenedDate;
    const PlanDayInfo *previousDay = ReindexReconciler::dayAtPosition(days, state.currentDayIndex);

    bool advance = false;
    bool creditCompletion = false;
    bool staleDeleted = false;

    if (previousDay && previousDay->isRestDay)
    {
        advance = true;
    }
    else
    {
        WorkoutRecordStatus status = store.workoutRecordStatus(state.profileId, state.planId, previousOpen);
        switch (status)
        {
        case RECORD_COMPLETE:
            if (state.lastCompletedDate >= previousOpen)
            {
                LOG_D(TAG, "Completion on day %ld already credited", (long)previousOpen.epochDay);
            }
            else
            {
                advance = true;
                creditCompletion = true;
            }
            break;
        case RECORD_INCOMPLETE:
            staleDeleted = store.deleteWorkoutRecord(state.profileId, state.planId, previousOpen);
            LOG_I(TAG, "Previous workout left incomplete, offering day %d again", state.currentDayIndex);
            break;
        case RECORD_ABSENT:
            break;
        }
    }

    state.lastOpenedDate = today;

    TransitionOutcome outcome;
    if (advance)
    {
        const int from = state.currentDayIndex;
        state.currentDayIndex = nextDayIndex(state.currentDayIndex, (int)days.size());
        if (creditCompletion)
            state.lastCompletedDate = previousOpen;

        LOG_I(TAG, "Plan %lu advanced %d -> %d on %s%s", (unsigned long)state.planId, from,
              state.currentDayIndex, todayStr, previousDay && previousDay->isRestDay ? " (rest day)" : "");
        outcome = TransitionOutcome::advancedTo(state.currentDayIndex);
    }
    else
    {
        LOG_D(TAG, "Plan %lu stays at day %d on %s", (unsigned long)state.planId, state.currentDayIndex, todayStr);
        outcome = TransitionOutcome::unchangedAt(state.currentDayIndex);
    }

    outcome.staleRecordDeleted = staleDeleted;
    return outcome;
}

TransitionOutcome PlanProgress::recordCompletion(const IPlanStore &store, PlanProgressState &state,
                                                 ProgramDay completionDate)
{
    std::vector<PlanDayInfo> days;
    ProgressError error;
    if (!loadDays(store, state, &days, &error))
    {
        LOG_W(TAG, "Completion ignored for plan %lu: %s", (unsigned long)state.planId, progressErrorToString(error));
        return TransitionOutcome::invalid(error, NO_DAY_INDEX);
    }

    if (!completionDate.isSet())
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, state.currentDayIndex);

    char dateStr[16];
    CalendarNormalizer::formatIso(completionDate, dateStr, sizeof(dateStr));

    // Unset lastCompletedDate orders before every real day
    if (completionDate <= state.lastCompletedDate)
    {
        LOG_D(TAG, "Completion for %s not newer than last completion, plan %lu unchanged", dateStr,
              (unsigned long)state.planId);
        return TransitionOutcome::unchangedAt(state.currentDayIndex);
    }

    const int from = state.currentDayIndex;
    state.currentDayIndex = nextDayIndex(state.currentDayIndex, (int)days.size());
    state.lastCompletedDate = completionDate;

    LOG_I(TAG, "Completion for %s advanced plan %lu %d -> %d", dateStr, (unsigned long)state.planId, from,
          state.currentDayIndex);
    return TransitionOutcome::advancedTo(state.currentDayIndex);
}

TransitionOutcome PlanProgress::changeDay(IPlanStore &store, PlanProgressState &state, ProgramDay today,
                                          int newDayIndex, bool skipAndAdvance)
{
    std::vector<PlanDayInfo> days;
    ProgressError error;
    if (!loadDays(store, state, &days, &error))
        return TransitionOutcome::invalid(error, NO_DAY_INDEX);

    if (!today.isSet())
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, state.currentDayIndex);

    int completedSets = store.completedSetCount(state.profileId, state.planId, today);
    if (completedSets > 0)
    {
        LOG_W(TAG, "Cannot change day: %d sets already logged today", completedSets);
        return TransitionOutcome::invalid(PROGRESS_DAY_IN_PROGRESS, state.currentDayIndex);
    }

    const PlanDayInfo *target = ReindexReconciler::dayAtPosition(days, newDayIndex);
    if (!target)
    {
        LOG_W(TAG, "Cannot change to day %d: plan %lu has no such day", newDayIndex, (unsigned long)state.planId);
        return TransitionOutcome::invalid(PROGRESS_DAY_NOT_FOUND, state.currentDayIndex);
    }

    if (!store.materializeDay(state.profileId, state.planId, target->id, today))
        return TransitionOutcome::invalid(PROGRESS_MATERIALIZE_FAILED, state.currentDayIndex);

    if (!skipAndAdvance)
    {
        LOG_I(TAG, "Today replaced with day %d of plan %lu", newDayIndex, (unsigned long)state.planId);
        return TransitionOutcome::unchangedAt(state.currentDayIndex);
    }

    const int from = state.currentDayIndex;
    state.currentDayIndex = nextDayIndex(newDayIndex, (int)days.size());
    state.lastOpenedDate = today;
    if (state.lastCompletedDate < today)
        state.lastCompletedDate = today;

    LOG_I(TAG, "Today replaced with day %d, plan %lu skips ahead %d -> %d", newDayIndex,
          (unsigned long)state.planId, from, state.currentDayIndex);
    return TransitionOutcome::advancedTo(state.currentDayIndex);
}

TransitionOutcome PlanProgress::startAt(const IPlanStore &store, PlanProgressState &state, int dayIndex)
{
    std::vector<PlanDayInfo> days;
    ProgressError error;
    if (!loadDays(store, state, &days, &error))
        return TransitionOutcome::invalid(error, NO_DAY_INDEX);

    if (!ReindexReconciler::dayAtPosition(days, dayIndex))
        return TransitionOutcome::invalid(PROGRESS_DAY_NOT_FOUND, state.currentDayIndex);

    if (dayIndex == state.currentDayIndex)
        return TransitionOutcome::unchangedAt(state.currentDayIndex);

    LOG_I(TAG, "Plan %lu set to start at day %d", (unsigned long)state.planId, dayIndex);
    state.currentDayIndex = dayIndex;
    return TransitionOutcome::advancedTo(state.currentDayIndex);
}

bool PlanProgress::currentDay(const IPlanStore &store, const PlanProgressState &state,
                              PlanDayInfo *day, int *totalDays)
{
    std::vector<PlanDayInfo> days = store.daysOf(state.planId);
    if (totalDays)
        *totalDays = (int)days.size();

    const PlanDayInfo *found = ReindexReconciler::dayAtPosition(days, state.currentDayIndex);
    if (!found)
        return false;

    if (day)
        *day = *found;
    return true;
}

int PlanProgress::nextDayIndex(int currentDayIndex, int totalDays)
{
    if (totalDays <= 0)
        return NO_DAY_INDEX;

    return (currentDayIndex % totalDays + totalDays) % totalDays + 1;
}

bool PlanProgress::loadDays(const IPlanStore &store, const PlanProgressState &state,
                            std::vector<PlanDayInfo> *days, ProgressError *error)
{
    if (!store.planExists(state.planId))
    {
        *error = PROGRESS_PLAN_NOT_FOUND;
        return false;
    }

    *days = store.daysOf(state.planId);
    if (days->empty())
    {
        *error = PROGRESS_EMPTY_PLAN;
        return false;
    }

    *error = PROGRESS_OK;
    return true;
}
