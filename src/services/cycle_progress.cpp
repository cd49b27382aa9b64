/**
 * @file cycle_progress.cpp
 * @brief Implementation of multi-plan cycle rotation
 */

#include "cycle_progress.h"
#include "calendar_normalizer.h"
#include "../core/logging.h"

static const char *const TAG = "cycle_progress";

TransitionOutcome CycleProgress::advance(const IPlanStore &store, CycleProgressState &state, time_t now)
{
    std::vector<CycleItemInfo> items;
    ProgressError error;
    if (!loadItems(store, state, &items, &error))
    {
        LOG_W(TAG, "Cannot advance cycle %lu: %s", (unsigned long)state.cycleId, progressErrorToString(error));
        return TransitionOutcome::invalid(error, state.currentDayIndex, state.currentItemIndex);
    }

    const CycleProgressState snapshot = state;
    const int itemCount = (int)items.size();
    bool landed;

    if (state.currentItemIndex < 0 || state.currentItemIndex >= itemCount)
    {
        // Items were removed without reconciliation: restart from the top
        LOG_W(TAG, "Cycle %lu item index %d out of range (%d items), restarting", (unsigned long)state.cycleId,
              state.currentItemIndex, itemCount);
        state.currentItemIndex = 0;
        state.currentDayIndex = 0;
        landed = skipEmptyPlans(store, state, items);
    }
    else
    {
        const int totalDays = usableDayCount(store, items[state.currentItemIndex].planId);
        if (totalDays == 0)
        {
            landed = moveToNextItem(store, state, items);
        }
        else if (state.currentDayIndex + 1 < totalDays)
        {
            state.currentDayIndex++;
            landed = true;
        }
        else
        {
            landed = moveToNextItem(store, state, items);
        }
    }

    if (!landed)
    {
        state = snapshot;
        LOG_W(TAG, "Cycle %lu: %s", (unsigned long)state.cycleId, progressErrorToString(PROGRESS_NO_VALID_PLAN));
        return TransitionOutcome::invalid(PROGRESS_NO_VALID_PLAN, state.currentDayIndex, state.currentItemIndex);
    }

    state.lastAdvancedAt = now;
    LOG_I(TAG, "Cycle %lu advanced (%d, %d) -> (%d, %d)", (unsigned long)state.cycleId, snapshot.currentItemIndex,
          snapshot.currentDayIndex, state.currentItemIndex, state.currentDayIndex);
    return TransitionOutcome::advancedTo(state.currentDayIndex, state.currentItemIndex);
}

TransitionOutcome CycleProgress::handleAppOpen(IPlanStore &store, CycleProgressState &state, ProgramDay today,
                                               time_t now)
{
    std::vector<CycleItemInfo> items;
    ProgressError error;
    if (!loadItems(store, state, &items, &error))
    {
        LOG_W(TAG, "App open ignored for cycle %lu: %s", (unsigned long)state.cycleId, progressErrorToString(error));
        return TransitionOutcome::invalid(error, state.currentDayIndex, state.currentItemIndex);
    }

    if (!today.isSet())
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, state.currentDayIndex, state.currentItemIndex);

    const bool itemInRange = state.currentItemIndex >= 0 && state.currentItemIndex < (int)items.size();
    std::vector<PlanDayInfo> days;
    if (itemInRange && store.planExists(items[state.currentItemIndex].planId))
        days = store.daysOf(items[state.currentItemIndex].planId);

    if (days.empty())
    {
        // Pointer sits on a deleted or emptied plan: move to the next usable one
        TransitionOutcome repaired = advance(store, state, now);
        if (repaired.rejected())
            return repaired;

        state.lastOpenedDate = today;
        return repaired;
    }

    if (!state.lastOpenedDate.isSet())
    {
        state.lastOpenedDate = today;
        LOG_I(TAG, "First open of cycle %lu at (%d, %d)", (unsigned long)state.cycleId, state.currentItemIndex,
              state.currentDayIndex);
        return TransitionOutcome::unchangedAt(state.currentDayIndex, state.currentItemIndex);
    }

    if (CalendarNormalizer::isSameDay(state.lastOpenedDate, today) || today < state.lastOpenedDate)
        return TransitionOutcome::unchangedAt(state.currentDayIndex, state.currentItemIndex);

    const EntityId planId = items[state.currentItemIndex].planId;
    const ProgramDay previousOpen = state.lastOpenedDate;
    const bool dayInRange = state.currentDayIndex >= 0 && state.currentDayIndex < (int)days.size();
    const bool restDay = dayInRange && days[state.currentDayIndex].isRestDay;

    bool shouldAdvance = false;
    bool creditCompletion = false;
    bool staleDeleted = false;

    if (restDay)
    {
        shouldAdvance = true;
    }
    else
    {
        switch (store.workoutRecordStatus(state.profileId, planId, previousOpen))
        {
        case RECORD_COMPLETE:
            shouldAdvance = state.lastCompletedDate < previousOpen;
            creditCompletion = shouldAdvance;
            break;
        case RECORD_INCOMPLETE:
            staleDeleted = store.deleteWorkoutRecord(state.profileId, planId, previousOpen);
            LOG_I(TAG, "Previous workout left incomplete, offering (%d, %d) again", state.currentItemIndex,
                  state.currentDayIndex);
            break;
        case RECORD_ABSENT:
            break;
        }
    }

    TransitionOutcome outcome = TransitionOutcome::unchangedAt(state.currentDayIndex, state.currentItemIndex);
    if (shouldAdvance)
    {
        outcome = advance(store, state, now);
        if (outcome.moved() && creditCompletion)
            state.lastCompletedDate = previousOpen;
    }

    // An invalid advance restored the snapshot, so the open is still recorded
    state.lastOpenedDate = today;
    outcome.staleRecordDeleted = staleDeleted;
    return outcome;
}

TransitionOutcome CycleProgress::recordCompletion(const IPlanStore &store, CycleProgressState &state,
                                                  ProgramDay completionDate, time_t now)
{
    if (!completionDate.isSet())
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, state.currentDayIndex, state.currentItemIndex);

    if (completionDate <= state.lastCompletedDate)
    {
        LOG_D(TAG, "Completion for day %ld not newer than last completion, cycle %lu unchanged",
              (long)completionDate.epochDay, (unsigned long)state.cycleId);
        return TransitionOutcome::unchangedAt(state.currentDayIndex, state.currentItemIndex);
    }

    TransitionOutcome outcome = advance(store, state, now);
    if (outcome.moved())
        state.lastCompletedDate = completionDate;

    return outcome;
}

TransitionOutcome CycleProgress::changeDay(IPlanStore &store, CycleProgressState &state, ProgramDay today,
                                           int newDayIndex, bool skipAndAdvance, time_t now)
{
    std::vector<CycleItemInfo> items;
    ProgressError error;
    if (!loadItems(store, state, &items, &error))
        return TransitionOutcome::invalid(error, state.currentDayIndex, state.currentItemIndex);

    if (!today.isSet())
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, state.currentDayIndex, state.currentItemIndex);

    if (state.currentItemIndex < 0 || state.currentItemIndex >= (int)items.size())
        return TransitionOutcome::invalid(PROGRESS_NO_VALID_PLAN, state.currentDayIndex, state.currentItemIndex);

    const EntityId planId = items[state.currentItemIndex].planId;
    if (!store.planExists(planId))
        return TransitionOutcome::invalid(PROGRESS_PLAN_NOT_FOUND, state.currentDayIndex, state.currentItemIndex);

    std::vector<PlanDayInfo> days = store.daysOf(planId);
    if (days.empty())
        return TransitionOutcome::invalid(PROGRESS_EMPTY_PLAN, state.currentDayIndex, state.currentItemIndex);

    int completedSets = store.completedSetCount(state.profileId, planId, today);
    if (completedSets > 0)
    {
        LOG_W(TAG, "Cannot change day: %d sets already logged today", completedSets);
        return TransitionOutcome::invalid(PROGRESS_DAY_IN_PROGRESS, state.currentDayIndex, state.currentItemIndex);
    }

    if (newDayIndex < 0 || newDayIndex >= (int)days.size())
    {
        LOG_W(TAG, "Cannot change to day %d: plan %lu has %u days", newDayIndex, (unsigned long)planId,
              (unsigned)days.size());
        return TransitionOutcome::invalid(PROGRESS_DAY_NOT_FOUND, state.currentDayIndex, state.currentItemIndex);
    }

    if (!store.materializeDay(state.profileId, planId, days[newDayIndex].id, today))
        return TransitionOutcome::invalid(PROGRESS_MATERIALIZE_FAILED, state.currentDayIndex, state.currentItemIndex);

    if (!skipAndAdvance)
    {
        LOG_I(TAG, "Today replaced with day %d of plan %lu", newDayIndex, (unsigned long)planId);
        return TransitionOutcome::unchangedAt(state.currentDayIndex, state.currentItemIndex);
    }

    // Wraps within the current plan; rotation to the next item happens on advance
    state.currentDayIndex = (newDayIndex + 1) % (int)days.size();
    state.lastAdvancedAt = now;
    state.lastOpenedDate = today;
    if (state.lastCompletedDate < today)
        state.lastCompletedDate = today;

    LOG_I(TAG, "Today replaced with day %d, cycle %lu continues at (%d, %d)", newDayIndex,
          (unsigned long)state.cycleId, state.currentItemIndex, state.currentDayIndex);
    return TransitionOutcome::advancedTo(state.currentDayIndex, state.currentItemIndex);
}

void CycleProgress::reset(CycleProgressState &state)
{
    state.currentItemIndex = 0;
    state.currentDayIndex = 0;
    state.lastAdvancedAt = 0;
    state.lastOpenedDate = ProgramDay();
    state.lastCompletedDate = ProgramDay();
    LOG_I(TAG, "Cycle %lu progress reset", (unsigned long)state.cycleId);
}

bool CycleProgress::currentDay(const IPlanStore &store, const CycleProgressState &state,
                               CycleItemInfo *item, PlanDayInfo *day, int *totalDays)
{
    std::vector<CycleItemInfo> items = store.itemsOf(state.cycleId);
    if (state.currentItemIndex < 0 || state.currentItemIndex >= (int)items.size())
        return false;

    const CycleItemInfo &current = items[state.currentItemIndex];
    if (!store.planExists(current.planId))
        return false;

    std::vector<PlanDayInfo> days = store.daysOf(current.planId);
    if (totalDays)
        *totalDays = (int)days.size();
    if (state.currentDayIndex < 0 || state.currentDayIndex >= (int)days.size())
        return false;

    if (item)
        *item = current;
    if (day)
        *day = days[state.currentDayIndex];
    return true;
}

int CycleProgress::usableDayCount(const IPlanStore &store, EntityId planId)
{
    if (!store.planExists(planId))
        return 0;

    return (int)store.daysOf(planId).size();
}

bool CycleProgress::moveToNextItem(const IPlanStore &store, CycleProgressState &state,
                                   const std::vector<CycleItemInfo> &items)
{
    state.currentItemIndex = (state.currentItemIndex + 1) % (int)items.size();
    state.currentDayIndex = 0;
    return skipEmptyPlans(store, state, items);
}

// Bounded by the item count: returns false after one full lap without a usable plan
bool CycleProgress::skipEmptyPlans(const IPlanStore &store, CycleProgressState &state,
                                   const std::vector<CycleItemInfo> &items)
{
    const int itemCount = (int)items.size();
    const int startIndex = state.currentItemIndex;

    for (int checked = 0; checked < itemCount; checked++)
    {
        if (usableDayCount(store, items[state.currentItemIndex].planId) > 0)
            return true;

        LOG_D(TAG, "Skipping item %d: plan %lu missing or empty", state.currentItemIndex,
              (unsigned long)items[state.currentItemIndex].planId);
        state.currentItemIndex = (state.currentItemIndex + 1) % itemCount;
        state.currentDayIndex = 0;

        if (state.currentItemIndex == startIndex)
            break;
    }
    return false;
}

bool CycleProgress::loadItems(const IPlanStore &store, const CycleProgressState &state,
                              std::vector<CycleItemInfo> *items, ProgressError *error)
{
    if (!store.cycleExists(state.cycleId))
    {
        *error = PROGRESS_CYCLE_NOT_FOUND;
        return false;
    }

    *items = store.itemsOf(state.cycleId);
    if (items->empty())
    {
        *error = PROGRESS_CYCLE_EMPTY;
        return false;
    }

    *error = PROGRESS_OK;
    return true;
}
