/**
 * @file progress_engine.cpp
 * @brief Implementation of the ProgressEngine orchestrator
 */

#include "progress_engine.h"
#include "calendar_normalizer.h"
#include "cycle_progress.h"
#include "plan_progress.h"
#include "reindex_reconciler.h"
#include "../core/logging.h"
#include <utility>
#include <vector>

static const char *const TAG = "progress_engine";

ProgressEngine::ProgressEngine(IConfigProvider *config, ITimeProvider *timeProvider, IPlanStore *store,
                               ProgressRegistry *registry)
    : m_config(config), m_timeProvider(timeProvider), m_store(store), m_registry(registry)
{
}

void ProgressEngine::begin()
{
    EntityId profileId = m_config->getProfileId();
    m_registry->setExecutionMode(profileId, m_config->getExecutionMode());

    LOG_I(TAG, "Profile %lu in %s mode, day boundary %02d:00 (offset=%d min)", (unsigned long)profileId,
          executionModeToString(m_config->getExecutionMode()), m_config->getDayBoundaryHour(),
          m_config->getTimezoneOffsetMinutes());
}

ProgramDay ProgressEngine::today() const
{
    if (!m_timeProvider->isTimeValid())
        return ProgramDay();

    return CalendarNormalizer::programDayAt(*m_timeProvider, m_config->getTimezoneOffsetMinutes(),
                                            m_config->getDayBoundaryHour());
}

// ============================================================================
// Transitions
// ============================================================================

TransitionOutcome ProgressEngine::onAppOpen(EntityId profileId)
{
    ProgramDay day = today();
    if (!day.isSet())
    {
        LOG_W(TAG, "App open deferred: %s", progressErrorToString(PROGRESS_TIME_NOT_SYNCED));
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, NO_DAY_INDEX);
    }
    return onAppOpenAt(profileId, day);
}

TransitionOutcome ProgressEngine::onAppOpenAt(EntityId profileId, ProgramDay day)
{
    ProfileSettings settings = m_registry->profileSettings(profileId);
    TransitionOutcome outcome;

    if (settings.mode == MODE_CYCLE)
    {
        if (settings.activeCycleId == INVALID_ENTITY_ID)
            outcome = TransitionOutcome::invalid(PROGRESS_NOT_CONFIGURED, 0, 0);
        else
            outcome = openCycle(profileId, settings.activeCycleId, day);
    }
    else
    {
        if (settings.activePlanId == INVALID_ENTITY_ID)
            outcome = TransitionOutcome::invalid(PROGRESS_NOT_CONFIGURED, NO_DAY_INDEX);
        else
            outcome = openPlan(profileId, settings.activePlanId, day);
    }

    logOutcome("open", profileId, outcome);
    return outcome;
}

TransitionOutcome ProgressEngine::recordCompletion(EntityId profileId, ProgramDay completionDate)
{
    ProfileSettings settings = m_registry->profileSettings(profileId);
    TransitionOutcome outcome;

    if (settings.mode == MODE_CYCLE && settings.activeCycleId != INVALID_ENTITY_ID)
    {
        CycleProgressLease lease = m_registry->acquireCycle(profileId, settings.activeCycleId);
        outcome = CycleProgress::recordCompletion(*m_store, *lease, completionDate, now());
    }
    else if (settings.mode == MODE_SINGLE_PLAN && settings.activePlanId != INVALID_ENTITY_ID)
    {
        PlanProgressLease lease = m_registry->acquirePlan(profileId, settings.activePlanId);
        outcome = PlanProgress::recordCompletion(*m_store, *lease, completionDate);
    }
    else
    {
        outcome = TransitionOutcome::invalid(PROGRESS_NOT_CONFIGURED, NO_DAY_INDEX);
    }

    logOutcome("completion", profileId, outcome);
    return outcome;
}

TransitionOutcome ProgressEngine::changeDay(EntityId profileId, int newDayIndex, bool skipAndAdvance)
{
    ProgramDay day = today();
    if (!day.isSet())
        return TransitionOutcome::invalid(PROGRESS_TIME_NOT_SYNCED, NO_DAY_INDEX);

    ProfileSettings settings = m_registry->profileSettings(profileId);
    TransitionOutcome outcome;

    if (settings.mode == MODE_CYCLE && settings.activeCycleId != INVALID_ENTITY_ID)
    {
        CycleProgressLease lease = m_registry->acquireCycle(profileId, settings.activeCycleId);
        outcome = CycleProgress::changeDay(*m_store, *lease, day, newDayIndex, skipAndAdvance, now());
    }
    else if (settings.mode == MODE_SINGLE_PLAN && settings.activePlanId != INVALID_ENTITY_ID)
    {
        PlanProgressLease lease = m_registry->acquirePlan(profileId, settings.activePlanId);
        outcome = PlanProgress::changeDay(*m_store, *lease, day, newDayIndex, skipAndAdvance);
    }
    else
    {
        outcome = TransitionOutcome::invalid(PROGRESS_NOT_CONFIGURED, NO_DAY_INDEX);
    }

    logOutcome("change day", profileId, outcome);
    return outcome;
}

TransitionOutcome ProgressEngine::advanceCycle(EntityId profileId)
{
    ProfileSettings settings = m_registry->profileSettings(profileId);
    if (settings.activeCycleId == INVALID_ENTITY_ID)
        return TransitionOutcome::invalid(PROGRESS_NOT_CONFIGURED, 0, 0);

    CycleProgressLease lease = m_registry->acquireCycle(profileId, settings.activeCycleId);
    TransitionOutcome outcome = CycleProgress::advance(*m_store, *lease, now());
    logOutcome("advance", profileId, outcome);
    return outcome;
}

TransitionOutcome ProgressEngine::startPlanAt(EntityId profileId, EntityId planId, int dayIndex)
{
    TransitionOutcome outcome;
    {
        PlanProgressLease lease = m_registry->acquirePlan(profileId, planId);
        outcome = PlanProgress::startAt(*m_store, *lease, dayIndex);
    }

    if (!outcome.rejected())
        m_registry->setActivePlan(profileId, planId);

    logOutcome("start", profileId, outcome);
    return outcome;
}

bool ProgressEngine::resetCycle(EntityId profileId)
{
    ProfileSettings settings = m_registry->profileSettings(profileId);
    if (settings.activeCycleId == INVALID_ENTITY_ID)
        return false;

    CycleProgressLease lease = m_registry->acquireCycle(profileId, settings.activeCycleId);
    CycleProgress::reset(*lease);
    return true;
}

bool ProgressEngine::reconcile(EntityId profileId)
{
    ProfileSettings settings = m_registry->profileSettings(profileId);

    if (settings.mode == MODE_CYCLE && settings.activeCycleId != INVALID_ENTITY_ID)
    {
        CycleProgressLease lease = m_registry->acquireCycle(profileId, settings.activeCycleId);
        return ReindexReconciler::reindexCycle(*m_store, *lease);
    }
    if (settings.mode == MODE_SINGLE_PLAN && settings.activePlanId != INVALID_ENTITY_ID)
    {
        PlanProgressLease lease = m_registry->acquirePlan(profileId, settings.activePlanId);
        return ReindexReconciler::reindexPlan(*m_store, *lease);
    }
    return false;
}

// ============================================================================
// Queries
// ============================================================================

DayPreview ProgressEngine::preview(EntityId profileId, ProgramDay target)
{
    ProgramDay day = today();
    ProfileSettings settings = m_registry->profileSettings(profileId);

    if (settings.mode == MODE_CYCLE && settings.activeCycleId != INVALID_ENTITY_ID)
    {
        CycleProgressState state;
        {
            CycleProgressLease lease = m_registry->acquireCycle(profileId, settings.activeCycleId);
            ReindexReconciler::reindexCycle(*m_store, *lease);
            state = *lease;
        }
        return PreviewProjector::previewCycleDay(*m_store, state, day, target);
    }

    PlanProgressState state;
    if (settings.activePlanId != INVALID_ENTITY_ID)
    {
        PlanProgressLease lease = m_registry->acquirePlan(profileId, settings.activePlanId);
        ReindexReconciler::reindexPlan(*m_store, *lease);
        state = *lease;
    }
    return PreviewProjector::previewPlanDay(*m_store, state, day, target);
}

bool ProgressEngine::todayWorkout(EntityId profileId, TodayWorkout *workout)
{
    if (!workout)
        return false;

    ProfileSettings settings = m_registry->profileSettings(profileId);

    if (settings.mode == MODE_CYCLE)
    {
        if (settings.activeCycleId == INVALID_ENTITY_ID)
            return false;

        CycleProgressLease lease = m_registry->acquireCycle(profileId, settings.activeCycleId);
        ReindexReconciler::reindexCycle(*m_store, *lease);
        CycleItemInfo item;
        if (!CycleProgress::currentDay(*m_store, *lease, &item, &workout->day, &workout->totalDays))
            return false;

        workout->planId = item.planId;
        workout->dayIndex = lease->currentDayIndex + 1;
        workout->itemIndex = lease->currentItemIndex;
        return true;
    }

    if (settings.activePlanId == INVALID_ENTITY_ID)
        return false;

    PlanProgressLease lease = m_registry->acquirePlan(profileId, settings.activePlanId);
    ReindexReconciler::reindexPlan(*m_store, *lease);
    if (!PlanProgress::currentDay(*m_store, *lease, &workout->day, &workout->totalDays))
        return false;

    workout->planId = settings.activePlanId;
    workout->dayIndex = workout->day.position;
    workout->itemIndex = -1;
    return true;
}

// ============================================================================
// Editing
// ============================================================================

struct ProgressEngine::AnchoredPointers
{
    std::vector<PlanProgressLease> plans;
    std::vector<DayAnchor> planAnchors;
    std::vector<CycleProgressLease> cycles;
    std::vector<CycleAnchor> cycleAnchors;
};

EntityId ProgressEngine::insertDay(EntityId planId, int position, int exerciseCount, bool isRestDay)
{
    AnchoredPointers pointers;
    anchorPlanPointers(planId, pointers);

    EntityId dayId = m_store->insertDay(planId, position, exerciseCount, isRestDay);
    if (dayId == INVALID_ENTITY_ID)
    {
        LOG_W(TAG, "Plan %lu: insert at %d failed", (unsigned long)planId, position);
        return dayId;
    }

    LOG_I(TAG, "Plan %lu: day %lu inserted at %d", (unsigned long)planId, (unsigned long)dayId, position);
    restorePointers(pointers);
    return dayId;
}

bool ProgressEngine::removeDay(EntityId planId, EntityId dayId)
{
    AnchoredPointers pointers;
    anchorPlanPointers(planId, pointers);

    if (!m_store->removeDay(planId, dayId))
    {
        LOG_W(TAG, "Plan %lu: day %lu not removed", (unsigned long)planId, (unsigned long)dayId);
        return false;
    }

    LOG_I(TAG, "Plan %lu: day %lu removed", (unsigned long)planId, (unsigned long)dayId);
    restorePointers(pointers);
    return true;
}

bool ProgressEngine::moveDay(EntityId planId, EntityId dayId, int newPosition)
{
    AnchoredPointers pointers;
    anchorPlanPointers(planId, pointers);

    if (!m_store->moveDay(planId, dayId, newPosition))
    {
        LOG_W(TAG, "Plan %lu: day %lu not moved to %d", (unsigned long)planId, (unsigned long)dayId, newPosition);
        return false;
    }

    LOG_I(TAG, "Plan %lu: day %lu moved to %d", (unsigned long)planId, (unsigned long)dayId, newPosition);
    restorePointers(pointers);
    return true;
}

bool ProgressEngine::removeItem(EntityId cycleId, EntityId itemId)
{
    AnchoredPointers pointers;
    anchorCyclePointers(cycleId, pointers);

    if (!m_store->removeItem(cycleId, itemId))
    {
        LOG_W(TAG, "Cycle %lu: item %lu not removed", (unsigned long)cycleId, (unsigned long)itemId);
        return false;
    }

    LOG_I(TAG, "Cycle %lu: item %lu removed", (unsigned long)cycleId, (unsigned long)itemId);
    restorePointers(pointers);
    return true;
}

bool ProgressEngine::moveItem(EntityId cycleId, EntityId itemId, int newOrder)
{
    AnchoredPointers pointers;
    anchorCyclePointers(cycleId, pointers);

    if (!m_store->moveItem(cycleId, itemId, newOrder))
    {
        LOG_W(TAG, "Cycle %lu: item %lu not moved to %d", (unsigned long)cycleId, (unsigned long)itemId, newOrder);
        return false;
    }

    LOG_I(TAG, "Cycle %lu: item %lu moved to %d", (unsigned long)cycleId, (unsigned long)itemId, newOrder);
    restorePointers(pointers);
    return true;
}

// ============================================================================
// Selection
// ============================================================================

void ProgressEngine::setExecutionMode(EntityId profileId, ExecutionMode mode)
{
    m_registry->setExecutionMode(profileId, mode);
}

void ProgressEngine::setActivePlan(EntityId profileId, EntityId planId)
{
    m_registry->setActivePlan(profileId, planId);
}

void ProgressEngine::setActiveCycle(EntityId profileId, EntityId cycleId)
{
    m_registry->setActiveCycle(profileId, cycleId);
}

// ============================================================================
// Private
// ============================================================================

void ProgressEngine::anchorPlanPointers(EntityId planId, AnchoredPointers &pointers)
{
    // Every anchor is read before any restore densifies the day list
    pointers.plans = m_registry->acquirePlansOf(planId);
    for (size_t i = 0; i < pointers.plans.size(); i++)
        pointers.planAnchors.push_back(ReindexReconciler::capturePlanAnchor(*m_store, *pointers.plans[i]));

    std::vector<EntityId> cycleIds = m_registry->cycleIds();
    for (size_t c = 0; c < cycleIds.size(); c++)
    {
        std::vector<CycleItemInfo> items = m_store->itemsOf(cycleIds[c]);
        for (size_t i = 0; i < items.size(); i++)
        {
            if (items[i].planId == planId)
            {
                anchorCyclePointers(cycleIds[c], pointers);
                break;
            }
        }
    }
}

void ProgressEngine::anchorCyclePointers(EntityId cycleId, AnchoredPointers &pointers)
{
    std::vector<CycleProgressLease> leases = m_registry->acquireCyclesOf(cycleId);
    for (size_t i = 0; i < leases.size(); i++)
    {
        pointers.cycleAnchors.push_back(ReindexReconciler::captureCycleAnchor(*m_store, *leases[i]));
        pointers.cycles.push_back(std::move(leases[i]));
    }
}

void ProgressEngine::restorePointers(AnchoredPointers &pointers)
{
    for (size_t i = 0; i < pointers.plans.size(); i++)
        ReindexReconciler::restorePlanPointer(*m_store, *pointers.plans[i], pointers.planAnchors[i]);

    for (size_t i = 0; i < pointers.cycles.size(); i++)
        ReindexReconciler::restoreCyclePointer(*m_store, *pointers.cycles[i], pointers.cycleAnchors[i]);
}

void ProgressEngine::materializeToday(EntityId profileId, EntityId planId, const PlanDayInfo &day, ProgramDay today)
{
    if (m_store->workoutRecordStatus(profileId, planId, today) != RECORD_ABSENT)
        return;

    // One workout per profile and day; a record from another plan stays
    if (m_store->hasWorkoutRecord(profileId, today))
    {
        LOG_I(TAG, "Profile %lu already has a workout from another plan today, not replacing it",
              (unsigned long)profileId);
        return;
    }

    if (!m_store->materializeDay(profileId, planId, day.id, today))
    {
        LOG_E(TAG, "Failed to materialize day %lu of plan %lu", (unsigned long)day.id, (unsigned long)planId);
    }
}

TransitionOutcome ProgressEngine::openPlan(EntityId profileId, EntityId planId, ProgramDay day)
{
    PlanProgressLease lease = m_registry->acquirePlan(profileId, planId);

    ReindexReconciler::reindexPlan(*m_store, *lease);
    TransitionOutcome outcome = PlanProgress::handleAppOpen(*m_store, *lease, day);
    if (outcome.rejected())
        return outcome;

    PlanDayInfo current;
    if (!PlanProgress::currentDay(*m_store, *lease, &current))
    {
        LOG_W(TAG, "Plan %lu: day %d does not resolve", (unsigned long)planId, lease->currentDayIndex);
        return outcome;
    }

    materializeToday(profileId, planId, current, day);
    return outcome;
}

TransitionOutcome ProgressEngine::openCycle(EntityId profileId, EntityId cycleId, ProgramDay day)
{
    CycleProgressLease lease = m_registry->acquireCycle(profileId, cycleId);

    ReindexReconciler::reindexCycle(*m_store, *lease);
    TransitionOutcome outcome = CycleProgress::handleAppOpen(*m_store, *lease, day, now());
    if (outcome.rejected())
        return outcome;

    CycleItemInfo item;
    PlanDayInfo current;
    if (!CycleProgress::currentDay(*m_store, *lease, &item, &current))
    {
        LOG_W(TAG, "Cycle %lu: (%d, %d) does not resolve", (unsigned long)cycleId, lease->currentItemIndex,
              lease->currentDayIndex);
        return outcome;
    }

    materializeToday(profileId, item.planId, current, day);
    return outcome;
}

void ProgressEngine::logOutcome(const char *operation, EntityId profileId, const TransitionOutcome &outcome) const
{
    if (outcome.rejected())
    {
        LOG_W(TAG, "Profile %lu %s: %s (%s)", (unsigned long)profileId, operation,
              transitionResultToString(outcome.result), progressErrorToString(outcome.error));
    }
    else if (outcome.itemIndex >= 0)
    {
        LOG_I(TAG, "Profile %lu %s: %s, item %d day %d", (unsigned long)profileId, operation,
              transitionResultToString(outcome.result), outcome.itemIndex, outcome.dayIndex + 1);
    }
    else
    {
        LOG_I(TAG, "Profile %lu %s: %s, day %d", (unsigned long)profileId, operation,
              transitionResultToString(outcome.result), outcome.dayIndex);
    }
}

time_t ProgressEngine::now() const
{
    return m_timeProvider->getCurrentTime();
}
