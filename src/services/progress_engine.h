/**
 * @file progress_engine.h
 * @brief Host-facing orchestrator for training progress
 *
 * Ties the configuration, the clock, the plan store and the progress registry
 * together. Hosts call onAppOpen() whenever the app comes to the foreground
 * (or the firmware notices a new program day), recordCompletion() for
 * retroactive logs and changeDay() for manual overrides. Every call runs
 * under the per-key lease of the profile's active plan or cycle.
 */

#ifndef PROGRESS_ENGINE_H
#define PROGRESS_ENGINE_H

#include <time.h>
#include "../core/progress_types.h"
#include "../adapters/config_provider.h"
#include "../adapters/time_provider.h"
#include "../adapters/plan_store.h"
#include "progress_registry.h"
#include "preview_projector.h"

/**
 * @struct TodayWorkout
 * @brief Resolved workout for the current pointer
 */
struct TodayWorkout
{
    EntityId planId;
    PlanDayInfo day;
    int dayIndex; ///< 1-indexed for display in both modes
    int totalDays;
    int itemIndex; ///< Cycle item (0-indexed), -1 in single-plan mode
};

/**
 * @class ProgressEngine
 * @brief Orchestrates progress transitions for profiles
 *
 * Uses dependency injection so the same engine runs on the device (NTP clock,
 * layouts from private.h) and in unit tests (fixed clock, hand-built store).
 */
class ProgressEngine
{
public:
    /**
     * @brief Constructor
     * @param config Configuration provider
     * @param timeProvider Time source
     * @param store Plan store
     * @param registry Owner of all progress states
     */
    ProgressEngine(IConfigProvider *config, ITimeProvider *timeProvider, IPlanStore *store,
                   ProgressRegistry *registry);

    /**
     * @brief Apply the configured execution mode to the configured profile
     */
    void begin();

    /**
     * @brief Program day of "now" using the configured offset and boundary hour
     * @return Unset ProgramDay when the clock is not valid yet
     */
    ProgramDay today() const;

    // ------------------------------------------------------------------
    // Transitions
    // ------------------------------------------------------------------

    /**
     * @brief Setup-today flow for the profile's active plan or cycle
     *
     * Reconciles the pointer with the current day list, runs the app-open
     * transition and materializes the resolved day for today when no record
     * exists yet.
     */
    TransitionOutcome onAppOpen(EntityId profileId);
    TransitionOutcome onAppOpenAt(EntityId profileId, ProgramDay day);

    /**
     * @brief Rescue path for a completion logged on completionDate
     */
    TransitionOutcome recordCompletion(EntityId profileId, ProgramDay completionDate);

    /**
     * @brief Replace today's workout
     *
     * @param newDayIndex 1-indexed day in single-plan mode, 0-indexed day of the
     *                    current plan in cycle mode
     */
    TransitionOutcome changeDay(EntityId profileId, int newDayIndex, bool skipAndAdvance);

    /**
     * @brief Explicit "complete and move on" for the active cycle
     */
    TransitionOutcome advanceCycle(EntityId profileId);

    /**
     * @brief Start a plan at a given day (also makes it the active plan)
     */
    TransitionOutcome startPlanAt(EntityId profileId, EntityId planId, int dayIndex);

    /**
     * @brief Reset the active cycle to (0, 0)
     * @return false when no cycle is active
     */
    bool resetCycle(EntityId profileId);

    /**
     * @brief Run the reindex reconciler for the active plan or cycle
     * @return true if the pointer moved
     */
    bool reconcile(EntityId profileId);

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    DayPreview preview(EntityId profileId, ProgramDay target);

    /**
     * @brief Workout the pointer currently refers to
     *
     * Reconciles the pointer first, so a removal since the last open is
     * already reflected.
     *
     * @return false when nothing is configured or the pointer cannot resolve
     */
    bool todayWorkout(EntityId profileId, TodayWorkout *workout);

    // ------------------------------------------------------------------
    // Editing
    //
    // Every pointer into the edited plan or cycle (all profiles, and the
    // cycles using the plan) is locked and anchored before the store edit
    // and re-resolved by identity after it.
    // ------------------------------------------------------------------

    EntityId insertDay(EntityId planId, int position, int exerciseCount, bool isRestDay = false);
    bool removeDay(EntityId planId, EntityId dayId);
    bool moveDay(EntityId planId, EntityId dayId, int newPosition);
    bool removeItem(EntityId cycleId, EntityId itemId);
    bool moveItem(EntityId cycleId, EntityId itemId, int newOrder);

    // ------------------------------------------------------------------
    // Selection
    // ------------------------------------------------------------------

    void setExecutionMode(EntityId profileId, ExecutionMode mode);
    void setActivePlan(EntityId profileId, EntityId planId);
    void setActiveCycle(EntityId profileId, EntityId cycleId);

private:
    struct AnchoredPointers;

    void anchorPlanPointers(EntityId planId, AnchoredPointers &pointers);
    void anchorCyclePointers(EntityId cycleId, AnchoredPointers &pointers);
    void restorePointers(AnchoredPointers &pointers);
    void materializeToday(EntityId profileId, EntityId planId, const PlanDayInfo &day, ProgramDay today);

    TransitionOutcome openPlan(EntityId profileId, EntityId planId, ProgramDay day);
    TransitionOutcome openCycle(EntityId profileId, EntityId cycleId, ProgramDay day);
    void logOutcome(const char *operation, EntityId profileId, const TransitionOutcome &outcome) const;
    time_t now() const;

    IConfigProvider *m_config;
    ITimeProvider *m_timeProvider;
    IPlanStore *m_store;
    ProgressRegistry *m_registry;
};

#endif // PROGRESS_ENGINE_H
