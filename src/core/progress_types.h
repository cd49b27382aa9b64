/**
 * @file progress_types.h
 * @brief Shared value types, result codes and progress states
 *
 * Plain data shared by every progress service. Nothing here depends on
 * Arduino so the services can be unit tested on the host.
 */

#ifndef PROGRESS_TYPES_H
#define PROGRESS_TYPES_H

#include <stdint.h>
#include <time.h>

/// Opaque stable identity of a profile, plan, day, cycle or cycle item
typedef uint32_t EntityId;

/// Identity value meaning "none"
static const EntityId INVALID_ENTITY_ID = 0;

/// Single-plan day index meaning "no day" (plan missing or empty)
static const int NO_DAY_INDEX = 0;

/**
 * @struct ProgramDay
 * @brief Whole-day count since 1970-01-01 after the day-boundary shift
 *
 * Produced by CalendarNormalizer. The default value is "unset" and orders
 * before every real day, so "never" compares older than any date.
 */
struct ProgramDay
{
    static constexpr int32_t UNSET_EPOCH_DAY = INT32_MIN;

    int32_t epochDay;

    ProgramDay() : epochDay(UNSET_EPOCH_DAY) {}
    explicit ProgramDay(int32_t day) : epochDay(day) {}

    bool isSet() const { return epochDay != UNSET_EPOCH_DAY; }

    bool operator==(const ProgramDay &other) const { return epochDay == other.epochDay; }
    bool operator!=(const ProgramDay &other) const { return epochDay != other.epochDay; }
    bool operator<(const ProgramDay &other) const { return epochDay < other.epochDay; }
    bool operator<=(const ProgramDay &other) const { return epochDay <= other.epochDay; }
    bool operator>(const ProgramDay &other) const { return epochDay > other.epochDay; }
    bool operator>=(const ProgramDay &other) const { return epochDay >= other.epochDay; }
};

/**
 * @brief How a profile follows its program
 */
enum ExecutionMode
{
    MODE_SINGLE_PLAN = 0, ///< One plan, 1-indexed day pointer
    MODE_CYCLE = 1        ///< Ordered rotation of plans, 0-indexed pointers
};

/**
 * @brief Presence and completeness of the workout record for a ProgramDay
 */
enum WorkoutRecordStatus
{
    RECORD_ABSENT = 0,
    RECORD_INCOMPLETE = 1,
    RECORD_COMPLETE = 2
};

/**
 * @brief Outcome class of a state transition
 */
enum TransitionResult
{
    TRANSITION_ADVANCED = 0, ///< Pointer moved
    TRANSITION_NO_OP = 1,    ///< Valid call, nothing moved
    TRANSITION_INVALID = 2   ///< Rejected, state untouched
};

/**
 * @brief Reason attached to a transition outcome
 */
enum ProgressError
{
    PROGRESS_OK = 0,
    PROGRESS_PLAN_NOT_FOUND,
    PROGRESS_EMPTY_PLAN,
    PROGRESS_CYCLE_NOT_FOUND,
    PROGRESS_CYCLE_EMPTY,
    PROGRESS_NO_VALID_PLAN,
    PROGRESS_DAY_NOT_FOUND,
    PROGRESS_DAY_IN_PROGRESS,
    PROGRESS_MATERIALIZE_FAILED,
    PROGRESS_NOT_CONFIGURED,
    PROGRESS_TIME_NOT_SYNCED
};

/**
 * @struct PlanDayInfo
 * @brief One Day of a Plan as seen by the progress services
 */
struct PlanDayInfo
{
    EntityId id;
    int position; ///< 1-indexed, unique within the plan, gaps allowed
    bool isRestDay;
    int exerciseCount;
};

/**
 * @struct CycleItemInfo
 * @brief One entry of a Cycle, referencing a Plan
 */
struct CycleItemInfo
{
    EntityId id;
    int order; ///< 0-indexed, unique within the cycle, gaps allowed
    EntityId planId;
};

/**
 * @struct PlanProgressState
 * @brief Per-(profile, plan) pointer for single-plan mode
 */
struct PlanProgressState
{
    EntityId profileId;
    EntityId planId;
    int currentDayIndex; ///< 1-indexed
    ProgramDay lastOpenedDate;
    ProgramDay lastCompletedDate;

    PlanProgressState()
        : profileId(INVALID_ENTITY_ID), planId(INVALID_ENTITY_ID), currentDayIndex(1)
    {
    }

    PlanProgressState(EntityId profile, EntityId plan)
        : profileId(profile), planId(plan), currentDayIndex(1)
    {
    }
};

/**
 * @struct CycleProgressState
 * @brief Per-(profile, cycle) two-level pointer for cycle mode
 */
struct CycleProgressState
{
    EntityId profileId;
    EntityId cycleId;
    int currentItemIndex; ///< 0-indexed into the ordered items
    int currentDayIndex;  ///< 0-indexed into the item's plan days
    time_t lastAdvancedAt; ///< 0 = never advanced
    ProgramDay lastOpenedDate;
    ProgramDay lastCompletedDate;

    CycleProgressState()
        : profileId(INVALID_ENTITY_ID), cycleId(INVALID_ENTITY_ID),
          currentItemIndex(0), currentDayIndex(0), lastAdvancedAt(0)
    {
    }

    CycleProgressState(EntityId profile, EntityId cycle)
        : profileId(profile), cycleId(cycle),
          currentItemIndex(0), currentDayIndex(0), lastAdvancedAt(0)
    {
    }
};

/**
 * @struct TransitionOutcome
 * @brief Explicit result of every progress transition
 *
 * dayIndex is 1-indexed for single-plan outcomes (NO_DAY_INDEX when there is
 * no day) and 0-indexed for cycle outcomes. itemIndex is -1 for single-plan
 * outcomes.
 */
struct TransitionOutcome
{
    TransitionResult result;
    ProgressError error;
    int dayIndex;
    int itemIndex;
    bool staleRecordDeleted;

    bool moved() const { return result == TRANSITION_ADVANCED; }
    bool rejected() const { return result == TRANSITION_INVALID; }

    static TransitionOutcome advancedTo(int day, int item = -1)
    {
        TransitionOutcome o = {TRANSITION_ADVANCED, PROGRESS_OK, day, item, false};
        return o;
    }

    static TransitionOutcome unchangedAt(int day, int item = -1)
    {
        TransitionOutcome o = {TRANSITION_NO_OP, PROGRESS_OK, day, item, false};
        return o;
    }

    static TransitionOutcome invalid(ProgressError error, int day, int item = -1)
    {
        TransitionOutcome o = {TRANSITION_INVALID, error, day, item, false};
        return o;
    }
};

/**
 * @brief Human-readable name of a ProgressError, for log lines
 */
const char *progressErrorToString(ProgressError error);

/**
 * @brief Human-readable name of a TransitionResult, for log lines
 */
const char *transitionResultToString(TransitionResult result);

/**
 * @brief Human-readable name of an ExecutionMode
 */
const char *executionModeToString(ExecutionMode mode);

#endif // PROGRESS_TYPES_H
