/**
 * @file plan_store.h
 * @brief Abstract interface to the plan, cycle and workout record store
 *
 * The progress services never own plan content. They read ordered day and
 * item lists, look up workout records by ProgramDay and ask the store to
 * materialize or delete records through this interface.
 *
 * Implementations:
 * - MemoryPlanStore: in-memory store built from configured layouts
 */

#ifndef PLAN_STORE_H
#define PLAN_STORE_H

#include <vector>
#include "../core/progress_types.h"

/**
 * @class IPlanStore
 * @brief Read and mutate plan content on behalf of the progress services
 *
 * Lists are returned sorted ascending by position (days) or order (items).
 * Positions and orders may contain gaps until reindexDays/reindexItems runs.
 */
class IPlanStore
{
public:
    virtual ~IPlanStore() = default;

    virtual bool planExists(EntityId planId) const = 0;

    /**
     * @brief Days of a plan sorted by position
     * @return Empty list when the plan is missing or has no days
     */
    virtual std::vector<PlanDayInfo> daysOf(EntityId planId) const = 0;

    virtual bool cycleExists(EntityId cycleId) const = 0;

    /**
     * @brief Items of a cycle sorted by order
     */
    virtual std::vector<CycleItemInfo> itemsOf(EntityId cycleId) const = 0;

    /**
     * @brief Status of the workout record logged for (profile, plan) on a day
     *
     * A record that belongs to another plan reads as RECORD_ABSENT.
     */
    virtual WorkoutRecordStatus workoutRecordStatus(EntityId profileId, EntityId planId,
                                                    ProgramDay day) const = 0;

    /**
     * @brief Whether the profile has any record on a day, whatever plan it belongs to
     */
    virtual bool hasWorkoutRecord(EntityId profileId, ProgramDay day) const = 0;

    /**
     * @brief Number of completed sets in the record for (profile, plan, day)
     */
    virtual int completedSetCount(EntityId profileId, EntityId planId, ProgramDay day) const = 0;

    /**
     * @brief Delete the record for (profile, plan, day)
     * @return true if a record was removed
     */
    virtual bool deleteWorkoutRecord(EntityId profileId, EntityId planId, ProgramDay day) = 0;

    /**
     * @brief Create or replace the record for a day with the content of dayId
     * @return false if the day does not belong to the plan
     */
    virtual bool materializeDay(EntityId profileId, EntityId planId, EntityId dayId,
                                ProgramDay day) = 0;

    /**
     * @brief Re-densify day positions to 1..n keeping their relative order
     */
    virtual bool reindexDays(EntityId planId) = 0;

    /**
     * @brief Re-densify item orders to 0..n-1 keeping their relative order
     */
    virtual bool reindexItems(EntityId cycleId) = 0;

    // ------------------------------------------------------------------
    // Editing. Positions change as soon as these return; callers holding
    // progress pointers capture their anchors first.
    // ------------------------------------------------------------------

    /**
     * @brief Insert a day at a 1-indexed position, shifting later days up
     * @return New day identity, INVALID_ENTITY_ID if the plan is missing
     */
    virtual EntityId insertDay(EntityId planId, int position, int exerciseCount, bool isRestDay) = 0;

    /**
     * @brief Remove a day, leaving a gap in the positions
     */
    virtual bool removeDay(EntityId planId, EntityId dayId) = 0;

    /**
     * @brief Move a day to a 1-indexed slot and renumber the plan
     */
    virtual bool moveDay(EntityId planId, EntityId dayId, int newPosition) = 0;

    virtual bool removeItem(EntityId cycleId, EntityId itemId) = 0;
    virtual bool moveItem(EntityId cycleId, EntityId itemId, int newOrder) = 0;
};

#endif // PLAN_STORE_H
