/**
 * @file memory_plan_store.h
 * @brief In-memory plan store with editable plans, cycles and workout records
 *
 * Backs the firmware (plans are built from the layouts in private.h) and the
 * unit tests. Editing operations behave like a real editor: removing a day or
 * item leaves a gap in the positions until reindexDays/reindexItems runs,
 * and moving an entry renumbers the list it belongs to.
 */

#ifndef MEMORY_PLAN_STORE_H
#define MEMORY_PLAN_STORE_H

#include <map>
#include <mutex>
#include <utility>
#include <vector>
#include "../plan_store.h"

/**
 * @class MemoryPlanStore
 * @brief IPlanStore kept entirely in RAM
 *
 * Workout records are keyed by (profile, program day): a profile has at most
 * one workout per day. A record is complete when it has planned sets and all
 * of them are logged. Thread-safe: every public method takes the store lock.
 */
class MemoryPlanStore : public IPlanStore
{
public:
    static const int DEFAULT_SETS_PER_EXERCISE = 3;

    MemoryPlanStore();
    ~MemoryPlanStore() override = default;

    // IPlanStore interface
    bool planExists(EntityId planId) const override;
    std::vector<PlanDayInfo> daysOf(EntityId planId) const override;
    bool cycleExists(EntityId cycleId) const override;
    std::vector<CycleItemInfo> itemsOf(EntityId cycleId) const override;
    WorkoutRecordStatus workoutRecordStatus(EntityId profileId, EntityId planId,
                                            ProgramDay day) const override;
    int completedSetCount(EntityId profileId, EntityId planId, ProgramDay day) const override;
    bool deleteWorkoutRecord(EntityId profileId, EntityId planId, ProgramDay day) override;
    bool materializeDay(EntityId profileId, EntityId planId, EntityId dayId,
                        ProgramDay day) override;
    bool reindexDays(EntityId planId) override;
    bool reindexItems(EntityId cycleId) override;

    // Plan editing
    EntityId createPlan();
    bool removePlan(EntityId planId);
    EntityId addDay(EntityId planId, int exerciseCount, bool isRestDay = false);

    /**
     * @brief Insert a day at a position, shifting later days up by one
     */
    EntityId insertDay(EntityId planId, int position, int exerciseCount, bool isRestDay = false) override;

    /**
     * @brief Remove a day, leaving a gap in the positions
     */
    bool removeDay(EntityId planId, EntityId dayId) override;

    /**
     * @brief Move a day to a 1-indexed slot and renumber the plan 1..n
     */
    bool moveDay(EntityId planId, EntityId dayId, int newPosition) override;

    bool setExerciseCount(EntityId planId, EntityId dayId, int exerciseCount);

    // Cycle editing
    EntityId createCycle();
    bool removeCycle(EntityId cycleId);
    EntityId addItem(EntityId cycleId, EntityId planId);
    bool removeItem(EntityId cycleId, EntityId itemId) override;
    bool moveItem(EntityId cycleId, EntityId itemId, int newOrder) override;

    // Layout loading ("5,6,R,4"; cycles separate plans with '|')
    static bool isValidPlanLayout(const char *layout);
    static bool isValidCycleLayout(const char *layout);
    EntityId createPlanFromLayout(const char *layout);
    EntityId createCycleFromLayout(const char *layout);

    // Workout logging
    void setSetsPerExercise(int sets);
    bool logCompletedSets(EntityId profileId, ProgramDay day, int sets);
    bool completeWorkout(EntityId profileId, ProgramDay day);

    /**
     * @brief Store an arbitrary record (imports, backfilled history)
     */
    void putWorkoutRecord(EntityId profileId, EntityId planId, EntityId dayId, ProgramDay day,
                          int plannedSets, int completedSets);

    bool hasWorkoutRecord(EntityId profileId, ProgramDay day) const override;

    /**
     * @brief Day identity of the record for (profile, day), INVALID_ENTITY_ID if none
     */
    EntityId recordDayId(EntityId profileId, ProgramDay day) const;

    size_t workoutRecordCount() const;

private:
    struct WorkoutRecord
    {
        EntityId planId;
        EntityId dayId;
        int plannedSets;
        int completedSets;
    };

    typedef std::pair<EntityId, int32_t> RecordKey;

    EntityId nextId();
    EntityId createPlanLocked();
    EntityId createCycleLocked();
    EntityId addDayLocked(EntityId planId, int exerciseCount, bool isRestDay);
    EntityId addItemLocked(EntityId cycleId, EntityId planId);
    bool parsePlanLayoutInto(EntityId planId, const char *begin, const char *end);
    static bool isValidLayoutRange(const char *begin, const char *end);
    static void sortDays(std::vector<PlanDayInfo> &days);
    static void sortItems(std::vector<CycleItemInfo> &items);

    mutable std::mutex m_mutex;
    EntityId m_nextId;
    int m_setsPerExercise;
    std::map<EntityId, std::vector<PlanDayInfo> > m_plans;
    std::map<EntityId, std::vector<CycleItemInfo> > m_cycles;
    std::map<RecordKey, WorkoutRecord> m_records;
};

#endif // MEMORY_PLAN_STORE_H
