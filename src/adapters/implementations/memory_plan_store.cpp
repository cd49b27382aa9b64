/**
 * @file memory_plan_store.cpp
 * @brief Implementation of the in-memory plan store
 */

#include "memory_plan_store.h"
#include "../../core/logging.h"
#include <algorithm>
#include <ctype.h>
#include <string.h>

static const char *const TAG = "plan_store";

static bool dayPositionLess(const PlanDayInfo &a, const PlanDayInfo &b)
{
    return a.position < b.position;
}

static bool itemOrderLess(const CycleItemInfo &a, const CycleItemInfo &b)
{
    return a.order < b.order;
}

static const char *skipSpaces(const char *p, const char *end)
{
    while (p < end && isspace((unsigned char)*p))
        p++;
    return p;
}

MemoryPlanStore::MemoryPlanStore()
    : m_nextId(1), m_setsPerExercise(DEFAULT_SETS_PER_EXERCISE)
{
}

// ============================================================================
// IPlanStore interface
// ============================================================================

bool MemoryPlanStore::planExists(EntityId planId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_plans.find(planId) != m_plans.end();
}

std::vector<PlanDayInfo> MemoryPlanStore::daysOf(EntityId planId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<PlanDayInfo> >::const_iterator it = m_plans.find(planId);
    if (it == m_plans.end())
        return std::vector<PlanDayInfo>();

    std::vector<PlanDayInfo> days = it->second;
    sortDays(days);
    return days;
}

bool MemoryPlanStore::cycleExists(EntityId cycleId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cycles.find(cycleId) != m_cycles.end();
}

std::vector<CycleItemInfo> MemoryPlanStore::itemsOf(EntityId cycleId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<CycleItemInfo> >::const_iterator it = m_cycles.find(cycleId);
    if (it == m_cycles.end())
        return std::vector<CycleItemInfo>();

    std::vector<CycleItemInfo> items = it->second;
    sortItems(items);
    return items;
}

WorkoutRecordStatus MemoryPlanStore::workoutRecordStatus(EntityId profileId, EntityId planId,
                                                         ProgramDay day) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<RecordKey, WorkoutRecord>::const_iterator it = m_records.find(RecordKey(profileId, day.epochDay));
    if (it == m_records.end() || it->second.planId != planId)
        return RECORD_ABSENT;

    const WorkoutRecord &record = it->second;
    if (record.plannedSets > 0 && record.completedSets >= record.plannedSets)
        return RECORD_COMPLETE;

    return RECORD_INCOMPLETE;
}

int MemoryPlanStore::completedSetCount(EntityId profileId, EntityId planId, ProgramDay day) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<RecordKey, WorkoutRecord>::const_iterator it = m_records.find(RecordKey(profileId, day.epochDay));
    if (it == m_records.end() || it->second.planId != planId)
        return 0;

    return it->second.completedSets;
}

bool MemoryPlanStore::deleteWorkoutRecord(EntityId profileId, EntityId planId, ProgramDay day)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<RecordKey, WorkoutRecord>::iterator it = m_records.find(RecordKey(profileId, day.epochDay));
    if (it == m_records.end() || it->second.planId != planId)
        return false;

    m_records.erase(it);
    LOG_D(TAG, "Deleted workout record (profile=%lu, plan=%lu, day=%ld)",
          (unsigned long)profileId, (unsigned long)planId, (long)day.epochDay);
    return true;
}

bool MemoryPlanStore::materializeDay(EntityId profileId, EntityId planId, EntityId dayId,
                                     ProgramDay day)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!day.isSet())
    {
        LOG_W(TAG, "Cannot materialize day %lu: program day is unset", (unsigned long)dayId);
        return false;
    }

    std::map<EntityId, std::vector<PlanDayInfo> >::const_iterator plan = m_plans.find(planId);
    if (plan == m_plans.end())
    {
        LOG_W(TAG, "Cannot materialize day %lu: plan %lu not found", (unsigned long)dayId, (unsigned long)planId);
        return false;
    }

    for (size_t i = 0; i < plan->second.size(); i++)
    {
        const PlanDayInfo &info = plan->second[i];
        if (info.id != dayId)
            continue;

        WorkoutRecord record;
        record.planId = planId;
        record.dayId = dayId;
        record.plannedSets = info.isRestDay ? 0 : info.exerciseCount * m_setsPerExercise;
        record.completedSets = 0;
        m_records[RecordKey(profileId, day.epochDay)] = record;

        LOG_D(TAG, "Materialized day %lu (position %d, %d sets planned)",
              (unsigned long)dayId, info.position, record.plannedSets);
        return true;
    }

    LOG_W(TAG, "Cannot materialize day %lu: not part of plan %lu", (unsigned long)dayId, (unsigned long)planId);
    return false;
}

bool MemoryPlanStore::reindexDays(EntityId planId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<PlanDayInfo> >::iterator it = m_plans.find(planId);
    if (it == m_plans.end())
        return false;

    sortDays(it->second);
    for (size_t i = 0; i < it->second.size(); i++)
        it->second[i].position = (int)i + 1;

    return true;
}

bool MemoryPlanStore::reindexItems(EntityId cycleId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<CycleItemInfo> >::iterator it = m_cycles.find(cycleId);
    if (it == m_cycles.end())
        return false;

    sortItems(it->second);
    for (size_t i = 0; i < it->second.size(); i++)
        it->second[i].order = (int)i;

    return true;
}

// ============================================================================
// Plan editing
// ============================================================================

EntityId MemoryPlanStore::createPlan()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return createPlanLocked();
}

bool MemoryPlanStore::removePlan(EntityId planId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_plans.erase(planId) > 0;
}

EntityId MemoryPlanStore::addDay(EntityId planId, int exerciseCount, bool isRestDay)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return addDayLocked(planId, exerciseCount, isRestDay);
}

EntityId MemoryPlanStore::insertDay(EntityId planId, int position, int exerciseCount, bool isRestDay)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<PlanDayInfo> >::iterator it = m_plans.find(planId);
    if (it == m_plans.end())
        return INVALID_ENTITY_ID;

    if (position < 1)
        position = 1;

    for (size_t i = 0; i < it->second.size(); i++)
    {
        if (it->second[i].position >= position)
            it->second[i].position++;
    }

    PlanDayInfo day;
    day.id = nextId();
    day.position = position;
    day.isRestDay = isRestDay;
    day.exerciseCount = isRestDay ? 0 : std::max(0, exerciseCount);
    it->second.push_back(day);
    sortDays(it->second);
    return day.id;
}

bool MemoryPlanStore::removeDay(EntityId planId, EntityId dayId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<PlanDayInfo> >::iterator it = m_plans.find(planId);
    if (it == m_plans.end())
        return false;

    std::vector<PlanDayInfo> &days = it->second;
    for (std::vector<PlanDayInfo>::iterator d = days.begin(); d != days.end(); ++d)
    {
        if (d->id == dayId)
        {
            days.erase(d);
            return true;
        }
    }
    return false;
}

bool MemoryPlanStore::moveDay(EntityId planId, EntityId dayId, int newPosition)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<PlanDayInfo> >::iterator it = m_plans.find(planId);
    if (it == m_plans.end())
        return false;

    std::vector<PlanDayInfo> &days = it->second;
    sortDays(days);

    size_t from = days.size();
    for (size_t i = 0; i < days.size(); i++)
    {
        if (days[i].id == dayId)
        {
            from = i;
            break;
        }
    }
    if (from == days.size())
        return false;

    PlanDayInfo moved = days[from];
    days.erase(days.begin() + from);

    int slot = newPosition - 1;
    if (slot < 0)
        slot = 0;
    if (slot > (int)days.size())
        slot = (int)days.size();
    days.insert(days.begin() + slot, moved);

    for (size_t i = 0; i < days.size(); i++)
        days[i].position = (int)i + 1;

    return true;
}

bool MemoryPlanStore::setExerciseCount(EntityId planId, EntityId dayId, int exerciseCount)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<PlanDayInfo> >::iterator it = m_plans.find(planId);
    if (it == m_plans.end())
        return false;

    for (size_t i = 0; i < it->second.size(); i++)
    {
        if (it->second[i].id == dayId)
        {
            it->second[i].exerciseCount = std::max(0, exerciseCount);
            return true;
        }
    }
    return false;
}

// ============================================================================
// Cycle editing
// ============================================================================

EntityId MemoryPlanStore::createCycle()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return createCycleLocked();
}

bool MemoryPlanStore::removeCycle(EntityId cycleId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cycles.erase(cycleId) > 0;
}

EntityId MemoryPlanStore::addItem(EntityId cycleId, EntityId planId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return addItemLocked(cycleId, planId);
}

bool MemoryPlanStore::removeItem(EntityId cycleId, EntityId itemId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<CycleItemInfo> >::iterator it = m_cycles.find(cycleId);
    if (it == m_cycles.end())
        return false;

    std::vector<CycleItemInfo> &items = it->second;
    for (std::vector<CycleItemInfo>::iterator item = items.begin(); item != items.end(); ++item)
    {
        if (item->id == itemId)
        {
            items.erase(item);
            return true;
        }
    }
    return false;
}

bool MemoryPlanStore::moveItem(EntityId cycleId, EntityId itemId, int newOrder)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, std::vector<CycleItemInfo> >::iterator it = m_cycles.find(cycleId);
    if (it == m_cycles.end())
        return false;

    std::vector<CycleItemInfo> &items = it->second;
    sortItems(items);

    size_t from = items.size();
    for (size_t i = 0; i < items.size(); i++)
    {
        if (items[i].id == itemId)
        {
            from = i;
            break;
        }
    }
    if (from == items.size())
        return false;

    CycleItemInfo moved = items[from];
    items.erase(items.begin() + from);

    int slot = newOrder;
    if (slot < 0)
        slot = 0;
    if (slot > (int)items.size())
        slot = (int)items.size();
    items.insert(items.begin() + slot, moved);

    for (size_t i = 0; i < items.size(); i++)
        items[i].order = (int)i;

    return true;
}

// ============================================================================
// Layout loading
// ============================================================================

bool MemoryPlanStore::isValidPlanLayout(const char *layout)
{
    if (layout == nullptr)
        return false;

    return isValidLayoutRange(layout, layout + strlen(layout));
}

bool MemoryPlanStore::isValidCycleLayout(const char *layout)
{
    if (layout == nullptr || layout[0] == '\0')
        return false;

    const char *end = layout + strlen(layout);
    const char *segment = layout;
    while (true)
    {
        const char *separator = std::find(segment, end, '|');
        if (!isValidLayoutRange(segment, separator))
            return false;
        if (separator == end)
            return true;
        segment = separator + 1;
    }
}

EntityId MemoryPlanStore::createPlanFromLayout(const char *layout)
{
    if (!isValidPlanLayout(layout))
    {
        LOG_E(TAG, "Invalid plan layout '%s'", layout ? layout : "(null)");
        return INVALID_ENTITY_ID;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    EntityId planId = createPlanLocked();
    parsePlanLayoutInto(planId, layout, layout + strlen(layout));
    LOG_I(TAG, "Created plan %lu with %u days from layout '%s'",
          (unsigned long)planId, (unsigned)m_plans[planId].size(), layout);
    return planId;
}

EntityId MemoryPlanStore::createCycleFromLayout(const char *layout)
{
    if (!isValidCycleLayout(layout))
    {
        LOG_E(TAG, "Invalid cycle layout '%s'", layout ? layout : "(null)");
        return INVALID_ENTITY_ID;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    EntityId cycleId = createCycleLocked();

    const char *end = layout + strlen(layout);
    const char *segment = layout;
    while (true)
    {
        const char *separator = std::find(segment, end, '|');
        EntityId planId = createPlanLocked();
        parsePlanLayoutInto(planId, segment, separator);
        addItemLocked(cycleId, planId);
        if (separator == end)
            break;
        segment = separator + 1;
    }

    LOG_I(TAG, "Created cycle %lu with %u plans from layout '%s'",
          (unsigned long)cycleId, (unsigned)m_cycles[cycleId].size(), layout);
    return cycleId;
}

// ============================================================================
// Workout logging
// ============================================================================

void MemoryPlanStore::setSetsPerExercise(int sets)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_setsPerExercise = sets > 0 ? sets : 1;
}

bool MemoryPlanStore::logCompletedSets(EntityId profileId, ProgramDay day, int sets)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<RecordKey, WorkoutRecord>::iterator it = m_records.find(RecordKey(profileId, day.epochDay));
    if (it == m_records.end() || sets <= 0)
        return false;

    WorkoutRecord &record = it->second;
    record.completedSets = std::min(record.plannedSets, record.completedSets + sets);
    return true;
}

bool MemoryPlanStore::completeWorkout(EntityId profileId, ProgramDay day)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<RecordKey, WorkoutRecord>::iterator it = m_records.find(RecordKey(profileId, day.epochDay));
    if (it == m_records.end())
        return false;

    it->second.completedSets = it->second.plannedSets;
    return true;
}

void MemoryPlanStore::putWorkoutRecord(EntityId profileId, EntityId planId, EntityId dayId, ProgramDay day,
                                       int plannedSets, int completedSets)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    WorkoutRecord record;
    record.planId = planId;
    record.dayId = dayId;
    record.plannedSets = std::max(0, plannedSets);
    record.completedSets = std::max(0, std::min(completedSets, record.plannedSets));
    m_records[RecordKey(profileId, day.epochDay)] = record;
}

bool MemoryPlanStore::hasWorkoutRecord(EntityId profileId, ProgramDay day) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.find(RecordKey(profileId, day.epochDay)) != m_records.end();
}

EntityId MemoryPlanStore::recordDayId(EntityId profileId, ProgramDay day) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<RecordKey, WorkoutRecord>::const_iterator it = m_records.find(RecordKey(profileId, day.epochDay));
    return it == m_records.end() ? INVALID_ENTITY_ID : it->second.dayId;
}

size_t MemoryPlanStore::workoutRecordCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

// ============================================================================
// Helpers (caller holds m_mutex)
// ============================================================================

EntityId MemoryPlanStore::nextId()
{
    return m_nextId++;
}

EntityId MemoryPlanStore::createPlanLocked()
{
    EntityId planId = nextId();
    m_plans[planId] = std::vector<PlanDayInfo>();
    return planId;
}

EntityId MemoryPlanStore::createCycleLocked()
{
    EntityId cycleId = nextId();
    m_cycles[cycleId] = std::vector<CycleItemInfo>();
    return cycleId;
}

EntityId MemoryPlanStore::addDayLocked(EntityId planId, int exerciseCount, bool isRestDay)
{
    std::map<EntityId, std::vector<PlanDayInfo> >::iterator it = m_plans.find(planId);
    if (it == m_plans.end())
        return INVALID_ENTITY_ID;

    int position = 1;
    for (size_t i = 0; i < it->second.size(); i++)
        position = std::max(position, it->second[i].position + 1);

    PlanDayInfo day;
    day.id = nextId();
    day.position = position;
    day.isRestDay = isRestDay;
    day.exerciseCount = isRestDay ? 0 : std::max(0, exerciseCount);
    it->second.push_back(day);
    return day.id;
}

EntityId MemoryPlanStore::addItemLocked(EntityId cycleId, EntityId planId)
{
    std::map<EntityId, std::vector<CycleItemInfo> >::iterator it = m_cycles.find(cycleId);
    if (it == m_cycles.end())
        return INVALID_ENTITY_ID;

    int order = 0;
    for (size_t i = 0; i < it->second.size(); i++)
        order = std::max(order, it->second[i].order + 1);

    CycleItemInfo item;
    item.id = nextId();
    item.order = order;
    item.planId = planId;
    it->second.push_back(item);
    return item.id;
}

bool MemoryPlanStore::parsePlanLayoutInto(EntityId planId, const char *begin, const char *end)
{
    const char *p = skipSpaces(begin, end);
    while (p < end)
    {
        if (*p == 'R' || *p == 'r')
        {
            addDayLocked(planId, 0, true);
            p++;
        }
        else
        {
            int count = 0;
            while (p < end && isdigit((unsigned char)*p))
            {
                count = count * 10 + (*p - '0');
                p++;
            }
            addDayLocked(planId, count, false);
        }

        p = skipSpaces(p, end);
        if (p < end && *p == ',')
            p = skipSpaces(p + 1, end);
    }
    return true;
}

// Grammar: empty | token (',' token)*, token = 'R' | 1-2 digit exercise count
bool MemoryPlanStore::isValidLayoutRange(const char *begin, const char *end)
{
    const char *p = skipSpaces(begin, end);
    if (p == end)
        return true;

    while (true)
    {
        p = skipSpaces(p, end);
        if (p < end && (*p == 'R' || *p == 'r'))
        {
            p++;
        }
        else
        {
            int digits = 0;
            while (p < end && isdigit((unsigned char)*p))
            {
                digits++;
                p++;
            }
            if (digits == 0 || digits > 2)
                return false;
        }

        p = skipSpaces(p, end);
        if (p == end)
            return true;
        if (*p != ',')
            return false;
        p++;
    }
}

void MemoryPlanStore::sortDays(std::vector<PlanDayInfo> &days)
{
    std::stable_sort(days.begin(), days.end(), dayPositionLess);
}

void MemoryPlanStore::sortItems(std::vector<CycleItemInfo> &items)
{
    std::stable_sort(items.begin(), items.end(), itemOrderLess);
}
