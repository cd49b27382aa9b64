/**
 * @file progress_registry.cpp
 * @brief Implementation of keyed progress ownership
 */

#include "progress_registry.h"
#include "../core/logging.h"
#include <set>

static const char *const TAG = "registry";

PlanProgressLease ProgressRegistry::acquirePlan(EntityId profileId, EntityId planId)
{
    // Slot lookup under the registry lock, slot lock taken after it is released
    return PlanProgressLease(planSlot(profileId, planId));
}

CycleProgressLease ProgressRegistry::acquireCycle(EntityId profileId, EntityId cycleId)
{
    return CycleProgressLease(cycleSlot(profileId, cycleId));
}

std::vector<PlanProgressLease> ProgressRegistry::acquirePlansOf(EntityId planId)
{
    std::vector<std::shared_ptr<PlanSlot> > slots;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (std::map<Key, std::shared_ptr<PlanSlot> >::const_iterator it = m_plans.begin(); it != m_plans.end(); ++it)
        {
            if (it->first.second == planId)
                slots.push_back(it->second);
        }
    }

    std::vector<PlanProgressLease> leases;
    leases.reserve(slots.size());
    for (size_t i = 0; i < slots.size(); i++)
        leases.push_back(PlanProgressLease(slots[i]));
    return leases;
}

std::vector<CycleProgressLease> ProgressRegistry::acquireCyclesOf(EntityId cycleId)
{
    std::vector<std::shared_ptr<CycleSlot> > slots;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (std::map<Key, std::shared_ptr<CycleSlot> >::const_iterator it = m_cycles.begin(); it != m_cycles.end(); ++it)
        {
            if (it->first.second == cycleId)
                slots.push_back(it->second);
        }
    }

    std::vector<CycleProgressLease> leases;
    leases.reserve(slots.size());
    for (size_t i = 0; i < slots.size(); i++)
        leases.push_back(CycleProgressLease(slots[i]));
    return leases;
}

std::vector<EntityId> ProgressRegistry::cycleIds() const
{
    std::set<EntityId> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (std::map<Key, std::shared_ptr<CycleSlot> >::const_iterator it = m_cycles.begin(); it != m_cycles.end(); ++it)
            ids.insert(it->first.second);
    }
    return std::vector<EntityId>(ids.begin(), ids.end());
}

bool ProgressRegistry::hasPlan(EntityId profileId, EntityId planId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_plans.find(Key(profileId, planId)) != m_plans.end();
}

bool ProgressRegistry::hasCycle(EntityId profileId, EntityId cycleId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cycles.find(Key(profileId, cycleId)) != m_cycles.end();
}

void ProgressRegistry::restorePlan(const PlanProgressState &state)
{
    PlanProgressLease lease = acquirePlan(state.profileId, state.planId);
    *lease = state;
    LOG_D(TAG, "Restored plan progress (profile=%lu, plan=%lu, day=%d)", (unsigned long)state.profileId,
          (unsigned long)state.planId, state.currentDayIndex);
}

void ProgressRegistry::restoreCycle(const CycleProgressState &state)
{
    CycleProgressLease lease = acquireCycle(state.profileId, state.cycleId);
    *lease = state;
    LOG_D(TAG, "Restored cycle progress (profile=%lu, cycle=%lu, item=%d, day=%d)", (unsigned long)state.profileId,
          (unsigned long)state.cycleId, state.currentItemIndex, state.currentDayIndex);
}

bool ProgressRegistry::removePlan(EntityId profileId, EntityId planId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_plans.erase(Key(profileId, planId)) > 0;
}

bool ProgressRegistry::removeCycle(EntityId profileId, EntityId cycleId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, ProfileSettings>::iterator profile = m_profiles.find(profileId);
    if (profile != m_profiles.end() && profile->second.activeCycleId == cycleId)
        profile->second.activeCycleId = INVALID_ENTITY_ID;

    return m_cycles.erase(Key(profileId, cycleId)) > 0;
}

std::vector<PlanProgressState> ProgressRegistry::planStates() const
{
    std::vector<std::shared_ptr<PlanSlot> > slots;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (std::map<Key, std::shared_ptr<PlanSlot> >::const_iterator it = m_plans.begin(); it != m_plans.end(); ++it)
            slots.push_back(it->second);
    }

    std::vector<PlanProgressState> states;
    for (size_t i = 0; i < slots.size(); i++)
    {
        std::lock_guard<std::mutex> slotLock(slots[i]->mutex);
        states.push_back(slots[i]->state);
    }
    return states;
}

std::vector<CycleProgressState> ProgressRegistry::cycleStates() const
{
    std::vector<std::shared_ptr<CycleSlot> > slots;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (std::map<Key, std::shared_ptr<CycleSlot> >::const_iterator it = m_cycles.begin(); it != m_cycles.end(); ++it)
            slots.push_back(it->second);
    }

    std::vector<CycleProgressState> states;
    for (size_t i = 0; i < slots.size(); i++)
    {
        std::lock_guard<std::mutex> slotLock(slots[i]->mutex);
        states.push_back(slots[i]->state);
    }
    return states;
}

ProfileSettings ProgressRegistry::profileSettings(EntityId profileId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<EntityId, ProfileSettings>::const_iterator it = m_profiles.find(profileId);
    return it == m_profiles.end() ? ProfileSettings() : it->second;
}

void ProgressRegistry::setExecutionMode(EntityId profileId, ExecutionMode mode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_profiles[profileId].mode = mode;
    LOG_I(TAG, "Profile %lu execution mode: %s", (unsigned long)profileId, executionModeToString(mode));
}

void ProgressRegistry::setActivePlan(EntityId profileId, EntityId planId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_profiles[profileId].activePlanId = planId;
    LOG_I(TAG, "Profile %lu active plan: %lu", (unsigned long)profileId, (unsigned long)planId);
}

void ProgressRegistry::setActiveCycle(EntityId profileId, EntityId cycleId)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ProfileSettings &settings = m_profiles[profileId];
        if (settings.activeCycleId != INVALID_ENTITY_ID && settings.activeCycleId != cycleId)
        {
            LOG_I(TAG, "Profile %lu: cycle %lu deactivated", (unsigned long)profileId,
                  (unsigned long)settings.activeCycleId);
        }
        settings.activeCycleId = cycleId;
    }

    // Ensure progress exists for the newly active cycle
    cycleSlot(profileId, cycleId);
    LOG_I(TAG, "Profile %lu active cycle: %lu", (unsigned long)profileId, (unsigned long)cycleId);
}

void ProgressRegistry::deactivateCycle(EntityId profileId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_profiles[profileId].activeCycleId = INVALID_ENTITY_ID;
}

std::shared_ptr<ProgressRegistry::PlanSlot> ProgressRegistry::planSlot(EntityId profileId, EntityId planId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::shared_ptr<PlanSlot> &slot = m_plans[Key(profileId, planId)];
    if (!slot)
    {
        slot = std::make_shared<PlanSlot>();
        slot->state = PlanProgressState(profileId, planId);
        LOG_D(TAG, "Created plan progress (profile=%lu, plan=%lu)", (unsigned long)profileId, (unsigned long)planId);
    }
    return slot;
}

std::shared_ptr<ProgressRegistry::CycleSlot> ProgressRegistry::cycleSlot(EntityId profileId, EntityId cycleId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::shared_ptr<CycleSlot> &slot = m_cycles[Key(profileId, cycleId)];
    if (!slot)
    {
        slot = std::make_shared<CycleSlot>();
        slot->state = CycleProgressState(profileId, cycleId);
        LOG_D(TAG, "Created cycle progress (profile=%lu, cycle=%lu)", (unsigned long)profileId,
              (unsigned long)cycleId);
    }
    return slot;
}
