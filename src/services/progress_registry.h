/**
 * @file progress_registry.h
 * @brief Keyed ownership of progress states with per-key mutual exclusion
 *
 * Progress is keyed by (profile, plan) and (profile, cycle); there is no
 * global "current profile". Each key has its own mutex, held by a lease for
 * as long as a transition runs, so an app-open racing a backfill for the
 * same key is serialized while different keys proceed in parallel.
 *
 * Usage:
 *   PlanProgressLease lease = registry.acquirePlan(profileId, planId);
 *   PlanProgress::handleAppOpen(store, *lease, today);
 *   // lock released when lease goes out of scope
 */

#ifndef PROGRESS_REGISTRY_H
#define PROGRESS_REGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>
#include "../core/progress_types.h"

/**
 * @struct ProfileSettings
 * @brief Program selection of one profile
 */
struct ProfileSettings
{
    ExecutionMode mode;
    EntityId activePlanId;
    EntityId activeCycleId; ///< At most one active cycle per profile

    ProfileSettings()
        : mode(MODE_SINGLE_PLAN), activePlanId(INVALID_ENTITY_ID), activeCycleId(INVALID_ENTITY_ID)
    {
    }
};

/**
 * @struct ProgressSlot
 * @brief A progress state and the mutex guarding it
 */
template <typename State>
struct ProgressSlot
{
    std::mutex mutex;
    State state;
};

/**
 * @class ProgressLease
 * @brief Exclusive, move-only access to one progress state
 *
 * Holds the slot's mutex for its whole lifetime. The slot stays alive while
 * leased even if it is removed from the registry meanwhile.
 */
template <typename State>
class ProgressLease
{
public:
    explicit ProgressLease(const std::shared_ptr<ProgressSlot<State> > &slot)
        : m_slot(slot), m_lock(slot->mutex)
    {
    }

    ProgressLease(ProgressLease &&other) = default;
    ProgressLease &operator=(ProgressLease &&other) = delete;
    ProgressLease(const ProgressLease &) = delete;
    ProgressLease &operator=(const ProgressLease &) = delete;

    State &operator*() { return m_slot->state; }
    State *operator->() { return &m_slot->state; }
    State &state() { return m_slot->state; }

private:
    // Declared before the lock so the lock is released first
    std::shared_ptr<ProgressSlot<State> > m_slot;
    std::unique_lock<std::mutex> m_lock;
};

typedef ProgressLease<PlanProgressState> PlanProgressLease;
typedef ProgressLease<CycleProgressState> CycleProgressLease;

/**
 * @class ProgressRegistry
 * @brief Owns every progress state and profile selection
 */
class ProgressRegistry
{
public:
    ProgressRegistry() = default;

    /**
     * @brief Lock and return the progress of (profile, plan), creating it lazily
     *
     * A fresh plan progress starts at day 1 with no open or completion dates.
     * Do not acquire the same key twice from one thread.
     */
    PlanProgressLease acquirePlan(EntityId profileId, EntityId planId);

    /**
     * @brief Lock and return the progress of (profile, cycle), creating it lazily at (0, 0)
     */
    CycleProgressLease acquireCycle(EntityId profileId, EntityId cycleId);

    /**
     * @brief Lock the progress of every profile following a plan
     *
     * Leases are taken in key order, so two callers locking the same plan
     * cannot deadlock. Used to hold pointers still across a plan edit.
     */
    std::vector<PlanProgressLease> acquirePlansOf(EntityId planId);
    std::vector<CycleProgressLease> acquireCyclesOf(EntityId cycleId);

    /**
     * @brief Distinct cycles that have progress, ascending
     */
    std::vector<EntityId> cycleIds() const;

    bool hasPlan(EntityId profileId, EntityId planId) const;
    bool hasCycle(EntityId profileId, EntityId cycleId) const;

    /**
     * @brief Seed a state loaded from storage, replacing any existing one
     */
    void restorePlan(const PlanProgressState &state);
    void restoreCycle(const CycleProgressState &state);

    /**
     * @brief Drop progress together with its plan or cycle
     */
    bool removePlan(EntityId profileId, EntityId planId);
    bool removeCycle(EntityId profileId, EntityId cycleId);

    /**
     * @brief Copies of all states, for persistence
     */
    std::vector<PlanProgressState> planStates() const;
    std::vector<CycleProgressState> cycleStates() const;

    // Profile selection
    ProfileSettings profileSettings(EntityId profileId) const;
    void setExecutionMode(EntityId profileId, ExecutionMode mode);
    void setActivePlan(EntityId profileId, EntityId planId);

    /**
     * @brief Make a cycle the only active one of the profile and ensure its progress exists
     */
    void setActiveCycle(EntityId profileId, EntityId cycleId);
    void deactivateCycle(EntityId profileId);

private:
    typedef std::pair<EntityId, EntityId> Key;
    typedef ProgressSlot<PlanProgressState> PlanSlot;
    typedef ProgressSlot<CycleProgressState> CycleSlot;

    std::shared_ptr<PlanSlot> planSlot(EntityId profileId, EntityId planId);
    std::shared_ptr<CycleSlot> cycleSlot(EntityId profileId, EntityId cycleId);

    // Guards the maps only; never held while a slot mutex is taken
    mutable std::mutex m_mutex;
    std::map<Key, std::shared_ptr<PlanSlot> > m_plans;
    std::map<Key, std::shared_ptr<CycleSlot> > m_cycles;
    std::map<EntityId, ProfileSettings> m_profiles;
};

#endif // PROGRESS_REGISTRY_H
