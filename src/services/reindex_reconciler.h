/**
 * @file reindex_reconciler.h
 * @brief Keeps positional progress pointers attached to the same day or item
 *
 * Progress pointers are positions, but positions drift when days or items are
 * inserted, removed or reordered. The reconciler works in two phases:
 *
 *   1. capture: remember the identity the pointer resolves to right now
 *   2. restore: after the edit, re-densify the list and point at the new
 *      position of that identity, or clamp into range if it was deleted
 *
 * Single-plan pointers are 1-indexed day positions. Cycle pointers are
 * 0-indexed into the ordered items and into the item plan's ordered days.
 */

#ifndef REINDEX_RECONCILER_H
#define REINDEX_RECONCILER_H

#include <vector>
#include "../core/progress_types.h"
#include "../adapters/plan_store.h"

/**
 * @struct DayAnchor
 * @brief Identity of the day a pointer resolved to before an edit
 */
struct DayAnchor
{
    EntityId dayId; ///< INVALID_ENTITY_ID if the pointer resolved to nothing
    int oldIndex;
};

/**
 * @struct CycleAnchor
 * @brief Identities of the item and day a cycle pointer resolved to
 */
struct CycleAnchor
{
    EntityId itemId;
    EntityId planId;
    int oldItemIndex;
    DayAnchor day;
};

/**
 * @class ReindexReconciler
 * @brief Identity-based re-resolution of progress pointers
 */
class ReindexReconciler
{
public:
    // ------------------------------------------------------------------
    // Lookups on ordered lists
    // ------------------------------------------------------------------

    /**
     * @brief Day whose position equals a 1-indexed pointer
     * @return nullptr if no day has that position
     */
    static const PlanDayInfo *dayAtPosition(const std::vector<PlanDayInfo> &days, int position);

    /**
     * @brief 1-indexed position of a day identity
     * @return NO_DAY_INDEX if the day is not part of the list
     */
    static int positionOfDay(const std::vector<PlanDayInfo> &days, EntityId dayId);

    /**
     * @brief 0-indexed slot of a day identity in the ordered list, -1 if absent
     */
    static int slotOfDay(const std::vector<PlanDayInfo> &days, EntityId dayId);

    /**
     * @brief 0-indexed slot of an item identity in the ordered list, -1 if absent
     */
    static int slotOfItem(const std::vector<CycleItemInfo> &items, EntityId itemId);

    // ------------------------------------------------------------------
    // Pure capture / resolve
    // ------------------------------------------------------------------

    static DayAnchor captureDayAnchor(const std::vector<PlanDayInfo> &days, int currentDayIndex);

    /**
     * @brief New 1-indexed pointer for a captured single-plan anchor
     *
     * Position of the anchored day if it survived, otherwise
     * max(1, min(oldIndex, totalDays)). NO_DAY_INDEX for an empty plan.
     */
    static int resolveDayIndex(const std::vector<PlanDayInfo> &days, const DayAnchor &anchor);

    static DayAnchor captureCycleDayAnchor(const std::vector<PlanDayInfo> &days, int currentDayIndex);

    /**
     * @brief New 0-indexed day pointer, clamped to [0, totalDays-1] (0 when empty)
     */
    static int resolveCycleDayIndex(const std::vector<PlanDayInfo> &days, const DayAnchor &anchor);

    /**
     * @brief New 0-indexed item pointer, clamped to [0, totalItems-1] (0 when empty)
     */
    static int resolveItemIndex(const std::vector<CycleItemInfo> &items, EntityId itemId, int oldItemIndex);

    // ------------------------------------------------------------------
    // Store-level reconciliation
    // ------------------------------------------------------------------

    static DayAnchor capturePlanAnchor(const IPlanStore &store, const PlanProgressState &state);

    /**
     * @brief Re-densify the plan and re-resolve the pointer from the anchor
     * @return true if currentDayIndex changed
     */
    static bool restorePlanPointer(IPlanStore &store, PlanProgressState &state, const DayAnchor &anchor);

    static CycleAnchor captureCycleAnchor(const IPlanStore &store, const CycleProgressState &state);

    /**
     * @brief Re-densify the cycle (and the current item's plan) and re-resolve both pointers
     * @return true if either pointer changed
     */
    static bool restoreCyclePointer(IPlanStore &store, CycleProgressState &state, const CycleAnchor &anchor);

    /**
     * @brief Capture + re-densify + restore in one step
     *
     * Run before reading the current day. Deleted days leave gaps, so the
     * anchor still finds the right day even when the edit already happened.
     */
    static bool reindexPlan(IPlanStore &store, PlanProgressState &state);

    static bool reindexCycle(IPlanStore &store, CycleProgressState &state);

private:
    static int clamp(int value, int low, int high);

    // Private constructor - static-only class
    ReindexReconciler() = delete;
};

#endif // REINDEX_RECONCILER_H
