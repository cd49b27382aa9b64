/**
 * @file storage_abstraction.h
 * @brief Platform-independent persistent storage for progress states
 *
 * Progress states are stored as small fixed-size little-endian records with
 * a magic number and a format version. The encode/decode helpers are pure,
 * so the validation rules are the same on every platform and can be unit
 * tested on the host. The platform branch only moves the bytes.
 *
 * Backends:
 * - ESP32: Preferences (NVS), namespace "training"
 * - Anything else: not supported, save/load report failure
 */

#ifndef STORAGE_ABSTRACTION_H
#define STORAGE_ABSTRACTION_H

#include <stddef.h>
#include <stdint.h>
#include "../core/progress_types.h"

/**
 * @class StorageAbstraction
 * @brief Unified storage interface for progress persistence
 */
class StorageAbstraction
{
public:
    static const uint16_t PLAN_RECORD_MAGIC = 0x5052;  // "PR"
    static const uint16_t CYCLE_RECORD_MAGIC = 0x4352; // "CR"
    static const uint8_t RECORD_VERSION = 1;
    static const size_t PLAN_RECORD_SIZE = 24;
    static const size_t CYCLE_RECORD_SIZE = 36;
    static const int32_t MAX_STORED_INDEX = 9999;
    static const size_t KEY_SIZE = 16; // NVS keys are limited to 15 characters

    /**
     * @brief Initialize the storage system
     *
     * Must be called once during setup before any read/write operations.
     *
     * @return true if initialization succeeded, false on error
     */
    static bool begin();

    /**
     * @brief Save single-plan progress
     *
     * The record is read back after writing and compared byte for byte.
     *
     * @return true if save and verification succeeded
     */
    static bool savePlanProgress(const PlanProgressState &state);

    /**
     * @brief Load single-plan progress
     *
     * @param state Output, untouched unless true is returned
     * @return true if a valid record for (profileId, planId) was found
     */
    static bool loadPlanProgress(EntityId profileId, EntityId planId, PlanProgressState *state);

    static bool saveCycleProgress(const CycleProgressState &state);
    static bool loadCycleProgress(EntityId profileId, EntityId cycleId, CycleProgressState *state);

    /**
     * @brief Clear all storage (factory reset)
     *
     * Erases all stored progress. Use with caution as this cannot be undone.
     *
     * @return true if clear succeeded, false on error
     */
    static bool clearAll();

    // ------------------------------------------------------------------
    // Record format (platform independent)
    // ------------------------------------------------------------------

    /**
     * @brief Serialize a plan progress state
     * @return Bytes written, 0 if the buffer is too small
     */
    static size_t encodePlanRecord(const PlanProgressState &state, uint8_t *buffer, size_t size);

    /**
     * @brief Parse and validate a plan progress record
     *
     * Rejects a wrong size, magic or version, null identities and pointers
     * outside the sane range.
     */
    static bool decodePlanRecord(const uint8_t *buffer, size_t size, PlanProgressState *state);

    static size_t encodeCycleRecord(const CycleProgressState &state, uint8_t *buffer, size_t size);
    static bool decodeCycleRecord(const uint8_t *buffer, size_t size, CycleProgressState *state);

    /**
     * @brief Storage key for a (profile, plan-or-cycle) pair
     *
     * Prefix character plus the FNV-1a hash of both identities, e.g. "p1a2b3c4d".
     */
    static void makeKey(char prefix, EntityId profileId, EntityId ownerId, char *key, size_t size);

private:
    static void putU16(uint8_t *p, uint16_t value);
    static void putU32(uint8_t *p, uint32_t value);
    static void putI64(uint8_t *p, int64_t value);
    static uint16_t getU16(const uint8_t *p);
    static uint32_t getU32(const uint8_t *p);
    static int64_t getI64(const uint8_t *p);
    static bool isValidStoredDay(int32_t epochDay);

    static bool writeRecord(const char *key, const uint8_t *buffer, size_t size);
    static bool readRecord(const char *key, uint8_t *buffer, size_t size);

    // Private constructor - this is a static-only utility class
    StorageAbstraction() = delete;
};

#endif // STORAGE_ABSTRACTION_H
