/**
 * @file storage_abstraction.cpp
 * @brief Implementation of progress persistence
 */

#include "storage_abstraction.h"
#include "../core/logging.h"
#include <stdio.h>
#include <string.h>

#if defined(ESP32)
#include <Preferences.h>
static Preferences preferences;
static const char *const STORAGE_NAMESPACE = "training";
#endif

static const char *const TAG = "storage";

// Plan record layout (little-endian):
//   0 magic u16 | 2 version u8 | 3 reserved | 4 profile u32 | 8 plan u32
//  12 dayIndex i32 | 16 lastOpened i32 | 20 lastCompleted i32
//
// Cycle record layout:
//   0 magic u16 | 2 version u8 | 3 reserved | 4 profile u32 | 8 cycle u32
//  12 itemIndex i32 | 16 dayIndex i32 | 20 lastAdvancedAt i64
//  28 lastOpened i32 | 32 lastCompleted i32

bool StorageAbstraction::begin()
{
#if defined(ESP32)
    // Preferences don't need initialization, they're opened per-operation
    return true;
#else
    LOG_W(TAG, "Storage not supported on this platform");
    return false;
#endif
}

bool StorageAbstraction::savePlanProgress(const PlanProgressState &state)
{
    uint8_t buffer[PLAN_RECORD_SIZE];
    if (encodePlanRecord(state, buffer, sizeof(buffer)) != PLAN_RECORD_SIZE)
        return false;

    char key[KEY_SIZE];
    makeKey('p', state.profileId, state.planId, key, sizeof(key));
    bool success = writeRecord(key, buffer, sizeof(buffer));
    if (success)
    {
        LOG_I(TAG, "Saved plan progress %s (day %d)", key, state.currentDayIndex);
    }
    return success;
}

bool StorageAbstraction::loadPlanProgress(EntityId profileId, EntityId planId, PlanProgressState *state)
{
    char key[KEY_SIZE];
    makeKey('p', profileId, planId, key, sizeof(key));

    uint8_t buffer[PLAN_RECORD_SIZE];
    if (!readRecord(key, buffer, sizeof(buffer)))
        return false;

    PlanProgressState loaded;
    if (!decodePlanRecord(buffer, sizeof(buffer), &loaded))
    {
        LOG_W(TAG, "Stored plan progress %s is invalid, ignoring", key);
        return false;
    }

    // Hash collision or a record written for another plan
    if (loaded.profileId != profileId || loaded.planId != planId)
    {
        LOG_W(TAG, "Stored plan progress %s belongs to profile %lu plan %lu, ignoring", key,
              (unsigned long)loaded.profileId, (unsigned long)loaded.planId);
        return false;
    }

    *state = loaded;
    LOG_I(TAG, "Loaded plan progress %s (day %d)", key, loaded.currentDayIndex);
    return true;
}

bool StorageAbstraction::saveCycleProgress(const CycleProgressState &state)
{
    uint8_t buffer[CYCLE_RECORD_SIZE];
    if (encodeCycleRecord(state, buffer, sizeof(buffer)) != CYCLE_RECORD_SIZE)
        return false;

    char key[KEY_SIZE];
    makeKey('c', state.profileId, state.cycleId, key, sizeof(key));
    bool success = writeRecord(key, buffer, sizeof(buffer));
    if (success)
    {
        LOG_I(TAG, "Saved cycle progress %s (item %d, day %d)", key, state.currentItemIndex, state.currentDayIndex);
    }
    return success;
}

bool StorageAbstraction::loadCycleProgress(EntityId profileId, EntityId cycleId, CycleProgressState *state)
{
    char key[KEY_SIZE];
    makeKey('c', profileId, cycleId, key, sizeof(key));

    uint8_t buffer[CYCLE_RECORD_SIZE];
    if (!readRecord(key, buffer, sizeof(buffer)))
        return false;

    CycleProgressState loaded;
    if (!decodeCycleRecord(buffer, sizeof(buffer), &loaded))
    {
        LOG_W(TAG, "Stored cycle progress %s is invalid, ignoring", key);
        return false;
    }

    if (loaded.profileId != profileId || loaded.cycleId != cycleId)
    {
        LOG_W(TAG, "Stored cycle progress %s belongs to profile %lu cycle %lu, ignoring", key,
              (unsigned long)loaded.profileId, (unsigned long)loaded.cycleId);
        return false;
    }

    *state = loaded;
    LOG_I(TAG, "Loaded cycle progress %s (item %d, day %d)", key, loaded.currentItemIndex, loaded.currentDayIndex);
    return true;
}

bool StorageAbstraction::clearAll()
{
#if defined(ESP32)
    preferences.begin(STORAGE_NAMESPACE, false);
    bool success = preferences.clear();
    preferences.end();
    if (success)
    {
        LOG_I(TAG, "Cleared all stored progress");
    }
    else
    {
        LOG_E(TAG, "Failed to clear stored progress");
    }
    return success;
#else
    LOG_E(TAG, "Storage not supported on this platform");
    return false;
#endif
}

size_t StorageAbstraction::encodePlanRecord(const PlanProgressState &state, uint8_t *buffer, size_t size)
{
    if (buffer == nullptr || size < PLAN_RECORD_SIZE)
        return 0;

    memset(buffer, 0, PLAN_RECORD_SIZE);
    putU16(buffer, PLAN_RECORD_MAGIC);
    buffer[2] = RECORD_VERSION;
    putU32(buffer + 4, state.profileId);
    putU32(buffer + 8, state.planId);
    putU32(buffer + 12, (uint32_t)state.currentDayIndex);
    putU32(buffer + 16, (uint32_t)state.lastOpenedDate.epochDay);
    putU32(buffer + 20, (uint32_t)state.lastCompletedDate.epochDay);
    return PLAN_RECORD_SIZE;
}

bool StorageAbstraction::decodePlanRecord(const uint8_t *buffer, size_t size, PlanProgressState *state)
{
    if (buffer == nullptr || state == nullptr || size != PLAN_RECORD_SIZE)
        return false;

    if (getU16(buffer) != PLAN_RECORD_MAGIC || buffer[2] != RECORD_VERSION)
        return false;

    EntityId profileId = getU32(buffer + 4);
    EntityId planId = getU32(buffer + 8);
    int32_t dayIndex = (int32_t)getU32(buffer + 12);
    int32_t lastOpened = (int32_t)getU32(buffer + 16);
    int32_t lastCompleted = (int32_t)getU32(buffer + 20);

    if (profileId == INVALID_ENTITY_ID || planId == INVALID_ENTITY_ID)
        return false;

    if (dayIndex < 1 || dayIndex > MAX_STORED_INDEX)
        return false;

    if (!isValidStoredDay(lastOpened) || !isValidStoredDay(lastCompleted))
        return false;

    PlanProgressState decoded(profileId, planId);
    decoded.currentDayIndex = dayIndex;
    decoded.lastOpenedDate = ProgramDay(lastOpened);
    decoded.lastCompletedDate = ProgramDay(lastCompleted);
    *state = decoded;
    return true;
}

size_t StorageAbstraction::encodeCycleRecord(const CycleProgressState &state, uint8_t *buffer, size_t size)
{
    if (buffer == nullptr || size < CYCLE_RECORD_SIZE)
        return 0;

    memset(buffer, 0, CYCLE_RECORD_SIZE);
    putU16(buffer, CYCLE_RECORD_MAGIC);
    buffer[2] = RECORD_VERSION;
    putU32(buffer + 4, state.profileId);
    putU32(buffer + 8, state.cycleId);
    putU32(buffer + 12, (uint32_t)state.currentItemIndex);
    putU32(buffer + 16, (uint32_t)state.currentDayIndex);
    putI64(buffer + 20, (int64_t)state.lastAdvancedAt);
    putU32(buffer + 28, (uint32_t)state.lastOpenedDate.epochDay);
    putU32(buffer + 32, (uint32_t)state.lastCompletedDate.epochDay);
    return CYCLE_RECORD_SIZE;
}

bool StorageAbstraction::decodeCycleRecord(const uint8_t *buffer, size_t size, CycleProgressState *state)
{
    if (buffer == nullptr || state == nullptr || size != CYCLE_RECORD_SIZE)
        return false;

    if (getU16(buffer) != CYCLE_RECORD_MAGIC || buffer[2] != RECORD_VERSION)
        return false;

    EntityId profileId = getU32(buffer + 4);
    EntityId cycleId = getU32(buffer + 8);
    int32_t itemIndex = (int32_t)getU32(buffer + 12);
    int32_t dayIndex = (int32_t)getU32(buffer + 16);
    int64_t lastAdvancedAt = getI64(buffer + 20);
    int32_t lastOpened = (int32_t)getU32(buffer + 28);
    int32_t lastCompleted = (int32_t)getU32(buffer + 32);

    if (profileId == INVALID_ENTITY_ID || cycleId == INVALID_ENTITY_ID)
        return false;

    if (itemIndex < 0 || itemIndex > MAX_STORED_INDEX || dayIndex < 0 || dayIndex > MAX_STORED_INDEX)
        return false;

    if (lastAdvancedAt < 0)
        return false;

    if (!isValidStoredDay(lastOpened) || !isValidStoredDay(lastCompleted))
        return false;

    CycleProgressState decoded(profileId, cycleId);
    decoded.currentItemIndex = itemIndex;
    decoded.currentDayIndex = dayIndex;
    decoded.lastAdvancedAt = (time_t)lastAdvancedAt;
    decoded.lastOpenedDate = ProgramDay(lastOpened);
    decoded.lastCompletedDate = ProgramDay(lastCompleted);
    *state = decoded;
    return true;
}

void StorageAbstraction::makeKey(char prefix, EntityId profileId, EntityId ownerId, char *key, size_t size)
{
    if (key == nullptr || size == 0)
        return;

    // FNV-1a over both identities, little-endian byte order
    uint32_t hash = 2166136261u;
    const EntityId ids[2] = {profileId, ownerId};
    for (int i = 0; i < 2; i++)
    {
        for (int shift = 0; shift < 32; shift += 8)
        {
            hash ^= (ids[i] >> shift) & 0xFFu;
            hash *= 16777619u;
        }
    }

    snprintf(key, size, "%c%08lx", prefix, (unsigned long)hash);
}

void StorageAbstraction::putU16(uint8_t *p, uint16_t value)
{
    p[0] = (uint8_t)(value & 0xFF);
    p[1] = (uint8_t)(value >> 8);
}

void StorageAbstraction::putU32(uint8_t *p, uint32_t value)
{
    for (int i = 0; i < 4; i++)
        p[i] = (uint8_t)((value >> (8 * i)) & 0xFF);
}

void StorageAbstraction::putI64(uint8_t *p, int64_t value)
{
    uint64_t raw = (uint64_t)value;
    for (int i = 0; i < 8; i++)
        p[i] = (uint8_t)((raw >> (8 * i)) & 0xFF);
}

uint16_t StorageAbstraction::getU16(const uint8_t *p)
{
    return (uint16_t)(p[0] | (p[1] << 8));
}

uint32_t StorageAbstraction::getU32(const uint8_t *p)
{
    uint32_t value = 0;
    for (int i = 0; i < 4; i++)
        value |= (uint32_t)p[i] << (8 * i);
    return value;
}

int64_t StorageAbstraction::getI64(const uint8_t *p)
{
    uint64_t raw = 0;
    for (int i = 0; i < 8; i++)
        raw |= (uint64_t)p[i] << (8 * i);
    return (int64_t)raw;
}

bool StorageAbstraction::isValidStoredDay(int32_t epochDay)
{
    // Unset, or a real date no earlier than 1970-01-01
    return epochDay == ProgramDay::UNSET_EPOCH_DAY || epochDay >= 0;
}

bool StorageAbstraction::writeRecord(const char *key, const uint8_t *buffer, size_t size)
{
#if defined(ESP32)
    preferences.begin(STORAGE_NAMESPACE, false); // false = read-write mode
    size_t written = preferences.putBytes(key, buffer, size);

    uint8_t readback[CYCLE_RECORD_SIZE];
    size_t read = 0;
    if (written == size && size <= sizeof(readback))
        read = preferences.getBytes(key, readback, size);
    preferences.end();

    if (written != size)
    {
        LOG_E(TAG, "Failed to save %s to Preferences", key);
        return false;
    }

    // Verify the save by reading the record back
    if (read != size || memcmp(readback, buffer, size) != 0)
    {
        LOG_E(TAG, "✗ Verification FAILED for %s", key);
        return false;
    }

    LOG_D(TAG, "✓ Verification PASSED for %s", key);
    return true;
#else
    (void)buffer;
    (void)size;
    LOG_E(TAG, "Cannot save %s: storage not supported on this platform", key);
    return false;
#endif
}

bool StorageAbstraction::readRecord(const char *key, uint8_t *buffer, size_t size)
{
#if defined(ESP32)
    preferences.begin(STORAGE_NAMESPACE, true); // true = read-only mode
    size_t stored = preferences.getBytesLength(key);
    size_t read = 0;
    if (stored == size)
        read = preferences.getBytes(key, buffer, size);
    preferences.end();

    if (stored == 0)
    {
        LOG_D(TAG, "No stored record for %s", key);
        return false;
    }

    if (read != size)
    {
        LOG_W(TAG, "Stored record %s has size %u, expected %u", key, (unsigned)stored, (unsigned)size);
        return false;
    }
    return true;
#else
    (void)buffer;
    (void)size;
    LOG_D(TAG, "Cannot load %s: storage not supported on this platform", key);
    return false;
#endif
}
