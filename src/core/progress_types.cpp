/**
 * @file progress_types.cpp
 * @brief String conversions for progress enums
 */

#include "progress_types.h"

const char *progressErrorToString(ProgressError error)
{
    switch (error)
    {
    case PROGRESS_OK:
        return "ok";
    case PROGRESS_PLAN_NOT_FOUND:
        return "plan not found";
    case PROGRESS_EMPTY_PLAN:
        return "plan has no days";
    case PROGRESS_CYCLE_NOT_FOUND:
        return "cycle not found";
    case PROGRESS_CYCLE_EMPTY:
        return "cycle has no items";
    case PROGRESS_NO_VALID_PLAN:
        return "no cycle item has a non-empty plan";
    case PROGRESS_DAY_NOT_FOUND:
        return "day not found";
    case PROGRESS_DAY_IN_PROGRESS:
        return "today's workout already has completed sets";
    case PROGRESS_MATERIALIZE_FAILED:
        return "could not materialize day";
    case PROGRESS_NOT_CONFIGURED:
        return "no active plan or cycle configured";
    case PROGRESS_TIME_NOT_SYNCED:
        return "time not synchronized";
    }
    return "unknown";
}

const char *transitionResultToString(TransitionResult result)
{
    switch (result)
    {
    case TRANSITION_ADVANCED:
        return "advanced";
    case TRANSITION_NO_OP:
        return "no-op";
    case TRANSITION_INVALID:
        return "invalid";
    }
    return "unknown";
}

const char *executionModeToString(ExecutionMode mode)
{
    return mode == MODE_CYCLE ? "cycle" : "single-plan";
}
