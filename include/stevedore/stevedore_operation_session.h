#pragma once

/**
 * @file stevedore_operation_session.h
 * @brief C API for OperationSession
 *
 * A session carries the default policy, the cancellation signal, the event
 * log and the block pool for every operation built against it.
 */

#include "stevedore/stevedore_operation_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Fill a policy with the library's session defaults
 *
 * Source skip, destination throw, omit mounted packages, log and dispatch events.
 */
STEVEDORE_API void stevedore_policy_defaults(StevedorePolicy* policy);

/**
 * @brief Create a session
 *
 * @param policy Default policy, or NULL for stevedore_policy_defaults()
 * @param pool Block pool for streaming copies, or NULL for an unbounded pool
 * @param progress_interval Bytes between Progress events (0 disables them, negative for the default)
 * @param status Error reporting (required)
 * @return Owned session or NULL on error
 * @ownership Caller must call stevedore_operation_session_destroy()
 */
STEVEDORE_API stevedore_OperationSession stevedore_operation_session_create(
    const StevedorePolicy* policy,
    stevedore_BlockPool pool,
    int64_t progress_interval,
    StevedoreStatus* status
);

/**
 * @brief Release the caller's reference
 *
 * Operations created from the session keep it alive. The session is
 * disposed (cancelled, observers completed) when the last reference goes.
 *
 * @param session Session to destroy (can be NULL)
 */
STEVEDORE_API void stevedore_operation_session_destroy(stevedore_OperationSession session);

/**
 * @brief Request cancellation of every operation in the session
 * @threadsafety Thread-safe
 */
STEVEDORE_API void stevedore_operation_session_cancel(
    stevedore_OperationSession session,
    StevedoreStatus* status
);

STEVEDORE_API StevedoreBool stevedore_operation_session_is_cancelled(
    stevedore_OperationSession session,
    StevedoreStatus* status
);

/**
 * @brief Number of events recorded in the session log so far
 */
STEVEDORE_API size_t stevedore_operation_session_event_count(
    stevedore_OperationSession session,
    StevedoreStatus* status
);

#ifdef __cplusplus
} // extern "C"
#endif
