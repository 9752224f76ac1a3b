#pragma once

/**
 * @file stevedore_operation.h
 * @brief C API for file operations
 *
 * Build an operation against a session, then estimate and run it. Failures
 * of estimate/run/assert_successful are reported through the status
 * out-parameter; the operation's state stays queryable afterwards.
 *
 * @code
 * StevedoreStatus st;
 * stevedore_Operation op = stevedore_copy_file_create(session, mem, "a.bin", mem, "b.bin", NULL, &st);
 * stevedore_operation_run(op, STEVEDORE_TRUE, &st);
 * if (st != STEVEDORE_OK) {
 *     // op has been rolled back where possible
 * }
 * stevedore_operation_destroy(op);
 * @endcode
 */

#include "stevedore/stevedore_operation_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Construction - policy may be NULL (all fields unset)
 * ============================================================================ */

STEVEDORE_API stevedore_Operation stevedore_create_directory_create(
    stevedore_OperationSession session,
    stevedore_Backend backend,
    const char* path,
    const StevedorePolicy* policy,
    StevedoreStatus* status
);

STEVEDORE_API stevedore_Operation stevedore_delete_create(
    stevedore_OperationSession session,
    stevedore_Backend backend,
    const char* path,
    StevedoreBool recursive,
    const StevedorePolicy* policy,
    StevedoreStatus* status
);

/**
 * @brief Same-backend rename
 * @return NULL with STEVEDORE_ERR_INVALID_ARG if the backends differ
 */
STEVEDORE_API stevedore_Operation stevedore_move_create(
    stevedore_OperationSession session,
    stevedore_Backend src_backend,
    const char* src_path,
    stevedore_Backend dst_backend,
    const char* dst_path,
    const StevedorePolicy* policy,
    StevedoreStatus* status
);

STEVEDORE_API stevedore_Operation stevedore_copy_file_create(
    stevedore_OperationSession session,
    stevedore_Backend src_backend,
    const char* src_path,
    stevedore_Backend dst_backend,
    const char* dst_path,
    const StevedorePolicy* policy,
    StevedoreStatus* status
);

STEVEDORE_API stevedore_Operation stevedore_copy_tree_create(
    stevedore_OperationSession session,
    stevedore_Backend src_backend,
    const char* src_path,
    stevedore_Backend dst_backend,
    const char* dst_path,
    const StevedorePolicy* policy,
    StevedoreStatus* status
);

STEVEDORE_API stevedore_Operation stevedore_delete_tree_create(
    stevedore_OperationSession session,
    stevedore_Backend backend,
    const char* path,
    const StevedorePolicy* policy,
    StevedoreStatus* status
);

STEVEDORE_API stevedore_Operation stevedore_transfer_tree_create(
    stevedore_OperationSession session,
    stevedore_Backend src_backend,
    const char* src_path,
    stevedore_Backend dst_backend,
    const char* dst_path,
    const StevedorePolicy* policy,
    StevedoreStatus* status
);

/**
 * @param op Operation to destroy (can be NULL)
 */
STEVEDORE_API void stevedore_operation_destroy(stevedore_Operation op);

/* ============================================================================
 * Execution
 * ============================================================================ */

STEVEDORE_API void stevedore_operation_estimate(stevedore_Operation op, StevedoreStatus* status);

/**
 * @brief Run the operation (estimating first if needed)
 * @param rollback_on_error Undo partial work before reporting a failure
 */
STEVEDORE_API void stevedore_operation_run(
    stevedore_Operation op,
    StevedoreBool rollback_on_error,
    StevedoreStatus* status
);

/**
 * @brief Build the inverse operation
 * @return Owned operation, or NULL with STEVEDORE_OK when nothing can be undone
 */
STEVEDORE_API stevedore_Operation stevedore_operation_create_rollback(
    stevedore_Operation op,
    StevedoreStatus* status
);

/**
 * @brief STEVEDORE_OK if the operation Completed or was Skipped
 *
 * STEVEDORE_ERR_CANCELLED when cancelled, STEVEDORE_ERR_INVALID_STATE when
 * not finished, otherwise the status of the recorded failure.
 */
STEVEDORE_API void stevedore_operation_assert_successful(stevedore_Operation op, StevedoreStatus* status);

/* ============================================================================
 * Queries
 * ============================================================================ */

STEVEDORE_API StevedoreOperationState stevedore_operation_state(stevedore_Operation op, StevedoreStatus* status);
STEVEDORE_API int64_t stevedore_operation_progress(stevedore_Operation op, StevedoreStatus* status);
STEVEDORE_API int64_t stevedore_operation_total_length(stevedore_Operation op, StevedoreStatus* status);
STEVEDORE_API StevedoreBool stevedore_operation_can_rollback(stevedore_Operation op, StevedoreStatus* status);

/**
 * @brief Number of direct children (composite operations), 0 for leaves
 */
STEVEDORE_API size_t stevedore_operation_child_count(stevedore_Operation op, StevedoreStatus* status);

/**
 * @brief Static name of a state, e.g. "Completed"
 */
STEVEDORE_API const char* stevedore_operation_state_to_string(StevedoreOperationState state);

#ifdef __cplusplus
} // extern "C"
#endif
