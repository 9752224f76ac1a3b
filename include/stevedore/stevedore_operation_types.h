#pragma once

/**
 * @file stevedore_operation_types.h
 * @brief Type definitions for the operations C API
 *
 * Opaque handles, enums and POD structs shared by the block pool, backend,
 * session and operation headers. Follows the hourglass pattern: stable C
 * ABI over the C++ implementation.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/stevedore_c_api.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Enumerations
 * ============================================================================ */

/**
 * @brief Lifecycle state of an operation
 */
typedef enum StevedoreOperationState
{
    STEVEDORE_OP_INITIALIZED = 0,
    STEVEDORE_OP_ESTIMATING = 1,
    STEVEDORE_OP_ESTIMATED = 2,
    STEVEDORE_OP_RUNNING = 3,
    STEVEDORE_OP_COMPLETED = 4,
    STEVEDORE_OP_SKIPPED = 5,
    STEVEDORE_OP_CANCELLED = 6,
    STEVEDORE_OP_ERROR = 7
} StevedoreOperationState;

typedef enum StevedoreSourcePolicy
{
    STEVEDORE_SRC_UNSET = 0,
    STEVEDORE_SRC_THROW = 1,  /**< Missing source fails the operation */
    STEVEDORE_SRC_SKIP = 2    /**< Missing source skips the operation */
} StevedoreSourcePolicy;

typedef enum StevedoreDestinationPolicy
{
    STEVEDORE_DST_UNSET = 0,
    STEVEDORE_DST_THROW = 1,
    STEVEDORE_DST_SKIP = 2,
    STEVEDORE_DST_OVERWRITE = 3
} StevedoreDestinationPolicy;

typedef enum StevedoreEstimatePolicy
{
    STEVEDORE_ESTIMATE_UNSET = 0,
    STEVEDORE_ESTIMATE_EAGER = 1,
    STEVEDORE_ESTIMATE_ON_RUN = 2,
    STEVEDORE_ESTIMATE_RE_ESTIMATE_ON_RUN = 3
} StevedoreEstimatePolicy;

typedef enum StevedoreRollbackPolicy
{
    STEVEDORE_ROLLBACK_UNSET = 0,
    STEVEDORE_ROLLBACK_OFFER = 1,
    STEVEDORE_ROLLBACK_NEVER = 2
} StevedoreRollbackPolicy;

/* ============================================================================
 * Opaque Handle Types
 * ============================================================================ */

/** @brief Fixed-size block allocator shared by streaming copies */
typedef struct stevedore_BlockPool_t* stevedore_BlockPool;

/** @brief One block allocated from a pool; owned until returned */
typedef struct stevedore_Block_t* stevedore_Block;

/** @brief Filesystem backend (memory or local) */
typedef struct stevedore_Backend_t* stevedore_Backend;

/** @brief Shared execution context for a group of operations */
typedef struct stevedore_OperationSession_t* stevedore_OperationSession;

/** @brief A leaf or composite file operation */
typedef struct stevedore_Operation_t* stevedore_Operation;

/* ============================================================================
 * Configuration Structures
 * ============================================================================ */

/**
 * @brief Operation policy
 *
 * Zero-initialised means "all unset", which defers every field to the
 * session default.
 */
typedef struct StevedorePolicy
{
    StevedoreSourcePolicy source;
    StevedoreDestinationPolicy destination;
    StevedoreEstimatePolicy estimate;
    StevedoreRollbackPolicy rollback;
    StevedoreBool cancel_on_error;
    StevedoreBool omit_mounted_packages;
    StevedoreBool batch_continue_on_error;
    StevedoreBool suppress_exceptions;
    StevedoreBool log_events;
    StevedoreBool dispatch_events;
} StevedorePolicy;

/**
 * @brief Block pool configuration
 */
typedef struct StevedoreBlockPoolConfig
{
    size_t block_size;              /**< Bytes per block */
    size_t max_block_count;         /**< Capacity in blocks */
    size_t max_recycle_queue;       /**< Returned blocks kept for reuse */
    StevedoreBool clears_recycled_blocks;
} StevedoreBlockPoolConfig;

#ifdef __cplusplus
} // extern "C"
#endif
