#pragma once

/**
 * @file stevedore_block_pool.h
 * @brief C API for BlockPool
 *
 * A pool hands out fixed-size blocks up to a capacity. allocate() blocks at
 * capacity; try_allocate() does not. Every block must be given back with
 * stevedore_block_pool_return().
 */

#include "stevedore/stevedore_operation_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Fill a config with the library defaults
 * @param config Config to initialise (required)
 */
STEVEDORE_API void stevedore_block_pool_config_init(StevedoreBlockPoolConfig* config);

/**
 * @brief Create a bounded, recycling block pool
 *
 * @param config Pool configuration, or NULL for defaults
 * @param status Error reporting (required)
 * @return Owned pool or NULL on error
 * @ownership Caller must call stevedore_block_pool_destroy()
 */
STEVEDORE_API stevedore_BlockPool stevedore_block_pool_create(
    const StevedoreBlockPoolConfig* config,
    StevedoreStatus* status
);

/**
 * @brief Create an unbounded pool that heap-allocates every block
 */
STEVEDORE_API stevedore_BlockPool stevedore_block_pool_create_pseudo(
    size_t block_size,
    StevedoreStatus* status
);

/**
 * @brief Release the caller's reference to a pool
 *
 * Sessions created with the pool keep it alive until they are destroyed.
 *
 * @param pool Pool to destroy (can be NULL)
 */
STEVEDORE_API void stevedore_block_pool_destroy(stevedore_BlockPool pool);

/**
 * @brief Allocate a block, waiting while the pool is at capacity
 * @ownership Returns owned block - must call stevedore_block_pool_return()
 * @threadsafety Thread-safe
 */
STEVEDORE_API stevedore_Block stevedore_block_pool_allocate(
    stevedore_BlockPool pool,
    StevedoreStatus* status
);

/**
 * @brief Allocate a block without waiting
 * @return Owned block, or NULL with STEVEDORE_ERR_UNAVAILABLE when at capacity
 */
STEVEDORE_API stevedore_Block stevedore_block_pool_try_allocate(
    stevedore_BlockPool pool,
    StevedoreStatus* status
);

/**
 * @brief Give a block back to the pool it came from
 *
 * The block handle is consumed on success. A block from another pool is
 * rejected with STEVEDORE_ERR_INVALID_ARG and stays owned by the caller.
 */
STEVEDORE_API void stevedore_block_pool_return(
    stevedore_BlockPool pool,
    stevedore_Block block,
    StevedoreStatus* status
);

/**
 * @brief Borrow a block's bytes
 * @param out_size Receives the block size (required)
 * @return Borrowed pointer valid until the block is returned
 */
STEVEDORE_API uint8_t* stevedore_block_data(
    stevedore_Block block,
    size_t* out_size,
    StevedoreStatus* status
);

/* Statistics */
STEVEDORE_API size_t stevedore_block_pool_block_size(stevedore_BlockPool pool, StevedoreStatus* status);
STEVEDORE_API size_t stevedore_block_pool_max_block_count(stevedore_BlockPool pool, StevedoreStatus* status);
STEVEDORE_API size_t stevedore_block_pool_blocks_allocated(stevedore_BlockPool pool, StevedoreStatus* status);
STEVEDORE_API size_t stevedore_block_pool_bytes_available(stevedore_BlockPool pool, StevedoreStatus* status);

#ifdef __cplusplus
} // extern "C"
#endif
