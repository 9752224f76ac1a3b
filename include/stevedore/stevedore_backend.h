#pragma once

/**
 * @file stevedore_backend.h
 * @brief C API for filesystem backends
 *
 * Backends are the storage operations act on. Two are available from C: an
 * in-memory tree (with an optional space quota) and the host filesystem.
 */

#include "stevedore/stevedore_operation_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Create an in-memory backend
 *
 * @param block_size Accounting granularity in bytes (0 for the default)
 * @param max_space Quota over stored bytes (0 for unlimited)
 * @param status Error reporting (required)
 * @return Owned backend or NULL on error
 * @ownership Caller must call stevedore_backend_destroy()
 */
STEVEDORE_API stevedore_Backend stevedore_backend_create_memory(
    size_t block_size,
    uint64_t max_space,
    StevedoreStatus* status
);

/**
 * @brief Create a backend over the host filesystem
 */
STEVEDORE_API stevedore_Backend stevedore_backend_create_local(StevedoreStatus* status);

/**
 * @brief Release the caller's reference (operations keep the backend alive)
 * @param backend Backend to destroy (can be NULL)
 */
STEVEDORE_API void stevedore_backend_destroy(stevedore_Backend backend);

/**
 * @brief Write a whole file, replacing any existing content
 *
 * Parent directories are not created.
 */
STEVEDORE_API void stevedore_backend_write_file(
    stevedore_Backend backend,
    const char* path,
    const uint8_t* data,
    size_t size,
    StevedoreStatus* status
);

/**
 * @brief Read a whole file into a caller buffer
 *
 * Pass buffer = NULL to query the size. If the buffer is too small the size
 * is still reported and STEVEDORE_ERR_BUFFER_TOO_SMALL is returned.
 *
 * @param out_size Receives the file size (required)
 */
STEVEDORE_API void stevedore_backend_read_file(
    stevedore_Backend backend,
    const char* path,
    uint8_t* buffer,
    size_t buffer_size,
    size_t* out_size,
    StevedoreStatus* status
);

/**
 * @brief Create a single directory (parent must exist)
 */
STEVEDORE_API void stevedore_backend_create_directory(
    stevedore_Backend backend,
    const char* path,
    StevedoreStatus* status
);

STEVEDORE_API StevedoreBool stevedore_backend_exists(
    stevedore_Backend backend,
    const char* path,
    StevedoreStatus* status
);

#ifdef __cplusplus
} // extern "C"
#endif
