#pragma once

// C ABI for the Stevedore core: status codes, booleans and library info.
// This header is C-compatible and can be consumed by C, Rust, C#, etc.

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(STEVEDORE_SHARED)
    #if defined(STEVEDORE_BUILDING)
      #define STEVEDORE_API __declspec(dllexport)
    #else
      #define STEVEDORE_API __declspec(dllimport)
    #endif
  #else
    #define STEVEDORE_API
  #endif
#else
  #if defined(STEVEDORE_SHARED)
    #define STEVEDORE_API __attribute__((visibility("default")))
  #else
    #define STEVEDORE_API
  #endif
#endif

// Status codes for C API functions
typedef enum StevedoreStatus {
    STEVEDORE_OK = 0,
    STEVEDORE_ERR_UNKNOWN = 1,
    STEVEDORE_ERR_INVALID_ARG = 2,
    STEVEDORE_ERR_NOT_FOUND = 3,
    STEVEDORE_ERR_TYPE_MISMATCH = 4,
    STEVEDORE_ERR_BUFFER_TOO_SMALL = 5,
    STEVEDORE_ERR_NO_MEMORY = 6,
    STEVEDORE_ERR_UNAVAILABLE = 7,
    STEVEDORE_ERR_ALREADY_EXISTS = 8,   // destination collision
    STEVEDORE_ERR_NOT_SUPPORTED = 9,    // backend lacks a capability
    STEVEDORE_ERR_CANCELLED = 10,       // session cancellation observed
    STEVEDORE_ERR_IO = 11,
    STEVEDORE_ERR_DISK_FULL = 12,       // out of space, or no buffer for a write
    STEVEDORE_ERR_INVALID_STATE = 13,   // call not valid in the object's current state
    STEVEDORE_ERR_AGGREGATE = 14        // several child operations failed
} StevedoreStatus;

// Booleans (explicit, stable width across languages)
typedef int32_t StevedoreBool; // 0 = false, non-zero = true
#define STEVEDORE_FALSE 0
#define STEVEDORE_TRUE  1

// Library/version ------------------------------------------------------------
STEVEDORE_API void stevedore_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi);

// Convenience/diagnostics ----------------------------------------------------
STEVEDORE_API const char* stevedore_status_to_string(StevedoreStatus s); // static string, no free

#ifdef __cplusplus
} // extern "C"
#endif
