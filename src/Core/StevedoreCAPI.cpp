/*
 * C API bridge for the Stevedore core
 */

#include "stevedore_c_api.h"

extern "C" {

STEVEDORE_API void stevedore_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi) {
    if (major) *major = 1;
    if (minor) *minor = 0;
    if (patch) *patch = 0;
    if (abi) *abi = 0;
}

STEVEDORE_API const char* stevedore_status_to_string(StevedoreStatus s) {
    switch (s) {
        case STEVEDORE_OK:
            return "STEVEDORE_OK";
        case STEVEDORE_ERR_UNKNOWN:
            return "STEVEDORE_ERR_UNKNOWN";
        case STEVEDORE_ERR_INVALID_ARG:
            return "STEVEDORE_ERR_INVALID_ARG";
        case STEVEDORE_ERR_NOT_FOUND:
            return "STEVEDORE_ERR_NOT_FOUND";
        case STEVEDORE_ERR_TYPE_MISMATCH:
            return "STEVEDORE_ERR_TYPE_MISMATCH";
        case STEVEDORE_ERR_BUFFER_TOO_SMALL:
            return "STEVEDORE_ERR_BUFFER_TOO_SMALL";
        case STEVEDORE_ERR_NO_MEMORY:
            return "STEVEDORE_ERR_NO_MEMORY";
        case STEVEDORE_ERR_UNAVAILABLE:
            return "STEVEDORE_ERR_UNAVAILABLE";
        case STEVEDORE_ERR_ALREADY_EXISTS:
            return "STEVEDORE_ERR_ALREADY_EXISTS";
        case STEVEDORE_ERR_NOT_SUPPORTED:
            return "STEVEDORE_ERR_NOT_SUPPORTED";
        case STEVEDORE_ERR_CANCELLED:
            return "STEVEDORE_ERR_CANCELLED";
        case STEVEDORE_ERR_IO:
            return "STEVEDORE_ERR_IO";
        case STEVEDORE_ERR_DISK_FULL:
            return "STEVEDORE_ERR_DISK_FULL";
        case STEVEDORE_ERR_INVALID_STATE:
            return "STEVEDORE_ERR_INVALID_STATE";
        case STEVEDORE_ERR_AGGREGATE:
            return "STEVEDORE_ERR_AGGREGATE";
        default:
            return "STEVEDORE_STATUS_UNKNOWN";
    }
}

} // extern "C"
