/**
 * @file stevedore_backend_c.cpp
 * @brief Implementation of backend C API
 */

#include <cstring>
#include <span>

#include "stevedore/stevedore_backend.h"
#include "stevedore_c_support.h"
#include "VirtualFileSystem/LocalFileSystemBackend.h"
#include "VirtualFileSystem/MemoryFileSystemBackend.h"

using namespace Stevedore::Core;
using namespace Stevedore::Core::IO;
using Stevedore::Core::CApi::translate_exception;

extern "C" {

stevedore_Backend stevedore_backend_create_memory(size_t block_size, uint64_t max_space, StevedoreStatus* status) {
    if (!status) return nullptr;

    try {
        MemoryFileSystemBackend::Config cfg;
        if (block_size != 0) cfg.blockSize = block_size;
        if (max_space != 0) cfg.maxSpace = max_space;
        auto* wrapper = new stevedore_Backend_t{std::make_shared<MemoryFileSystemBackend>(cfg)};
        *status = STEVEDORE_OK;
        return wrapper;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

stevedore_Backend stevedore_backend_create_local(StevedoreStatus* status) {
    if (!status) return nullptr;

    try {
        auto* wrapper = new stevedore_Backend_t{std::make_shared<LocalFileSystemBackend>()};
        *status = STEVEDORE_OK;
        return wrapper;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void stevedore_backend_destroy(stevedore_Backend backend) {
    delete backend;
}

void stevedore_backend_write_file(stevedore_Backend backend, const char* path, const uint8_t* data, size_t size,
                                  StevedoreStatus* status) {
    if (!status) return;
    if (!backend || !path || (!data && size > 0)) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }

    try {
        std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(data), size);
        WriteOptions opts;
        opts.truncate = true;
        throwIfFailed(backend->backend->writeFile(path, bytes, opts), "writeFile");
        *status = STEVEDORE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void stevedore_backend_read_file(stevedore_Backend backend, const char* path, uint8_t* buffer, size_t buffer_size,
                                 size_t* out_size, StevedoreStatus* status) {
    if (!status) return;
    if (!backend || !path || !out_size) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }

    try {
        auto handle = backend->backend->readFile(path);
        throwIfFailed(handle, "readFile");
        auto bytes = handle.contentsBytes();
        *out_size = bytes.size();
        if (!buffer) {
            *status = STEVEDORE_OK;
            return;
        }
        if (buffer_size < bytes.size()) {
            *status = STEVEDORE_ERR_BUFFER_TOO_SMALL;
            return;
        }
        if (!bytes.empty()) std::memcpy(buffer, bytes.data(), bytes.size());
        *status = STEVEDORE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

void stevedore_backend_create_directory(stevedore_Backend backend, const char* path, StevedoreStatus* status) {
    if (!status) return;
    if (!backend || !path) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }

    try {
        throwIfFailed(backend->backend->createDirectory(path), "createDirectory");
        *status = STEVEDORE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

StevedoreBool stevedore_backend_exists(stevedore_Backend backend, const char* path, StevedoreStatus* status) {
    if (!status) return STEVEDORE_FALSE;
    if (!backend || !path) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return STEVEDORE_FALSE;
    }

    try {
        const bool found = backend->backend->exists(path);
        *status = STEVEDORE_OK;
        return CApi::to_c_bool(found);
    } catch (...) {
        translate_exception(status);
        return STEVEDORE_FALSE;
    }
}

} // extern "C"
