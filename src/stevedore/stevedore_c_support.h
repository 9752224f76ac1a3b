/**
 * @file stevedore_c_support.h
 * @brief Internal glue shared by the C API translation units
 *
 * Defines the structs behind the opaque C handles and the exception to
 * status translation. Not installed; C callers never see this header.
 */

#pragma once

#include <memory>
#include <new>
#include <stdexcept>

#include "Memory/IBlockPool.h"
#include "Operations/Operation.h"
#include "Operations/OperationErrors.h"
#include "Operations/OperationPolicy.h"
#include "Operations/OperationSession.h"
#include "VirtualFileSystem/FileSystemException.h"
#include "VirtualFileSystem/IFileSystemBackend.h"
#include "stevedore/stevedore_operation_types.h"

struct stevedore_BlockPool_t {
    std::shared_ptr<Stevedore::Core::Memory::IBlockPool> pool;
};

struct stevedore_Block_t {
    Stevedore::Core::Memory::Block block;
};

struct stevedore_Backend_t {
    std::shared_ptr<Stevedore::Core::IO::IFileSystemBackend> backend;
};

struct stevedore_OperationSession_t {
    std::shared_ptr<Stevedore::Core::Operations::OperationSession> session;
};

struct stevedore_Operation_t {
    std::shared_ptr<Stevedore::Core::Operations::Operation> op;
};

namespace Stevedore::Core::CApi {

inline StevedoreStatus to_c_status(IO::FileError e) {
    switch (e) {
        case IO::FileError::None:          return STEVEDORE_OK;
        case IO::FileError::FileNotFound:  return STEVEDORE_ERR_NOT_FOUND;
        case IO::FileError::AlreadyExists: return STEVEDORE_ERR_ALREADY_EXISTS;
        case IO::FileError::NotSupported:  return STEVEDORE_ERR_NOT_SUPPORTED;
        case IO::FileError::DiskFull:      return STEVEDORE_ERR_DISK_FULL;
        case IO::FileError::InvalidPath:   return STEVEDORE_ERR_INVALID_ARG;
        case IO::FileError::Unknown:       return STEVEDORE_ERR_UNKNOWN;
        default:                           return STEVEDORE_ERR_IO;
    }
}

// Maps the in-flight exception to a status; call only from inside a catch block
inline void translate_exception(StevedoreStatus* status) {
    try {
        throw;
    } catch (const std::bad_alloc&) {
        if (status) *status = STEVEDORE_ERR_NO_MEMORY;
    } catch (const IO::FileSystemException& e) {
        if (status) *status = to_c_status(e.code());
    } catch (const Operations::OperationCancelledException&) {
        if (status) *status = STEVEDORE_ERR_CANCELLED;
    } catch (const Operations::AggregateException&) {
        if (status) *status = STEVEDORE_ERR_AGGREGATE;
    } catch (const std::invalid_argument&) {
        if (status) *status = STEVEDORE_ERR_INVALID_ARG;
    } catch (const std::logic_error&) {
        if (status) *status = STEVEDORE_ERR_INVALID_STATE;
    } catch (...) {
        if (status) *status = STEVEDORE_ERR_UNKNOWN;
    }
}

inline StevedoreBool to_c_bool(bool b) {
    return b ? STEVEDORE_TRUE : STEVEDORE_FALSE;
}

Operations::OperationPolicy to_cpp_policy(const StevedorePolicy* policy);
void to_c_policy(const Operations::OperationPolicy& policy, StevedorePolicy* out);

} // namespace Stevedore::Core::CApi
