/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "Delete.h"
#include "../VirtualFileSystem/FileSystemException.h"

namespace Stevedore::Core::Operations {

Delete::Delete(std::shared_ptr<OperationSession> session,
               std::shared_ptr<IO::IFileSystemBackend> backend,
               std::string path,
               bool recursive,
               OperationPolicy policy,
               std::shared_ptr<Operation> rollback)
    : Operation(std::move(session), policy)
    , _backend(std::move(backend))
    , _path(std::move(path))
    , _recursive(recursive)
    , _rollback(std::move(rollback)) {
    if (!_backend) {
        throw std::invalid_argument("Delete requires a backend");
    }
    setCanRollback(_rollback != nullptr);
}

bool Delete::toleratesMissing() const {
    const auto destination = effectivePolicy().destination;
    return destination == DestinationPolicy::Skip || destination == DestinationPolicy::Overwrite;
}

void Delete::innerEstimate() {
    const auto caps = _backend->getCapabilities();
    requireCapability(caps.supportsDelete, "delete", _path);
    if (!caps.supportsGetEntry) return;

    if (queryEntry(*_backend, _path)) return;

    const auto destination = effectivePolicy().destination;
    if (destination == DestinationPolicy::Skip) {
        skip();
        return;
    }
    if (destination != DestinationPolicy::Overwrite) {
        throwNotFound(_path);
    }
}

void Delete::requireCompleted(std::shared_ptr<Operation> prerequisite) {
    if (!prerequisite) {
        throw std::invalid_argument("Delete prerequisite must not be null");
    }
    _prerequisites.push_back(std::move(prerequisite));
}

void Delete::innerRun() {
    for (const auto& prerequisite : _prerequisites) {
        if (prerequisite->state() != OperationState::Completed) {
            skip();
            return;
        }
    }

    const auto caps = _backend->getCapabilities();

    IO::FileOperationHandle handle;
    if (caps.supportsGetEntry) {
        auto entry = queryEntry(*_backend, _path);
        if (!entry) {
            if (toleratesMissing()) return;
            throwNotFound(_path);
        }
        handle = entry->isDirectory ? _backend->removeDirectory(_path, _recursive)
                                    : _backend->deleteFile(_path);
    } else {
        // Kind unknown: try as a file, fall back to a directory
        handle = _backend->deleteFile(_path);
        handle.wait();
        if (handle.status() == IO::FileOpStatus::Failed &&
            handle.errorInfo().code == IO::FileError::InvalidPath) {
            handle = _backend->removeDirectory(_path, _recursive);
        }
    }

    handle.wait();
    if (handle.status() == IO::FileOpStatus::Failed &&
        handle.errorInfo().code == IO::FileError::FileNotFound && toleratesMissing()) {
        return;
    }
    IO::throwIfFailed(handle, "delete");
}

std::shared_ptr<Operation> Delete::makeRollback() {
    return state() == OperationState::Completed ? _rollback : nullptr;
}

} // namespace Stevedore::Core::Operations
