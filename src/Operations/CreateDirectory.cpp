/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "CreateDirectory.h"
#include "Batch.h"
#include "Delete.h"
#include "PathUtils.h"
#include "../VirtualFileSystem/FileSystemException.h"

namespace Stevedore::Core::Operations {

CreateDirectory::CreateDirectory(std::shared_ptr<OperationSession> session,
                                 std::shared_ptr<IO::IFileSystemBackend> backend,
                                 std::string path,
                                 OperationPolicy policy)
    : Operation(std::move(session), policy)
    , _backend(std::move(backend))
    , _path(std::move(path)) {
    if (!_backend) {
        throw std::invalid_argument("CreateDirectory requires a backend");
    }
}

std::vector<std::string> CreateDirectory::directoriesCreated() const {
    std::lock_guard<std::mutex> lock(_createdMutex);
    return _created;
}

CreateDirectory::Collision CreateDirectory::checkDestination() {
    auto entry = queryEntry(*_backend, _path);
    if (!entry) {
        setCanRollback(true);
        return Collision::None;
    }

    switch (effectivePolicy().destination) {
        case DestinationPolicy::Skip:
            setCanRollback(true);
            return Collision::Skip;
        case DestinationPolicy::Overwrite:
            if (entry->isDirectory) {
                setCanRollback(true);
                return Collision::Skip;
            }
            // The file's content is gone once replaced
            setCanRollback(false);
            return Collision::ReplaceFile;
        default:
            setCanRollback(true);
            throwAlreadyExists(*entry, _path);
    }
}

void CreateDirectory::innerEstimate() {
    const auto caps = _backend->getCapabilities();
    requireCapability(caps.supportsCreateDirectory, "createDirectory", _path);
    if (!caps.supportsGetEntry) return;

    if (checkDestination() == Collision::Skip) {
        skip();
    }
}

void CreateDirectory::innerRun() {
    const auto caps = _backend->getCapabilities();
    if (!caps.supportsGetEntry) {
        createBlind();
        return;
    }

    switch (checkDestination()) {
        case Collision::Skip:
            skip();
            return;
        case Collision::ReplaceFile:
            IO::throwIfFailed(_backend->deleteFile(_path), "deleteFile");
            break;
        case Collision::None:
            break;
    }

    for (const auto& prefix : PathUtils::prefixes(_path)) {
        if (isCancellationRequested()) {
            markCancelled();
            return;
        }
        if (_backend->exists(prefix)) continue;

        IO::throwIfFailed(_backend->createDirectory(prefix), "createDirectory");
        recordCreated(prefix);
    }
}

void CreateDirectory::createBlind() {
    auto handle = _backend->createDirectory(_path);
    handle.wait();

    const auto destination = effectivePolicy().destination;
    const bool tolerateExisting = destination == DestinationPolicy::Skip || destination == DestinationPolicy::Overwrite;
    if (handle.status() == IO::FileOpStatus::Failed &&
        handle.errorInfo().code == IO::FileError::AlreadyExists && tolerateExisting) {
        return;
    }
    IO::throwIfFailed(handle, "createDirectory");
    recordCreated(_path);
}

void CreateDirectory::recordCreated(const std::string& path) {
    std::lock_guard<std::mutex> lock(_createdMutex);
    _created.push_back(path);
}

std::shared_ptr<Operation> CreateDirectory::makeRollback() {
    const auto created = directoriesCreated();
    if (created.empty()) return nullptr;

    if (created.size() == 1) {
        return std::make_shared<Delete>(session(), _backend, created.front(), false, policy());
    }

    std::vector<std::shared_ptr<Operation>> deletes;
    for (auto it = created.rbegin(); it != created.rend(); ++it) {
        deletes.push_back(std::make_shared<Delete>(session(), _backend, *it, false, policy()));
    }
    return std::make_shared<Batch>(session(), std::move(deletes), policy());
}

} // namespace Stevedore::Core::Operations
