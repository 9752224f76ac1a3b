/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "Move.h"
#include "../VirtualFileSystem/FileSystemException.h"

namespace Stevedore::Core::Operations {

Move::Move(std::shared_ptr<OperationSession> session,
           std::shared_ptr<IO::IFileSystemBackend> srcBackend,
           std::string srcPath,
           std::shared_ptr<IO::IFileSystemBackend> dstBackend,
           std::string dstPath,
           OperationPolicy policy)
    : Operation(std::move(session), policy)
    , _srcBackend(std::move(srcBackend))
    , _srcPath(std::move(srcPath))
    , _dstBackend(std::move(dstBackend))
    , _dstPath(std::move(dstPath)) {
    if (!_srcBackend || !_dstBackend) {
        throw std::invalid_argument("Move requires source and destination backends");
    }
    if (_srcBackend != _dstBackend) {
        throw std::invalid_argument("Move requires source and destination on the same backend");
    }
}

void Move::innerEstimate() {
    const auto caps = _srcBackend->getCapabilities();
    requireCapability(caps.supportsMove, "move", _srcPath);
    if (!caps.supportsGetEntry) return;

    const auto policy = effectivePolicy();
    auto source = queryEntry(*_srcBackend, _srcPath);
    if (!source) {
        if (policy.source == SourcePolicy::Skip) {
            skip();
            return;
        }
        throwNotFound(_srcPath);
    }
    if (source->isRegularFile) {
        setTotalLength(static_cast<int64_t>(source->size));
    }

    auto destination = queryEntry(*_dstBackend, _dstPath);
    if (!destination) {
        setCanRollback(true);
        return;
    }
    switch (policy.destination) {
        case DestinationPolicy::Skip:
            setCanRollback(true);
            skip();
            return;
        case DestinationPolicy::Overwrite:
            setCanRollback(false);
            return;
        default:
            throwAlreadyExists(*destination, _dstPath);
    }
}

void Move::innerRun() {
    const auto caps = _dstBackend->getCapabilities();

    if (caps.supportsGetEntry) {
        auto destination = queryEntry(*_dstBackend, _dstPath);
        if (destination) {
            switch (effectivePolicy().destination) {
                case DestinationPolicy::Skip:
                    setCanRollback(true);
                    skip();
                    return;
                case DestinationPolicy::Overwrite:
                    IO::throwIfFailed(destination->isDirectory ? _dstBackend->removeDirectory(_dstPath, true)
                                                               : _dstBackend->deleteFile(_dstPath),
                                      "delete");
                    _deletedPrevious.store(true, std::memory_order_release);
                    setCanRollback(false);
                    break;
                default:
                    throwAlreadyExists(*destination, _dstPath);
            }
        } else {
            setCanRollback(true);
        }
    }

    IO::throwIfFailed(_srcBackend->moveFile(_srcPath, _dstPath, false), "moveFile");
    _moved.store(true, std::memory_order_release);
    if (totalLength() >= 0) {
        setProgress(totalLength());
    }
}

std::shared_ptr<Operation> Move::makeRollback() {
    if (!moved() || deletedPrevious()) return nullptr;
    return std::make_shared<Move>(session(), _dstBackend, _dstPath, _srcBackend, _srcPath, policy());
}

} // namespace Stevedore::Core::Operations
