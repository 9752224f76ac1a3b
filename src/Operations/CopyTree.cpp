/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "CopyTree.h"
#include "CopyFile.h"
#include "CreateDirectory.h"
#include "PathUtils.h"
#include "TreeWalker.h"
#include "../VirtualFileSystem/FileSystemException.h"

namespace Stevedore::Core::Operations {

CopyTree::CopyTree(std::shared_ptr<OperationSession> session,
                   std::shared_ptr<IO::IFileSystemBackend> srcBackend,
                   std::string srcPath,
                   std::shared_ptr<IO::IFileSystemBackend> dstBackend,
                   std::string dstPath,
                   OperationPolicy policy)
    : Batch(std::move(session), {}, policy)
    , _srcBackend(std::move(srcBackend))
    , _srcPath(std::move(srcPath))
    , _dstBackend(std::move(dstBackend))
    , _dstPath(PathUtils::trimTrailingSeparators(std::move(dstPath))) {
    if (!_srcBackend || !_dstBackend) {
        throw std::invalid_argument("CopyTree requires source and destination backends");
    }
}

void CopyTree::innerEstimate() {
    if (!_planned) {
        _planned = true;
        plan();
    }
    const auto current = state();
    if (current != OperationState::Estimating && current != OperationState::Running) return;
    estimateChildren();
}

void CopyTree::plan() {
    requireCapability(_srcBackend->getCapabilities().supportsBrowse, "browse", _srcPath);

    const auto policy = effectivePolicy();
    auto root = queryEntry(*_srcBackend, _srcPath);
    if (!root) {
        if (policy.source == SourcePolicy::Skip) {
            skip();
            return;
        }
        throwNotFound(_srcPath);
    }

    const std::string srcRoot = PathUtils::trimTrailingSeparators(root->path);
    TreeWalker walker(*_srcBackend, {policy.omitMountedPackages, session()->stopToken()});

    auto failures = walker.walk(*root, [&](const IO::FileMetadata& entry) {
        auto target = PathUtils::translatePath(entry.path, srcRoot, _dstPath);
        if (!target) {
            throw IO::FileSystemException(IO::FileError::InvalidPath, "entry lies outside " + srcRoot, entry.path);
        }

        if (entry.isDirectory) {
            // An empty target is the destination backend's root, which always exists
            if (!target->empty()) {
                appendPlanned(std::make_shared<CreateDirectory>(session(), _dstBackend, *target, this->policy()));
            }
            return;
        }
        if (target->empty()) {
            throw IO::FileSystemException(IO::FileError::InvalidPath, "no destination path for file", entry.path);
        }
        appendPlanned(std::make_shared<CopyFile>(session(), _srcBackend, entry.path, _dstBackend, *target,
                                                 this->policy()));
    });

    handlePlanningFailures(std::move(failures), toString());
}

} // namespace Stevedore::Core::Operations
