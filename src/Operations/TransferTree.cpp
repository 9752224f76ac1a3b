/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "TransferTree.h"
#include "CopyFile.h"
#include "CreateDirectory.h"
#include "Delete.h"
#include "PathUtils.h"
#include "TreeWalker.h"
#include "../VirtualFileSystem/FileSystemException.h"

namespace Stevedore::Core::Operations {

TransferTree::TransferTree(std::shared_ptr<OperationSession> session,
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
        throw std::invalid_argument("TransferTree requires source and destination backends");
    }
}

void TransferTree::innerEstimate() {
    if (!_planned) {
        _planned = true;
        plan();
    }
    const auto current = state();
    if (current != OperationState::Estimating && current != OperationState::Running) return;
    estimateChildren();
}

void TransferTree::plan() {
    const auto srcCaps = _srcBackend->getCapabilities();
    requireCapability(srcCaps.supportsBrowse, "browse", _srcPath);
    requireCapability(srcCaps.supportsDelete, "delete", _srcPath);

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
    const auto deferredPolicy = this->policy().withEstimate(EstimatePolicy::OnRun);
    // Directory removals, pre-order; each waits on the removals beneath it
    std::vector<std::pair<std::string, std::shared_ptr<Delete>>> directoryDeletes;
    auto guardAncestors = [&directoryDeletes](const std::string& path, const std::shared_ptr<Operation>& removal) {
        for (auto& [dirPath, dirDelete] : directoryDeletes) {
            if (dirPath != path && PathUtils::isSameOrAncestor(dirPath, path)) dirDelete->requireCompleted(removal);
        }
    };
    TreeWalker walker(*_srcBackend, {policy.omitMountedPackages, session()->stopToken()});

    auto failures = walker.walk(*root, [&](const IO::FileMetadata& entry) {
        auto target = PathUtils::translatePath(entry.path, srcRoot, _dstPath);
        if (!target) {
            throw IO::FileSystemException(IO::FileError::InvalidPath, "entry lies outside " + srcRoot, entry.path);
        }

        if (entry.isDirectory) {
            if (!target->empty()) {
                appendPlanned(std::make_shared<CreateDirectory>(session(), _dstBackend, *target, this->policy()));
            }
            // The source backend's root cannot be removed
            if (!entry.path.empty()) {
                auto recreate = std::make_shared<CreateDirectory>(session(), _srcBackend, entry.path, this->policy());
                auto removal = std::make_shared<Delete>(session(), _srcBackend, entry.path, false,
                                                        deferredPolicy, std::move(recreate));
                guardAncestors(entry.path, removal);
                directoryDeletes.emplace_back(entry.path, std::move(removal));
            }
            return;
        }

        if (target->empty()) {
            throw IO::FileSystemException(IO::FileError::InvalidPath, "no destination path for file", entry.path);
        }
        auto copy = std::make_shared<CopyFile>(session(), _srcBackend, entry.path, _dstBackend, *target,
                                               this->policy());
        auto copyBack = std::make_shared<CopyFile>(session(), _dstBackend, *target, _srcBackend, entry.path,
                                                   this->policy());
        auto removal = std::make_shared<Delete>(session(), _srcBackend, entry.path, false, this->policy(),
                                                std::move(copyBack));
        // A source file whose copy was skipped stays where it is
        removal->requireCompleted(copy);
        guardAncestors(entry.path, removal);
        appendPlanned(std::move(copy));
        appendPlanned(std::move(removal));
    });

    for (auto it = directoryDeletes.rbegin(); it != directoryDeletes.rend(); ++it) {
        appendPlanned(std::move(it->second));
    }

    handlePlanningFailures(std::move(failures), toString());
}

} // namespace Stevedore::Core::Operations
