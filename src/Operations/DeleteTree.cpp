/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "DeleteTree.h"
#include "Delete.h"
#include "TreeWalker.h"

namespace Stevedore::Core::Operations {

DeleteTree::DeleteTree(std::shared_ptr<OperationSession> session,
                       std::shared_ptr<IO::IFileSystemBackend> backend,
                       std::string path,
                       OperationPolicy policy)
    : Batch(std::move(session), {}, policy)
    , _backend(std::move(backend))
    , _path(std::move(path)) {
    if (!_backend) {
        throw std::invalid_argument("DeleteTree requires a backend");
    }
}

void DeleteTree::innerEstimate() {
    if (!_planned) {
        _planned = true;
        plan();
    }
    const auto current = state();
    if (current != OperationState::Estimating && current != OperationState::Running) return;
    estimateChildren();
}

void DeleteTree::plan() {
    const auto caps = _backend->getCapabilities();
    requireCapability(caps.supportsBrowse, "browse", _path);
    requireCapability(caps.supportsDelete, "delete", _path);

    auto root = queryEntry(*_backend, _path);
    if (!root) throwNotFound(_path);

    std::vector<std::shared_ptr<Operation>> directories;
    TreeWalker walker(*_backend, {effectivePolicy().omitMountedPackages, session()->stopToken()});

    auto failures = walker.walk(*root, [&](const IO::FileMetadata& entry) {
        auto op = std::make_shared<Delete>(session(), _backend, entry.path, false, policy());
        if (entry.isDirectory) {
            directories.push_back(std::move(op));
        } else {
            appendPlanned(std::move(op));
        }
    });

    for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
        appendPlanned(std::move(*it));
    }

    handlePlanningFailures(std::move(failures), toString());
}

} // namespace Stevedore::Core::Operations
