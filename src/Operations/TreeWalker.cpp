/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "TreeWalker.h"
#include "PathUtils.h"
#include "../Logging/Logger.h"
#include "../VirtualFileSystem/FileSystemException.h"
#include <optional>

namespace Stevedore::Core::Operations {

namespace {
    struct PendingEntry {
        IO::FileMetadata entry;
        std::optional<std::string> parentPath;
    };
}

std::vector<std::exception_ptr> TreeWalker::walk(const IO::FileMetadata& root, const Visitor& visit) {
    std::vector<std::exception_ptr> failures;
    std::vector<PendingEntry> pending;
    pending.push_back({root, std::nullopt});

    while (!pending.empty()) {
        if (_options.stopToken.stop_requested()) break;

        PendingEntry current = std::move(pending.back());
        pending.pop_back();
        const auto& entry = current.entry;

        try {
            if (current.parentPath && PathUtils::isSameOrAncestor(entry.path, *current.parentPath)) {
                throw IO::FileSystemException(IO::FileError::IOError,
                                              "entry is an ancestor of its parent " + *current.parentPath,
                                              entry.path);
            }
            if (_options.omitPackageMounts && entry.isPackageMount) {
                STEVEDORE_LOG_DEBUG_CAT("TreeWalker", "Omitting package mount " + entry.path);
                continue;
            }

            visit(entry);
            if (!entry.isDirectory) continue;

            auto listing = _backend.listDirectory(entry.path);
            IO::throwIfFailed(listing, "listDirectory");

            const auto& children = listing.directoryEntries();
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                IO::FileMetadata child = it->metadata;
                child.path = it->fullPath;
                pending.push_back({std::move(child), entry.path});
            }
        } catch (const std::exception& e) {
            STEVEDORE_LOG_WARNING_CAT("TreeWalker", std::string("Skipping subtree: ") + e.what());
            failures.push_back(std::current_exception());
        }
    }
    return failures;
}

} // namespace Stevedore::Core::Operations
