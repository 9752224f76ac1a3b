/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <exception>
#include <functional>
#include <stop_token>
#include <vector>
#include "../VirtualFileSystem/IFileSystemBackend.h"

namespace Stevedore::Core::Operations {

/**
 * @brief Depth-first, pre-order traversal of a backend subtree
 *
 * Uses an explicit work list, so depth is bounded by memory rather than the
 * call stack. Each directory is visited before its children, and children in
 * listing order. Entries' metadata carry their full backend path in
 * FileMetadata::path.
 *
 * A failure inside one subtree (listing error, or an entry claiming to be an
 * ancestor of its own parent) is appended to the failure list and logged;
 * siblings are still walked.
 */
class TreeWalker {
public:
    using Visitor = std::function<void(const IO::FileMetadata&)>;

    struct Options {
        bool omitPackageMounts = false;     ///< Skip directories flagged as mounted packages
        std::stop_token stopToken;          ///< Stops the walk between entries
    };

    TreeWalker(IO::IFileSystemBackend& backend, Options options)
        : _backend(backend), _options(std::move(options)) {}

    /**
     * @brief Walks root and everything under it
     * @param root Metadata of the starting entry (visited first)
     * @param visit Called once per entry; an exception thrown here counts as that subtree's failure
     * @return Failures captured during the walk
     */
    std::vector<std::exception_ptr> walk(const IO::FileMetadata& root, const Visitor& visit);

private:
    IO::IFileSystemBackend& _backend;
    Options _options;
};

} // namespace Stevedore::Core::Operations
