/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include "Batch.h"

namespace Stevedore::Core::Operations {

/**
 * @brief Deletes a file or directory tree bottom-up
 *
 * Files are deleted in discovery order; directory deletes are deferred and
 * appended in reverse discovery order, so every directory is removed after
 * all of its descendants (a/b/c.txt plans c.txt, a/b, a).
 */
class DeleteTree : public Batch {
public:
    DeleteTree(std::shared_ptr<OperationSession> session,
               std::shared_ptr<IO::IFileSystemBackend> backend,
               std::string path,
               OperationPolicy policy = {});

    std::string name() const override { return "DeleteTree"; }
    std::string toString() const override { return Operation::toString(); }
    IO::IFileSystemBackend* backend() const override { return _backend.get(); }
    std::string path() const override { return _path; }

protected:
    void innerEstimate() override;

private:
    void plan();

    std::shared_ptr<IO::IFileSystemBackend> _backend;
    std::string _path;
    bool _planned = false;
};

} // namespace Stevedore::Core::Operations
