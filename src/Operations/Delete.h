/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <vector>
#include "Operation.h"

namespace Stevedore::Core::Operations {

/**
 * @brief Deletes a file or directory
 *
 * A missing path is governed by the destination policy: Skip skips, Throw
 * fails with FileNotFound, Overwrite lets run() treat it as already done.
 *
 * Deleted content cannot be reconstructed, so Delete only offers a rollback
 * when its creator supplies one (TransferTree passes the inverse copy or
 * directory creation). It is offered once the delete has completed.
 */
class Delete : public Operation {
public:
    Delete(std::shared_ptr<OperationSession> session,
           std::shared_ptr<IO::IFileSystemBackend> backend,
           std::string path,
           bool recursive = false,
           OperationPolicy policy = {},
           std::shared_ptr<Operation> rollback = nullptr);

    std::string name() const override { return "Delete"; }
    IO::IFileSystemBackend* backend() const override { return _backend.get(); }
    std::string path() const override { return _path; }
    bool recursive() const noexcept { return _recursive; }

    /**
     * @brief Makes run() skip unless the given operation has Completed
     *
     * Checked when the delete runs, so prerequisites must run earlier in
     * the same Batch. Not thread-safe; call while planning.
     */
    void requireCompleted(std::shared_ptr<Operation> prerequisite);

protected:
    void innerEstimate() override;
    void innerRun() override;
    std::shared_ptr<Operation> makeRollback() override;

private:
    bool toleratesMissing() const;

    std::shared_ptr<IO::IFileSystemBackend> _backend;
    std::string _path;
    bool _recursive;
    std::shared_ptr<Operation> _rollback;
    std::vector<std::shared_ptr<Operation>> _prerequisites;
};

} // namespace Stevedore::Core::Operations
