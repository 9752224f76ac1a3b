/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include "Operation.h"

namespace Stevedore::Core::Operations {

/**
 * @brief Creates a directory and any missing parents
 *
 * Destination policy when something already exists at path: Throw fails
 * with AlreadyExists, Skip skips, Overwrite deletes an existing file first
 * (and skips if the entry is already a directory).
 *
 * Rollback removes exactly the directories this operation created, deepest
 * first.
 */
class CreateDirectory : public Operation {
public:
    CreateDirectory(std::shared_ptr<OperationSession> session,
                    std::shared_ptr<IO::IFileSystemBackend> backend,
                    std::string path,
                    OperationPolicy policy = {});

    std::string name() const override { return "CreateDirectory"; }
    IO::IFileSystemBackend* backend() const override { return _backend.get(); }
    std::string path() const override { return _path; }

    // Directories created by run(), in creation order
    std::vector<std::string> directoriesCreated() const;

protected:
    void innerEstimate() override;
    void innerRun() override;
    std::shared_ptr<Operation> makeRollback() override;

private:
    enum class Collision { None, Skip, ReplaceFile };

    Collision checkDestination();
    void createBlind();
    void recordCreated(const std::string& path);

    std::shared_ptr<IO::IFileSystemBackend> _backend;
    std::string _path;

    mutable std::mutex _createdMutex;
    std::vector<std::string> _created;
};

} // namespace Stevedore::Core::Operations
