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
 * @brief Moves a tree between backends as copy-then-delete
 *
 * Files: CopyFile to the destination, then Delete of the source carrying a
 * copy back as its rollback. Directories: CreateDirectory at the destination
 * up front, and a deferred Delete of the source (estimated on run, after its
 * contents are gone) carrying a CreateDirectory as its rollback. Deferred
 * deletes run in reverse discovery order, as in DeleteTree.
 */
class TransferTree : public Batch {
public:
    TransferTree(std::shared_ptr<OperationSession> session,
                 std::shared_ptr<IO::IFileSystemBackend> srcBackend,
                 std::string srcPath,
                 std::shared_ptr<IO::IFileSystemBackend> dstBackend,
                 std::string dstPath,
                 OperationPolicy policy = {});

    std::string name() const override { return "TransferTree"; }
    std::string toString() const override { return Operation::toString(); }
    IO::IFileSystemBackend* backend() const override { return _dstBackend.get(); }
    std::string path() const override { return _dstPath; }
    IO::IFileSystemBackend* sourceBackend() const override { return _srcBackend.get(); }
    std::string sourcePath() const override { return _srcPath; }

protected:
    void innerEstimate() override;

private:
    void plan();

    std::shared_ptr<IO::IFileSystemBackend> _srcBackend;
    std::string _srcPath;
    std::shared_ptr<IO::IFileSystemBackend> _dstBackend;
    std::string _dstPath;
    bool _planned = false;
};

} // namespace Stevedore::Core::Operations
