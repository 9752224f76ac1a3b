/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <atomic>
#include "Operation.h"

namespace Stevedore::Core::Operations {

/**
 * @brief Renames an entry within one backend
 *
 * Source and destination must be the same backend instance (use
 * TransferTree to move between backends). The destination is checked again
 * immediately before the backend move so the estimate/run window is as
 * small as the backend allows.
 *
 * Rollback is the inverse move, offered only if nothing was overwritten.
 */
class Move : public Operation {
public:
    Move(std::shared_ptr<OperationSession> session,
         std::shared_ptr<IO::IFileSystemBackend> srcBackend,
         std::string srcPath,
         std::shared_ptr<IO::IFileSystemBackend> dstBackend,
         std::string dstPath,
         OperationPolicy policy = {});

    std::string name() const override { return "Move"; }
    IO::IFileSystemBackend* backend() const override { return _dstBackend.get(); }
    std::string path() const override { return _dstPath; }
    IO::IFileSystemBackend* sourceBackend() const override { return _srcBackend.get(); }
    std::string sourcePath() const override { return _srcPath; }

    bool moved() const noexcept { return _moved.load(std::memory_order_acquire); }
    // True if an existing destination was deleted to make room
    bool deletedPrevious() const noexcept { return _deletedPrevious.load(std::memory_order_acquire); }

protected:
    void innerEstimate() override;
    void innerRun() override;
    std::shared_ptr<Operation> makeRollback() override;

private:
    std::shared_ptr<IO::IFileSystemBackend> _srcBackend;
    std::string _srcPath;
    std::shared_ptr<IO::IFileSystemBackend> _dstBackend;
    std::string _dstPath;

    std::atomic<bool> _moved{false};
    std::atomic<bool> _deletedPrevious{false};
};

} // namespace Stevedore::Core::Operations
