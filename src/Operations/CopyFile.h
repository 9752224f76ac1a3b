/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file CopyFile.h
 * @brief Streams one file between two (possibly different) backends
 *
 * run() is a two-stage pipeline. A dedicated reader thread fills blocks drawn
 * from the session's pool and hands them to the calling thread through a
 * BoundedQueue; the calling thread writes them to the destination in order.
 * Backpressure comes from the pool budget and the queue depth. Every block is
 * returned to the pool on every exit path, including cancellation.
 */

#pragma once
#include <atomic>
#include "Operation.h"
#include "../Concurrency/BoundedQueue.h"

namespace Stevedore::Core::Operations {

class CopyFile : public Operation {
public:
    // Blocks the reader may run ahead of the writer
    static constexpr size_t kQueueDepth = 8;

    CopyFile(std::shared_ptr<OperationSession> session,
             std::shared_ptr<IO::IFileSystemBackend> srcBackend,
             std::string srcPath,
             std::shared_ptr<IO::IFileSystemBackend> dstBackend,
             std::string dstPath,
             OperationPolicy policy = {});

    std::string name() const override { return "CopyFile"; }
    IO::IFileSystemBackend* backend() const override { return _dstBackend.get(); }
    std::string path() const override { return _dstPath; }
    IO::IFileSystemBackend* sourceBackend() const override { return _srcBackend.get(); }
    std::string sourcePath() const override { return _srcPath; }

    // The destination did not exist and was created by run()
    bool createdFile() const noexcept { return _createdFile.load(std::memory_order_acquire); }
    // An existing destination was replaced
    bool overwritten() const noexcept { return _overwritten.load(std::memory_order_acquire); }

protected:
    void innerEstimate() override;
    void innerRun() override;
    std::shared_ptr<Operation> makeRollback() override;

private:
    struct Chunk;
    using ChunkQueue = Concurrency::BoundedQueue<Chunk>;

    void readLoop(IO::FileStream& source, ChunkQueue& queue);
    void writeLoop(IO::FileStream& destination, ChunkQueue& queue);

    std::shared_ptr<IO::IFileSystemBackend> _srcBackend;
    std::string _srcPath;
    std::shared_ptr<IO::IFileSystemBackend> _dstBackend;
    std::string _dstPath;

    std::atomic<bool> _prevKnown{false};
    std::atomic<bool> _prevExisted{false};
    std::atomic<bool> _createdFile{false};
    std::atomic<bool> _overwritten{false};
    std::exception_ptr _readerError;
};

} // namespace Stevedore::Core::Operations
