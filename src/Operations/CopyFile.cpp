/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "CopyFile.h"
#include "Delete.h"
#include "../Logging/Logger.h"
#include "../Memory/IBlockPool.h"
#include "../VirtualFileSystem/FileStream.h"
#include "../VirtualFileSystem/FileSystemException.h"
#include <stop_token>
#include <thread>

namespace Stevedore::Core::Operations {

// Unit of hand-off between the reader and the writer
struct CopyFile::Chunk {
    enum class Kind { Data, EndOfStream, ReaderFailed };

    Kind kind = Kind::Data;
    Memory::Block block;
    size_t length = 0;
};

namespace {

    // Joins the reader and gives every queued block back to the pool, whatever path leaves run()
    template <typename Queue>
    class PipelineCleanup {
    public:
        PipelineCleanup(Queue& queue, Memory::IBlockPool& pool, std::thread& reader)
            : _queue(queue), _pool(pool), _reader(reader) {}

        ~PipelineCleanup() {
            _queue.close();
            returnQueued();
            if (_reader.joinable()) _reader.join();
            // The reader may have pushed between the first drain and its exit
            returnQueued();
        }

        PipelineCleanup(const PipelineCleanup&) = delete;
        PipelineCleanup& operator=(const PipelineCleanup&) = delete;

    private:
        void returnQueued() noexcept {
            std::vector<Memory::Block> blocks;
            for (auto& chunk : _queue.drain()) {
                if (chunk.block) blocks.push_back(std::move(chunk.block));
            }
            if (blocks.empty()) return;
            try {
                _pool.returnBlocks(std::move(blocks));
            } catch (const std::exception& e) {
                STEVEDORE_LOG_ERROR_CAT("CopyFile", std::string("Failed to return queued blocks: ") + e.what());
            }
        }

        Queue& _queue;
        Memory::IBlockPool& _pool;
        std::thread& _reader;
    };

} // anonymous namespace

CopyFile::CopyFile(std::shared_ptr<OperationSession> session,
                   std::shared_ptr<IO::IFileSystemBackend> srcBackend,
                   std::string srcPath,
                   std::shared_ptr<IO::IFileSystemBackend> dstBackend,
                   std::string dstPath,
                   OperationPolicy policy)
    : Operation(std::move(session), policy)
    , _srcBackend(std::move(srcBackend))
    , _srcPath(std::move(srcPath))
    , _dstBackend(std::move(dstBackend))
    , _dstPath(std::move(dstPath)) {
    if (!_srcBackend || !_dstBackend) {
        throw std::invalid_argument("CopyFile requires source and destination backends");
    }
}

void CopyFile::innerEstimate() {
    const auto srcCaps = _srcBackend->getCapabilities();
    const auto dstCaps = _dstBackend->getCapabilities();
    requireCapability(srcCaps.supportsOpen, "open", _srcPath);
    requireCapability(dstCaps.supportsOpen, "open", _dstPath);
    requireCapability(dstCaps.supportsCreateFile, "createFile", _dstPath);

    const auto policy = effectivePolicy();

    if (srcCaps.supportsGetEntry) {
        auto source = queryEntry(*_srcBackend, _srcPath);
        if (!source) {
            if (policy.source == SourcePolicy::Skip) {
                skip();
                return;
            }
            throwNotFound(_srcPath);
        }
        if (source->isDirectory) {
            throw IO::FileSystemException(IO::FileError::InvalidPath, "source is a directory", _srcPath);
        }
        setTotalLength(static_cast<int64_t>(source->size));
    }

    if (!dstCaps.supportsGetEntry) return;

    auto destination = queryEntry(*_dstBackend, _dstPath);
    _prevKnown.store(true, std::memory_order_release);
    _prevExisted.store(destination.has_value(), std::memory_order_release);
    if (!destination) {
        setCanRollback(true);
        return;
    }

    switch (policy.destination) {
        case DestinationPolicy::Skip:
            setCanRollback(true);
            skip();
            return;
        case DestinationPolicy::Overwrite:
            if (destination->isDirectory) {
                throw IO::FileSystemException(IO::FileError::AlreadyExists,
                                              "destination is a directory", _dstPath);
            }
            // Previous content is not kept
            setCanRollback(false);
            return;
        default:
            throwAlreadyExists(*destination, _dstPath);
    }
}

void CopyFile::innerRun() {
    // Re-validate right before touching the destination
    innerEstimate();
    if (state() != OperationState::Running) return;

    const bool overwrite = effectivePolicy().destination == DestinationPolicy::Overwrite;
    const auto disposition = overwrite ? IO::StreamOptions::Create : IO::StreamOptions::CreateNew;

    auto source = _srcBackend->openStream(_srcPath, {IO::StreamOptions::Read, IO::StreamOptions::OpenExisting});
    if (!source || source->fail()) {
        const auto code = source ? source->lastError() : IO::FileError::NotSupported;
        throw IO::FileSystemException(code, "cannot open source for reading", _srcPath);
    }

    auto destination = _dstBackend->openStream(_dstPath, {IO::StreamOptions::Write, disposition});
    if (!destination || destination->fail()) {
        const auto code = destination ? destination->lastError() : IO::FileError::NotSupported;
        throw IO::FileSystemException(code, "cannot open destination for writing", _dstPath);
    }

    const bool prevExisted = _prevExisted.load(std::memory_order_acquire);
    const bool created = _prevKnown.load(std::memory_order_acquire)
        ? !prevExisted
        : disposition == IO::StreamOptions::CreateNew;
    _createdFile.store(created, std::memory_order_release);
    _overwritten.store(overwrite && !created, std::memory_order_release);
    setProgress(0);

    auto& pool = session()->blockPool();
    ChunkQueue queue(kQueueDepth);
    std::stop_callback closeOnCancel(session()->stopToken(), [&queue] { queue.close(); });

    std::thread reader;
    {
        PipelineCleanup<ChunkQueue> cleanup(queue, pool, reader);
        reader = std::thread([this, &source, &queue] { readLoop(*source, queue); });
        writeLoop(*destination, queue);
    }

    if (_readerError) std::rethrow_exception(_readerError);
    if (state() != OperationState::Running) return;

    destination->flush();
    if (destination->fail()) {
        throw IO::FileSystemException(destination->lastError(), "flush failed", _dstPath);
    }
    destination->close();
    source->close();
}

void CopyFile::readLoop(IO::FileStream& source, ChunkQueue& queue) {
    auto& pool = session()->blockPool();
    try {
        for (;;) {
            if (isCancellationRequested() || state() != OperationState::Running) {
                (void)queue.push(Chunk{Chunk::Kind::EndOfStream, {}, 0});
                return;
            }

            Memory::BlockLease lease(pool, pool.allocate());
            auto result = source.read(lease.block().bytes());
            if (!result.success()) {
                throw IO::FileSystemException(*result.error, "read failed", _srcPath);
            }
            if (result.bytesTransferred == 0) {
                (void)queue.push(Chunk{Chunk::Kind::EndOfStream, {}, 0});
                return;
            }

            Chunk chunk{Chunk::Kind::Data, lease.release(), result.bytesTransferred};
            if (!queue.push(std::move(chunk))) {
                // Writer has gone; the chunk is still ours
                pool.returnBlock(std::move(chunk.block));
                return;
            }
        }
    } catch (...) {
        _readerError = std::current_exception();
        setError(_readerError);
        (void)queue.push(Chunk{Chunk::Kind::ReaderFailed, {}, 0});
    }
}

void CopyFile::writeLoop(IO::FileStream& destination, ChunkQueue& queue) {
    auto& pool = session()->blockPool();
    const int64_t interval = session()->progressInterval();
    int64_t sinceEvent = 0;

    for (;;) {
        auto chunk = queue.pop();
        Memory::BlockLease lease(pool, chunk ? std::move(chunk->block) : Memory::Block{});

        if (isCancellationRequested() && state() != OperationState::Error) {
            markCancelled();
            return;
        }
        if (!chunk || chunk->kind != Chunk::Kind::Data) break;
        if (state() != OperationState::Running) break;

        auto result = destination.write({lease.block().data(), chunk->length});
        if (!result.success() || result.bytesTransferred != chunk->length) {
            const auto code = result.error.value_or(IO::FileError::IOError);
            throw IO::FileSystemException(code == IO::FileError::DiskFull ? code : IO::FileError::IOError,
                                          "write failed", _dstPath);
        }

        addProgress(static_cast<int64_t>(chunk->length));
        sinceEvent += static_cast<int64_t>(chunk->length);
        if (interval > 0 && sinceEvent >= interval) {
            sinceEvent %= interval;
            emitProgress();
        }
    }
}

std::shared_ptr<Operation> CopyFile::makeRollback() {
    if (!createdFile() || overwritten()) return nullptr;
    return std::make_shared<Delete>(session(), _dstBackend, _dstPath, false, policy());
}

} // namespace Stevedore::Core::Operations
