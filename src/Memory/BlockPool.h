/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file BlockPool.h
 * @brief Bounded allocator and recycler of fixed-size byte blocks
 *
 * BlockPool enforces `0 <= blocksAllocated() <= maxBlockCount()` at all times.
 * Returned blocks are kept on a LIFO recycle list (bounded by
 * maxRecycleQueue()) so steady-state transfers stop touching the heap.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Counters and the recycle list are guarded by one mutex which is never held
 *   across a wait (allocate() sleeps on a condition variable)
 * - Block contents are wiped outside the lock when clearsRecycledBlocks is set
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <vector>

#include "IBlockPool.h"

namespace Stevedore::Core::Memory {

class BlockPool : public IBlockPool {
public:
    struct Config {
        size_t blockSize = 4096;        ///< Bytes per block (minimum 16)
        size_t maxBlockCount = 65536;   ///< Capacity in blocks (minimum 1)
        size_t maxRecycleQueue = 64;    ///< Returned blocks kept for reuse (clamped to maxBlockCount)
        bool clearsRecycledBlocks = false; ///< Zero block contents when returned

        /**
         * @brief Defaults overridden by STEVEDORE_BLOCK_SIZE, STEVEDORE_MAX_BLOCKS,
         * STEVEDORE_MAX_RECYCLE and STEVEDORE_CLEAR_BLOCKS when set
         */
        static Config fromEnvironment();
    };

    BlockPool();

    /**
     * @brief Creates a pool
     * @param config Pool parameters
     * @throws std::invalid_argument if blockSize < 16 or maxBlockCount < 1
     */
    explicit BlockPool(const Config& config);
    ~BlockPool() override;

    BlockPool(const BlockPool&) = delete;
    BlockPool& operator=(const BlockPool&) = delete;

    size_t blockSize() const noexcept override { return _config.blockSize; }
    size_t maxBlockCount() const noexcept override { return _config.maxBlockCount; }
    size_t maxRecycleQueue() const noexcept { return _config.maxRecycleQueue; }
    bool clearsRecycledBlocks() const noexcept { return _config.clearsRecycledBlocks; }

    [[nodiscard]] Block allocate() override;
    [[nodiscard]] std::optional<Block> tryAllocate() override;
    void returnBlock(Block&& block) override;
    void returnBlocks(std::vector<Block>&& blocks) override;
    [[nodiscard]] std::unique_ptr<std::byte[]> disconnect(Block&& block) override;

    size_t blocksAllocated() const override;
    size_t bytesAvailable() const override;

    // Number of returned blocks currently held for reuse
    size_t recycledCount() const;

    // Number of threads currently suspended in allocate()
    size_t waitingCount() const;

private:
    // Caller holds _mutex and has verified capacity
    Block takeLocked();

    Config _config;
    mutable std::mutex _mutex;
    std::condition_variable _available;
    size_t _allocated = 0;
    size_t _waiting = 0;
    std::vector<std::unique_ptr<std::byte[]>> _recycled;
};

} // namespace Stevedore::Core::Memory
