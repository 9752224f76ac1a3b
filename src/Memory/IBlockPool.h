/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file IBlockPool.h
 * @brief Interface for allocators of fixed-size, recyclable byte blocks
 *
 * Streaming transfers pull their buffers from an IBlockPool so that the total
 * amount of in-flight memory is bounded. Two implementations ship with the
 * library:
 * - BlockPool: bounded, recycling, blocks allocate() at capacity
 * - PseudoBlockPool: unbounded, heap-allocates on every call, never blocks
 *
 * @code
 * BlockPool pool;
 * {
 *     BlockLease lease(pool, pool.allocate());
 *     auto n = stream->read(lease.block().bytes()).bytesTransferred;
 *     sink(lease.block().data(), n);
 * } // block returned here
 * @endcode
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "Block.h"

namespace Stevedore::Core::Memory {

class IBlockPool {
public:
    virtual ~IBlockPool() = default;

    /**
     * @brief Size in bytes of every block this pool hands out
     */
    virtual size_t blockSize() const noexcept = 0;

    /**
     * @brief Maximum number of blocks that may be outstanding at once
     */
    virtual size_t maxBlockCount() const noexcept = 0;

    /**
     * @brief Allocates a block, suspending the calling thread while the pool is at capacity
     * @return A block of blockSize() bytes owned exclusively by the caller
     */
    [[nodiscard]] virtual Block allocate() = 0;

    /**
     * @brief Allocates a block without waiting
     * @return A block, or std::nullopt if the pool is at capacity
     */
    [[nodiscard]] virtual std::optional<Block> tryAllocate() = 0;

    /**
     * @brief Returns a block previously obtained from this pool
     *
     * Capacity is released whether or not the block is kept for recycling.
     * @param block Block to return; must be non-empty and issued by this pool
     * @throws std::invalid_argument for an empty or foreign block
     */
    virtual void returnBlock(Block&& block) = 0;

    /**
     * @brief Returns several blocks at once
     *
     * Equivalent to calling returnBlock() for each element but wakes at most
     * one waiting allocator per returned block.
     */
    virtual void returnBlocks(std::vector<Block>&& blocks) {
        for (auto& b : blocks) returnBlock(std::move(b));
        blocks.clear();
    }

    /**
     * @brief Removes a block from the pool's accounting and hands its storage to the caller
     * @param block Block to detach; must be non-empty and issued by this pool
     * @return Storage of blockSize() bytes, now owned by the caller
     * @throws std::invalid_argument for an empty or foreign block
     */
    [[nodiscard]] virtual std::unique_ptr<std::byte[]> disconnect(Block&& block) = 0;

    // Statistics
    virtual size_t blocksAllocated() const = 0;
    virtual size_t bytesAllocated() const { return blocksAllocated() * blockSize(); }
    virtual size_t bytesAvailable() const = 0;

protected:
    // Implementations mint and dismantle blocks through these; Block's constructor is private
    Block makeBlock(std::unique_ptr<std::byte[]> data, size_t size) const noexcept {
        return Block(std::move(data), size, this);
    }

    static std::unique_ptr<std::byte[]> takeStorage(Block& block) noexcept {
        block._size = 0;
        block._owner = nullptr;
        return std::move(block._data);
    }

    // Validates that a block may be given back to this pool
    void checkReturnable(const Block& block) const;
};

/**
 * @brief RAII guard that returns its block to the pool on destruction
 */
class BlockLease {
public:
    BlockLease(IBlockPool& pool, Block block) noexcept : _pool(&pool), _block(std::move(block)) {}
    ~BlockLease() { reset(); }

    BlockLease(BlockLease&& other) noexcept : _pool(other._pool), _block(std::move(other._block)) {}
    BlockLease& operator=(BlockLease&& other) noexcept {
        if (this != &other) {
            reset();
            _pool = other._pool;
            _block = std::move(other._block);
        }
        return *this;
    }
    BlockLease(const BlockLease&) = delete;
    BlockLease& operator=(const BlockLease&) = delete;

    Block& block() noexcept { return _block; }
    const Block& block() const noexcept { return _block; }

    // Gives up the lease without returning the block
    [[nodiscard]] Block release() noexcept { return std::move(_block); }

    // Returns the block now (no-op if already returned or released)
    void reset() noexcept;

private:
    IBlockPool* _pool;
    Block _block;
};

} // namespace Stevedore::Core::Memory
