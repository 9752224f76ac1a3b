/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "BlockPool.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include "../CoreCommon.h"
#include "../Logging/Logger.h"

namespace Stevedore::Core::Memory {

BlockPool::Config BlockPool::Config::fromEnvironment() {
    Config cfg;
    if (auto v = safeGetEnvInt("STEVEDORE_BLOCK_SIZE"); v && *v > 0) cfg.blockSize = static_cast<size_t>(*v);
    if (auto v = safeGetEnvInt("STEVEDORE_MAX_BLOCKS"); v && *v > 0) cfg.maxBlockCount = static_cast<size_t>(*v);
    if (auto v = safeGetEnvInt("STEVEDORE_MAX_RECYCLE"); v && *v >= 0) cfg.maxRecycleQueue = static_cast<size_t>(*v);
    if (auto v = safeGetEnvBool("STEVEDORE_CLEAR_BLOCKS")) cfg.clearsRecycledBlocks = *v;
    return cfg;
}

BlockPool::BlockPool() : BlockPool(Config{}) {}

BlockPool::BlockPool(const Config& config) : _config(config) {
    if (_config.blockSize < 16) {
        STEVEDORE_LOG_WARNING_CAT("BlockPool", "Rejected block size " + std::to_string(_config.blockSize));
        throw std::invalid_argument("BlockPool blockSize must be at least 16 bytes");
    }
    if (_config.maxBlockCount < 1) {
        STEVEDORE_LOG_WARNING_CAT("BlockPool", "Rejected zero block capacity");
        throw std::invalid_argument("BlockPool maxBlockCount must be at least 1");
    }
    _config.maxRecycleQueue = std::min(_config.maxRecycleQueue, _config.maxBlockCount);
    _recycled.reserve(_config.maxRecycleQueue);

    STEVEDORE_LOG_DEBUG_CAT("BlockPool", "Created pool: blockSize=" + std::to_string(_config.blockSize) +
                            ", maxBlockCount=" + std::to_string(_config.maxBlockCount) +
                            ", maxRecycleQueue=" + std::to_string(_config.maxRecycleQueue));
}

BlockPool::~BlockPool() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_allocated > 0) {
        STEVEDORE_LOG_WARNING_CAT("BlockPool", "Destroyed with " + std::to_string(_allocated) + " blocks still outstanding");
    }
}

Block BlockPool::takeLocked() {
    ++_allocated;
    if (!_recycled.empty()) {
        auto data = std::move(_recycled.back());
        _recycled.pop_back();
        return makeBlock(std::move(data), _config.blockSize);
    }
    return makeBlock(std::make_unique<std::byte[]>(_config.blockSize), _config.blockSize);
}

Block BlockPool::allocate() {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_allocated >= _config.maxBlockCount) {
        ++_waiting;
        _available.wait(lock, [this] { return _allocated < _config.maxBlockCount; });
        --_waiting;
    }
    return takeLocked();
}

std::optional<Block> BlockPool::tryAllocate() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_allocated >= _config.maxBlockCount) {
        return std::nullopt;
    }
    return takeLocked();
}

void BlockPool::returnBlock(Block&& block) {
    checkReturnable(block);
    auto data = takeStorage(block);
    if (_config.clearsRecycledBlocks) {
        std::memset(data.get(), 0, _config.blockSize);
    }

    bool wake = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        STEVEDORE_ASSERT(_allocated > 0, "returnBlock with no outstanding blocks");
        --_allocated;
        if (_recycled.size() < _config.maxRecycleQueue) {
            _recycled.push_back(std::move(data));
        }
        wake = _waiting > 0;
    }
    if (wake) _available.notify_one();
}

void BlockPool::returnBlocks(std::vector<Block>&& blocks) {
    for (const auto& b : blocks) checkReturnable(b);

    std::vector<std::unique_ptr<std::byte[]>> storage;
    storage.reserve(blocks.size());
    for (auto& b : blocks) {
        storage.push_back(takeStorage(b));
        if (_config.clearsRecycledBlocks) {
            std::memset(storage.back().get(), 0, _config.blockSize);
        }
    }
    blocks.clear();

    size_t wake = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _allocated -= std::min(_allocated, storage.size());
        for (auto& data : storage) {
            if (_recycled.size() >= _config.maxRecycleQueue) break;
            _recycled.push_back(std::move(data));
        }
        wake = std::min(_waiting, storage.size());
    }
    for (size_t i = 0; i < wake; ++i) _available.notify_one();
}

std::unique_ptr<std::byte[]> BlockPool::disconnect(Block&& block) {
    checkReturnable(block);
    auto data = takeStorage(block);

    bool wake = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        --_allocated;
        wake = _waiting > 0;
    }
    if (wake) _available.notify_one();
    return data;
}

size_t BlockPool::blocksAllocated() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _allocated;
}

size_t BlockPool::bytesAvailable() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return (_config.maxBlockCount - _allocated) * _config.blockSize;
}

size_t BlockPool::recycledCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _recycled.size();
}

size_t BlockPool::waitingCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _waiting;
}

} // namespace Stevedore::Core::Memory
