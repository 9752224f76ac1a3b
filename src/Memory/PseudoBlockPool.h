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
#include <cstdint>

#include "IBlockPool.h"

namespace Stevedore::Core::Memory {

/**
 * @brief Unbounded IBlockPool that heap-allocates on every call
 *
 * allocate() never blocks and tryAllocate() never fails. Returned blocks are
 * freed rather than recycled. The outstanding count is tracked for
 * diagnostics only and never limits allocation.
 */
class PseudoBlockPool : public IBlockPool {
public:
    explicit PseudoBlockPool(size_t blockSize = 4096);

    size_t blockSize() const noexcept override { return _blockSize; }
    size_t maxBlockCount() const noexcept override { return SIZE_MAX; }

    [[nodiscard]] Block allocate() override;
    [[nodiscard]] std::optional<Block> tryAllocate() override { return allocate(); }
    void returnBlock(Block&& block) override;
    [[nodiscard]] std::unique_ptr<std::byte[]> disconnect(Block&& block) override;

    size_t blocksAllocated() const override { return _outstanding.load(std::memory_order_relaxed); }
    size_t bytesAvailable() const override { return SIZE_MAX; }

private:
    size_t _blockSize;
    std::atomic<size_t> _outstanding{0};
};

} // namespace Stevedore::Core::Memory
