/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "PseudoBlockPool.h"

#include <stdexcept>

namespace Stevedore::Core::Memory {

PseudoBlockPool::PseudoBlockPool(size_t blockSize) : _blockSize(blockSize) {
    if (_blockSize == 0) {
        throw std::invalid_argument("PseudoBlockPool blockSize must be non-zero");
    }
}

Block PseudoBlockPool::allocate() {
    auto block = makeBlock(std::make_unique<std::byte[]>(_blockSize), _blockSize);
    _outstanding.fetch_add(1, std::memory_order_relaxed);
    return block;
}

void PseudoBlockPool::returnBlock(Block&& block) {
    checkReturnable(block);
    takeStorage(block);
    _outstanding.fetch_sub(1, std::memory_order_relaxed);
}

std::unique_ptr<std::byte[]> PseudoBlockPool::disconnect(Block&& block) {
    checkReturnable(block);
    _outstanding.fetch_sub(1, std::memory_order_relaxed);
    return takeStorage(block);
}

} // namespace Stevedore::Core::Memory
