/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "IBlockPool.h"

#include <stdexcept>

#include "../Logging/Logger.h"

namespace Stevedore::Core::Memory {

void IBlockPool::checkReturnable(const Block& block) const {
    if (block.empty()) {
        throw std::invalid_argument("Cannot return an empty block (already returned or moved-from)");
    }
    if (block.owner() != this) {
        throw std::invalid_argument("Block was not allocated by this pool");
    }
}

void BlockLease::reset() noexcept {
    if (!_block || !_pool) return;
    try {
        _pool->returnBlock(std::move(_block));
    } catch (const std::exception& e) {
        STEVEDORE_LOG_ERROR_CAT("BlockPool", std::string("Lease failed to return block: ") + e.what());
    }
}

} // namespace Stevedore::Core::Memory
