/**
 * @file stevedore_block_pool_c.cpp
 * @brief Implementation of BlockPool C API
 */

#include "stevedore/stevedore_block_pool.h"
#include "stevedore_c_support.h"
#include "Memory/BlockPool.h"
#include "Memory/PseudoBlockPool.h"

using namespace Stevedore::Core;
using namespace Stevedore::Core::Memory;
using Stevedore::Core::CApi::translate_exception;

extern "C" {

void stevedore_block_pool_config_init(StevedoreBlockPoolConfig* config) {
    if (!config) return;
    const BlockPool::Config defaults;
    config->block_size = defaults.blockSize;
    config->max_block_count = defaults.maxBlockCount;
    config->max_recycle_queue = defaults.maxRecycleQueue;
    config->clears_recycled_blocks = CApi::to_c_bool(defaults.clearsRecycledBlocks);
}

stevedore_BlockPool stevedore_block_pool_create(const StevedoreBlockPoolConfig* config, StevedoreStatus* status) {
    if (!status) return nullptr;

    try {
        BlockPool::Config cfg;
        if (config) {
            cfg.blockSize = config->block_size;
            cfg.maxBlockCount = config->max_block_count;
            cfg.maxRecycleQueue = config->max_recycle_queue;
            cfg.clearsRecycledBlocks = config->clears_recycled_blocks != STEVEDORE_FALSE;
        }
        auto* wrapper = new stevedore_BlockPool_t{std::make_shared<BlockPool>(cfg)};
        *status = STEVEDORE_OK;
        return wrapper;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

stevedore_BlockPool stevedore_block_pool_create_pseudo(size_t block_size, StevedoreStatus* status) {
    if (!status) return nullptr;
    if (block_size == 0) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        auto* wrapper = new stevedore_BlockPool_t{std::make_shared<PseudoBlockPool>(block_size)};
        *status = STEVEDORE_OK;
        return wrapper;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void stevedore_block_pool_destroy(stevedore_BlockPool pool) {
    delete pool;
}

stevedore_Block stevedore_block_pool_allocate(stevedore_BlockPool pool, StevedoreStatus* status) {
    if (!status) return nullptr;
    if (!pool) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        auto* block = new stevedore_Block_t{pool->pool->allocate()};
        *status = STEVEDORE_OK;
        return block;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

stevedore_Block stevedore_block_pool_try_allocate(stevedore_BlockPool pool, StevedoreStatus* status) {
    if (!status) return nullptr;
    if (!pool) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        auto block = pool->pool->tryAllocate();
        if (!block) {
            *status = STEVEDORE_ERR_UNAVAILABLE;
            return nullptr;
        }
        auto* wrapper = new stevedore_Block_t{std::move(*block)};
        *status = STEVEDORE_OK;
        return wrapper;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void stevedore_block_pool_return(stevedore_BlockPool pool, stevedore_Block block, StevedoreStatus* status) {
    if (!status) return;
    if (!pool || !block) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }
    if (block->block.owner() != pool->pool.get()) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return;
    }

    try {
        pool->pool->returnBlock(std::move(block->block));
        delete block;
        *status = STEVEDORE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

uint8_t* stevedore_block_data(stevedore_Block block, size_t* out_size, StevedoreStatus* status) {
    if (!status) return nullptr;
    if (!block || !out_size) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return nullptr;
    }
    *out_size = block->block.size();
    *status = STEVEDORE_OK;
    return reinterpret_cast<uint8_t*>(block->block.data());
}

size_t stevedore_block_pool_block_size(stevedore_BlockPool pool, StevedoreStatus* status) {
    if (!status) return 0;
    if (!pool) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return 0;
    }
    *status = STEVEDORE_OK;
    return pool->pool->blockSize();
}

size_t stevedore_block_pool_max_block_count(stevedore_BlockPool pool, StevedoreStatus* status) {
    if (!status) return 0;
    if (!pool) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return 0;
    }
    *status = STEVEDORE_OK;
    return pool->pool->maxBlockCount();
}

size_t stevedore_block_pool_blocks_allocated(stevedore_BlockPool pool, StevedoreStatus* status) {
    if (!status) return 0;
    if (!pool) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return 0;
    }
    try {
        *status = STEVEDORE_OK;
        return pool->pool->blocksAllocated();
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

size_t stevedore_block_pool_bytes_available(stevedore_BlockPool pool, StevedoreStatus* status) {
    if (!status) return 0;
    if (!pool) {
        *status = STEVEDORE_ERR_INVALID_ARG;
        return 0;
    }
    try {
        *status = STEVEDORE_OK;
        return pool->pool->bytesAvailable();
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

} // extern "C"
