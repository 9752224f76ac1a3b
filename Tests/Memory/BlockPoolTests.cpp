#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <set>
#include <thread>
#include <vector>

#include "Memory/BlockPool.h"
#include "Memory/PseudoBlockPool.h"

using namespace Stevedore::Core::Memory;
using namespace std::chrono_literals;

namespace {
BlockPool::Config smallPool(size_t blocks, size_t recycle = 4) {
    BlockPool::Config cfg;
    cfg.blockSize = 64;
    cfg.maxBlockCount = blocks;
    cfg.maxRecycleQueue = recycle;
    return cfg;
}
}

TEST(BlockPool, AllocateReturn_CountsTrackOutstandingBlocks) {
    BlockPool pool(smallPool(4));

    auto a = pool.allocate();
    auto b = pool.allocate();
    EXPECT_EQ(pool.blocksAllocated(), 2u);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(pool.bytesAvailable(), 2u * 64u);

    pool.returnBlock(std::move(a));
    pool.returnBlock(std::move(b));
    EXPECT_EQ(pool.blocksAllocated(), 0u);
    EXPECT_EQ(pool.recycledCount(), 2u);
}

TEST(BlockPool, TryAllocate_FailsFastAtCapacity) {
    BlockPool pool(smallPool(2));
    auto a = pool.tryAllocate();
    auto b = pool.tryAllocate();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    EXPECT_FALSE(pool.tryAllocate().has_value());
    EXPECT_EQ(pool.blocksAllocated(), 2u);

    pool.returnBlock(std::move(*a));
    auto c = pool.tryAllocate();
    ASSERT_TRUE(c.has_value());

    pool.returnBlock(std::move(*b));
    pool.returnBlock(std::move(*c));
}

TEST(BlockPool, ConcurrentChurn_NeverExceedsCapacityOrSharesBlocks) {
    constexpr size_t kCapacity = 4;
    BlockPool pool(smallPool(kCapacity, 2));
    std::atomic<size_t> live{0};
    std::atomic<size_t> peak{0};
    std::atomic<bool> sharedDetected{false};

    auto worker = [&](int id) {
        for (int i = 0; i < 200; ++i) {
            auto block = pool.allocate();
            const size_t now = live.fetch_add(1) + 1;
            size_t prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}

            // Each holder stamps its id; a concurrent holder of the same block would clobber it
            std::memset(block.data(), id, block.size());
            std::this_thread::yield();
            for (size_t j = 0; j < block.size(); ++j) {
                if (block.data()[j] != static_cast<std::byte>(id)) sharedDetected = true;
            }
            live.fetch_sub(1);
            pool.returnBlock(std::move(block));
        }
    };

    std::vector<std::thread> threads;
    for (int t = 1; t <= 8; ++t) threads.emplace_back(worker, t);
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), kCapacity);
    EXPECT_FALSE(sharedDetected.load());
    EXPECT_EQ(pool.blocksAllocated(), 0u);
}

TEST(BlockPool, AllocateAtCapacity_BlocksUntilReturn) {
    BlockPool pool(smallPool(1));
    auto held = pool.allocate();

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto b = pool.allocate();
        acquired = true;
        pool.returnBlock(std::move(b));
    });

    // Wait for the waiter to park
    for (int i = 0; i < 200 && pool.waitingCount() == 0; ++i) std::this_thread::sleep_for(5ms);
    EXPECT_EQ(pool.waitingCount(), 1u);
    EXPECT_FALSE(acquired.load());

    pool.returnBlock(std::move(held));
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(pool.blocksAllocated(), 0u);
}

TEST(BlockPool, SingleReturn_WakesExactlyOneWaiter) {
    BlockPool pool(smallPool(1));
    auto held = pool.allocate();

    std::atomic<int> acquired{0};
    std::vector<Block> taken(2);
    std::mutex takenMutex;
    std::vector<std::thread> waiters;
    for (int i = 0; i < 2; ++i) {
        waiters.emplace_back([&, i] {
            auto b = pool.allocate();
            acquired.fetch_add(1);
            std::lock_guard<std::mutex> lock(takenMutex);
            taken[i] = std::move(b);
        });
    }
    for (int i = 0; i < 200 && pool.waitingCount() < 2; ++i) std::this_thread::sleep_for(5ms);
    ASSERT_EQ(pool.waitingCount(), 2u);

    pool.returnBlock(std::move(held));
    for (int i = 0; i < 200 && acquired.load() == 0; ++i) std::this_thread::sleep_for(5ms);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(acquired.load(), 1);
    EXPECT_EQ(pool.waitingCount(), 1u);

    // Release the winner so the second waiter can finish
    {
        std::lock_guard<std::mutex> lock(takenMutex);
        for (auto& b : taken) {
            if (b) pool.returnBlock(std::move(b));
        }
    }
    for (auto& t : waiters) t.join();
    for (auto& b : taken) {
        if (b) pool.returnBlock(std::move(b));
    }
    EXPECT_EQ(pool.blocksAllocated(), 0u);
}

TEST(BlockPool, RecycleQueueFull_DropsBlockButReleasesCapacity) {
    BlockPool pool(smallPool(3, 1));
    auto a = pool.allocate();
    auto b = pool.allocate();
    pool.returnBlock(std::move(a));
    pool.returnBlock(std::move(b));
    EXPECT_EQ(pool.recycledCount(), 1u);
    EXPECT_EQ(pool.blocksAllocated(), 0u);
}

TEST(BlockPool, ClearsRecycledBlocks_ZeroesReturnedStorage) {
    auto cfg = smallPool(1, 1);
    cfg.clearsRecycledBlocks = true;
    BlockPool pool(cfg);

    auto a = pool.allocate();
    std::memset(a.data(), 0xAB, a.size());
    pool.returnBlock(std::move(a));

    auto again = pool.allocate();
    for (size_t i = 0; i < again.size(); ++i) {
        ASSERT_EQ(again.data()[i], std::byte{0});
    }
    pool.returnBlock(std::move(again));
}

TEST(BlockPool, Disconnect_ReleasesAccountingAndTransfersStorage) {
    BlockPool pool(smallPool(1));
    auto a = pool.allocate();
    auto storage = pool.disconnect(std::move(a));
    ASSERT_NE(storage, nullptr);
    EXPECT_EQ(pool.blocksAllocated(), 0u);
    EXPECT_EQ(pool.recycledCount(), 0u);

    auto b = pool.tryAllocate();
    ASSERT_TRUE(b.has_value());
    pool.returnBlock(std::move(*b));
}

TEST(BlockPool, ReturnForeignOrEmptyBlock_Throws) {
    BlockPool first(smallPool(1));
    BlockPool second(smallPool(1));

    auto a = first.allocate();
    EXPECT_THROW(second.returnBlock(std::move(a)), std::invalid_argument);
    EXPECT_EQ(second.blocksAllocated(), 0u);

    Block empty;
    EXPECT_THROW(first.returnBlock(std::move(empty)), std::invalid_argument);

    first.returnBlock(std::move(a));
    EXPECT_EQ(first.blocksAllocated(), 0u);
}

TEST(BlockPool, InvalidConfig_Throws) {
    BlockPool::Config tiny;
    tiny.blockSize = 8;
    EXPECT_THROW(BlockPool{tiny}, std::invalid_argument);

    BlockPool::Config empty;
    empty.maxBlockCount = 0;
    EXPECT_THROW(BlockPool{empty}, std::invalid_argument);
}

TEST(BlockPool, BlockLease_ReturnsOnScopeExit) {
    BlockPool pool(smallPool(2));
    {
        BlockLease lease(pool, pool.allocate());
        EXPECT_EQ(pool.blocksAllocated(), 1u);
        EXPECT_EQ(lease.block().size(), 64u);
    }
    EXPECT_EQ(pool.blocksAllocated(), 0u);

    Block kept;
    {
        BlockLease lease(pool, pool.allocate());
        kept = lease.release();
    }
    EXPECT_EQ(pool.blocksAllocated(), 1u);
    pool.returnBlock(std::move(kept));
}

TEST(PseudoBlockPool, NeverBlocksAndTracksOutstanding) {
    PseudoBlockPool pool(32);
    std::vector<Block> blocks;
    for (int i = 0; i < 100; ++i) blocks.push_back(pool.allocate());
    EXPECT_EQ(pool.blocksAllocated(), 100u);

    std::set<const std::byte*> distinct;
    for (auto& b : blocks) distinct.insert(b.data());
    EXPECT_EQ(distinct.size(), blocks.size());

    pool.returnBlocks(std::move(blocks));
    EXPECT_EQ(pool.blocksAllocated(), 0u);
}
