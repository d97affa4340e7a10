/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace fleet_mirror;

TEST(ThreadPoolTest, ReturnsResultsThroughFutures) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.submit([i] { return i * 2; }));
    }
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(futures[i].get(), i * 2);
    }
    EXPECT_EQ(pool.thread_count(), 4u);
}

TEST(ThreadPoolTest, PropagatesExceptions) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the throw
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, WaitIdleBlocksUntilQueueDrains) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 8; ++i) {
        // Futures are dropped on purpose; wait_idle is the synchronization point
        (void)pool.submit([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            done.fetch_add(1);
        });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 8);
    EXPECT_EQ(pool.queued_count(), 0u);
    EXPECT_EQ(pool.active_count(), 0u);
    EXPECT_EQ(pool.completed_count(), 8u);
}

TEST(ThreadPoolTest, DestructionDrainsQueuedWork) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 5; ++i) {
            (void)pool.submit([&done] { done.fetch_add(1); });
        }
    }
    EXPECT_EQ(done.load(), 5);
}

TEST(ThreadPoolTest, ShutdownRejectsNewWork) {
    ThreadPool pool(2, "batch");
    EXPECT_EQ(pool.name(), "batch");
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);

    pool.shutdown();
    EXPECT_FALSE(pool.accepting());
    auto rejected = pool.submit([] { return 2; });
    EXPECT_THROW(rejected.get(), std::runtime_error);
    EXPECT_EQ(pool.completed_count(), 1u);

    pool.shutdown();
    EXPECT_EQ(pool.thread_count(), 2u);
}
