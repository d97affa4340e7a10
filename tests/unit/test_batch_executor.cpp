/**
 * @file test_batch_executor.cpp
 * @brief Unit tests for chunked, paced batch execution.
 * @author Dimitris Kafetzis
 */

#include "executor/batch_executor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace fleet_mirror;

class BatchExecutorTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    std::vector<Duration> pauses_;
    BatchExecutor batch_{4, logger_, [this](Duration d) { pauses_.push_back(d); }};
};

TEST_F(BatchExecutorTest, BoundsConcurrencyAndKeepsOrder) {
    std::atomic<int> outstanding{0};
    std::atomic<int> peak{0};

    std::vector<BatchExecutor::Call<int>> calls;
    for (int i = 1; i <= 10; ++i) {
        calls.push_back([&, i]() -> Result<int> {
            int now = outstanding.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            outstanding.fetch_sub(1);
            if (i == 4) return Error{ErrorKind::Server, "call 4 failed"};
            return i * 10;
        });
    }

    auto results = batch_.run_batched(calls, 3, Duration{250});

    ASSERT_EQ(results.size(), 10u);
    EXPECT_LE(peak.load(), 3);
    for (int i = 1; i <= 10; ++i) {
        const auto& r = results[i - 1];
        if (i == 4) {
            ASSERT_FALSE(r.has_value());
            EXPECT_EQ(r.error().kind, ErrorKind::Server);
        } else {
            ASSERT_TRUE(r.has_value()) << "call " << i;
            EXPECT_EQ(*r, i * 10);
        }
    }

    // Four chunks, three pauses between them
    ASSERT_EQ(pauses_.size(), 3u);
    EXPECT_EQ(pauses_[0].count(), 250);
    EXPECT_EQ(batch_.batches_run(), 4u);
}

TEST_F(BatchExecutorTest, ThrowingCallBecomesUnknownError) {
    std::vector<BatchExecutor::Call<int>> calls{
        []() -> Result<int> { throw std::runtime_error("kaboom"); },
        []() -> Result<int> { return 2; },
    };
    auto results = batch_.run_batched(calls, 5, Duration{0});
    ASSERT_EQ(results.size(), 2u);
    ASSERT_FALSE(results[0].has_value());
    EXPECT_EQ(results[0].error().kind, ErrorKind::Unknown);
    EXPECT_NE(results[0].error().message.find("kaboom"), std::string::npos);
    EXPECT_TRUE(results[1].has_value());
    EXPECT_TRUE(pauses_.empty());
}

TEST_F(BatchExecutorTest, EmptyInputYieldsEmptyOutput) {
    std::vector<BatchExecutor::Call<int>> calls;
    EXPECT_TRUE(batch_.run_batched(calls, 3, Duration{100}).empty());
    EXPECT_EQ(batch_.batches_run(), 0u);
}

TEST_F(BatchExecutorTest, ZeroConcurrencyRunsOneAtATime) {
    std::vector<BatchExecutor::Call<int>> calls(3, []() -> Result<int> { return 1; });
    auto results = batch_.run_batched(calls, 0, Duration{0});
    EXPECT_EQ(results.size(), 3u);
    EXPECT_EQ(batch_.batches_run(), 3u);
}
