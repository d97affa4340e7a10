/**
 * @file test_rate_limiter.cpp
 * @brief Unit tests for the sliding-window RateLimiter.
 * @author Dimitris Kafetzis
 */

#include "executor/rate_limiter.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

using namespace fleet_mirror;

namespace {

using SteadyClock = std::chrono::steady_clock;

Logger make_logger() {
    return Logger(std::make_unique<NullSink>());
}

}  // namespace

TEST(RateLimiterTest, NeverExceedsCallsPerSecond) {
    auto logger = make_logger();
    RateLimiter limiter(RateLimiterOptions{.max_calls_per_second = 5, .max_concurrent = 4}, logger);

    std::mutex starts_mutex;
    std::vector<SteadyClock::time_point> starts;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 15; ++i) {
        futures.push_back(limiter.submit([&] {
            std::lock_guard lock(starts_mutex);
            starts.push_back(SteadyClock::now());
        }));
    }
    for (auto& f : futures) f.get();

    ASSERT_EQ(starts.size(), 15u);
    std::sort(starts.begin(), starts.end());
    // Any six consecutive starts must span at least one second
    for (size_t i = 0; i + 5 < starts.size(); ++i) {
        auto span = std::chrono::duration_cast<std::chrono::milliseconds>(starts[i + 5] - starts[i]);
        EXPECT_GE(span.count(), 980) << "window starting at call " << i;
    }
    EXPECT_GT(limiter.total_throttle_events(), 0u);
    EXPECT_GT(limiter.throttle_wait_total().count(), 0);
    EXPECT_EQ(limiter.calls_last_minute(), 15u);
}

TEST(RateLimiterTest, HigherPriorityRunsFirst) {
    auto logger = make_logger();
    RateLimiter limiter(RateLimiterOptions{.max_calls_per_second = 100, .max_concurrent = 1}, logger);

    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    std::promise<void> blocker_started;
    auto blocker = limiter.submit([&] {
        blocker_started.set_value();
        gate_future.wait();
    }, priority::SETUP);
    blocker_started.get_future().wait();

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto record = [&](std::string name) {
        return [&, name] {
            std::lock_guard lock(order_mutex);
            order.push_back(name);
        };
    };
    auto background = limiter.submit(record("background"), priority::BACKGROUND);
    auto telemetry_a = limiter.submit(record("telemetry-a"), priority::TELEMETRY);
    auto telemetry_b = limiter.submit(record("telemetry-b"), priority::TELEMETRY);
    auto setup = limiter.submit(record("setup"), priority::SETUP);
    EXPECT_EQ(limiter.queue_depth(), 4u);

    gate.set_value();
    blocker.get();
    background.get();
    telemetry_a.get();
    telemetry_b.get();
    setup.get();

    std::vector<std::string> expected{"setup", "telemetry-a", "telemetry-b", "background"};
    EXPECT_EQ(order, expected);
    EXPECT_EQ(limiter.queue_depth(), 0u);
}

TEST(RateLimiterTest, DeliversExceptionsThroughFuture) {
    auto logger = make_logger();
    RateLimiter limiter(RateLimiterOptions{}, logger);
    auto future = limiter.submit([]() -> int { throw std::runtime_error("transport"); });
    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(limiter.execute([] { return 3; }), 3);
}

TEST(RateLimiterTest, StartsOnSubmitAndStopDrains) {
    auto logger = make_logger();
    RateLimiter limiter(RateLimiterOptions{.max_calls_per_second = 50, .max_concurrent = 2}, logger);
    EXPECT_FALSE(limiter.running());

    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(limiter.submit([&done] { done.fetch_add(1); }));
    }
    EXPECT_TRUE(limiter.running());

    limiter.stop();
    EXPECT_FALSE(limiter.running());
    EXPECT_EQ(done.load(), 10);
    for (auto& f : futures) {
        EXPECT_NO_THROW(f.get());
    }

    // Restartable after stop
    EXPECT_EQ(limiter.execute([] { return 1; }), 1);
}

TEST(RateLimiterTest, ClampsZeroOptions) {
    auto logger = make_logger();
    RateLimiter limiter(RateLimiterOptions{.max_calls_per_second = 0, .max_concurrent = 0}, logger);
    EXPECT_EQ(limiter.max_calls_per_second(), 1u);
    EXPECT_EQ(limiter.max_concurrent(), 1u);
}
