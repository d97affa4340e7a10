/**
 * @file rate_limiter.hpp
 * @brief Priority queue of outbound calls gated by a sliding-window token bucket.
 * @author Dimitris Kafetzis
 *
 * Every remote call of the process goes through one RateLimiter. A fixed set
 * of std::jthread workers pulls the highest-priority call, waits for a token
 * (at most max_calls_per_second call starts in any trailing second) and runs
 * it. The limiter never fails a call; it only delays it.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <climits>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace fleet_mirror {

class MetricsCollector;

/// Lower values run first.
namespace priority {
inline constexpr int SETUP = 0;
inline constexpr int DISCOVERY = 10;
inline constexpr int TELEMETRY = 20;
inline constexpr int BACKGROUND = 30;
}  // namespace priority

struct RateLimiterOptions {
    uint32_t max_calls_per_second = 10;
    uint32_t max_concurrent = 5;
    std::chrono::minutes throttle_window{60};
};

class RateLimiter {
public:
    RateLimiter(RateLimiterOptions options, Logger& logger, MetricsCollector* metrics = nullptr);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Spawn the workers. No-op when already running.
    void start();

    /// Let queued work finish, then join the workers. No-op when stopped.
    void stop();

    /**
     * @brief Queue @p call and return a future of its result.
     *
     * Exceptions thrown by the call are delivered through the future.
     * Starts the limiter if it is not running.
     */
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& call, int call_priority = priority::TELEMETRY);

    /// submit() and wait for the result.
    template <std::invocable F>
    std::invoke_result_t<F> execute(F&& call, int call_priority = priority::TELEMETRY) {
        return submit(std::forward<F>(call), call_priority).get();
    }

    // ── Diagnostics ──────────────────────────

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] size_t queue_depth() const;
    [[nodiscard]] size_t calls_last_minute() const;
    [[nodiscard]] size_t throttle_events_last_window() const;
    [[nodiscard]] uint64_t total_throttle_events() const noexcept;
    [[nodiscard]] Duration throttle_wait_total() const noexcept;
    [[nodiscard]] Duration last_throttle_wait() const noexcept;
    [[nodiscard]] uint32_t max_concurrent() const noexcept { return options_.max_concurrent; }
    [[nodiscard]] uint32_t max_calls_per_second() const noexcept {
        return options_.max_calls_per_second;
    }

private:
    using Clock = std::chrono::steady_clock;

    struct WorkItem {
        int priority;
        uint64_t sequence;
        std::shared_ptr<std::function<void()>> task;   ///< null = stop sentinel
    };

    /// Orders the heap so the lowest (priority, sequence) is on top.
    struct RunsLater {
        bool operator()(const WorkItem& a, const WorkItem& b) const noexcept {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence > b.sequence;
        }
    };

    void start_locked();
    void enqueue(int call_priority, std::shared_ptr<std::function<void()>> task);
    void worker_loop();
    void acquire_token();
    void record_throttle(Clock::duration waited);

    static void purge(std::deque<Clock::time_point>& stamps, Clock::time_point now,
                      Clock::duration horizon);

    RateLimiterOptions options_;
    Logger& logger_;
    MetricsCollector* metrics_;

    // Queue
    std::priority_queue<WorkItem, std::vector<WorkItem>, RunsLater> queue_;
    uint64_t next_sequence_{0};
    size_t pending_sentinels_{0};
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    // Workers
    std::vector<std::jthread> workers_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};

    // Sliding window and counters
    mutable std::mutex window_mutex_;
    mutable std::deque<Clock::time_point> window_;
    mutable std::deque<Clock::time_point> call_history_;
    mutable std::deque<Clock::time_point> throttle_events_;
    std::atomic<uint64_t> total_throttle_events_{0};
    std::atomic<int64_t> throttle_wait_total_ms_{0};
    std::atomic<int64_t> last_throttle_wait_ms_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> RateLimiter::submit(F&& call, int call_priority) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();
    auto callable = std::make_shared<std::decay_t<F>>(std::forward<F>(call));

    auto task = std::make_shared<std::function<void()>>([p = std::move(promise), f = std::move(callable)] {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                (*f)();
                p->set_value();
            } else {
                p->set_value((*f)());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });

    enqueue(call_priority, std::move(task));
    return future;
}

}  // namespace fleet_mirror
