/**
 * @file rate_limiter.cpp
 * @brief RateLimiter implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/rate_limiter.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <string>

namespace fleet_mirror {

namespace {

constexpr auto RATE_WINDOW = std::chrono::seconds{1};
constexpr auto HISTORY_WINDOW = std::chrono::seconds{60};
constexpr int SENTINEL_PRIORITY = INT_MAX;

}  // anonymous namespace

RateLimiter::RateLimiter(RateLimiterOptions options, Logger& logger, MetricsCollector* metrics)
    : options_(options), logger_(logger), metrics_(metrics) {
    options_.max_calls_per_second = std::max<uint32_t>(options_.max_calls_per_second, 1);
    options_.max_concurrent = std::max<uint32_t>(options_.max_concurrent, 1);
}

RateLimiter::~RateLimiter() {
    stop();
}

void RateLimiter::start() {
    std::lock_guard lock(lifecycle_mutex_);
    start_locked();
}

void RateLimiter::start_locked() {
    if (running_.load()) return;

    workers_.reserve(options_.max_concurrent);
    for (uint32_t i = 0; i < options_.max_concurrent; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    running_.store(true);
    logger_.debug("rate_limiter", "Started " + std::to_string(options_.max_concurrent) +
                                  " workers at " + std::to_string(options_.max_calls_per_second) +
                                  " calls/s");
}

void RateLimiter::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_.load()) return;

    {
        std::lock_guard qlock(queue_mutex_);
        for (size_t i = 0; i < workers_.size(); ++i) {
            queue_.push(WorkItem{SENTINEL_PRIORITY, next_sequence_++, nullptr});
            ++pending_sentinels_;
        }
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
    running_.store(false);
    logger_.debug("rate_limiter", "Stopped");
}

void RateLimiter::enqueue(int call_priority, std::shared_ptr<std::function<void()>> task) {
    std::lock_guard lock(lifecycle_mutex_);
    start_locked();
    {
        std::lock_guard qlock(queue_mutex_);
        queue_.push(WorkItem{call_priority, next_sequence_++, std::move(task)});
    }
    queue_cv_.notify_one();
}

void RateLimiter::worker_loop() {
    while (true) {
        WorkItem item;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty(); });
            item = queue_.top();
            queue_.pop();
            if (!item.task) {
                --pending_sentinels_;
                return;
            }
        }

        acquire_token();
        (*item.task)();
    }
}

void RateLimiter::acquire_token() {
    Clock::duration waited{0};
    while (true) {
        Clock::duration wait_for{0};
        {
            std::lock_guard lock(window_mutex_);
            auto now = Clock::now();
            purge(window_, now, RATE_WINDOW);

            if (window_.size() < options_.max_calls_per_second) {
                window_.push_back(now);
                call_history_.push_back(now);
                purge(call_history_, now, HISTORY_WINDOW);
                break;
            }

            // Sleep until the oldest call leaves the window
            wait_for = RATE_WINDOW - (now - window_.front());
        }

        if (wait_for > Clock::duration::zero()) {
            std::this_thread::sleep_for(wait_for);
            waited += wait_for;
        }
    }

    if (waited > Clock::duration::zero()) {
        record_throttle(waited);
    }
}

void RateLimiter::record_throttle(Clock::duration waited) {
    auto waited_ms = std::chrono::duration_cast<Duration>(waited);
    {
        std::lock_guard lock(window_mutex_);
        auto now = Clock::now();
        throttle_events_.push_back(now);
        purge(throttle_events_, now, options_.throttle_window);
    }
    ++total_throttle_events_;
    throttle_wait_total_ms_ += waited_ms.count();
    last_throttle_wait_ms_.store(waited_ms.count());

    logger_.debug("rate_limiter", "Throttled for " + std::to_string(waited_ms.count()) + " ms");
    if (metrics_) {
        metrics_->record_throttle_wait(waited_ms, queue_depth());
    }
}

void RateLimiter::purge(std::deque<Clock::time_point>& stamps, Clock::time_point now,
                        Clock::duration horizon) {
    while (!stamps.empty() && now - stamps.front() >= horizon) {
        stamps.pop_front();
    }
}

size_t RateLimiter::queue_depth() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size() - pending_sentinels_;
}

size_t RateLimiter::calls_last_minute() const {
    std::lock_guard lock(window_mutex_);
    purge(call_history_, Clock::now(), HISTORY_WINDOW);
    return call_history_.size();
}

size_t RateLimiter::throttle_events_last_window() const {
    std::lock_guard lock(window_mutex_);
    purge(throttle_events_, Clock::now(), options_.throttle_window);
    return throttle_events_.size();
}

uint64_t RateLimiter::total_throttle_events() const noexcept {
    return total_throttle_events_.load();
}

Duration RateLimiter::throttle_wait_total() const noexcept {
    return Duration{throttle_wait_total_ms_.load()};
}

Duration RateLimiter::last_throttle_wait() const noexcept {
    return Duration{last_throttle_wait_ms_.load()};
}

}  // namespace fleet_mirror
