/**
 * @file thread_pool.hpp
 * @brief Named worker pool backing the batch executor.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace fleet_mirror {

/**
 * @brief Fixed set of std::jthread workers fed from one FIFO queue.
 *
 * shutdown() (and the destructor) stops intake and lets the workers finish
 * everything already queued, so every future handed out by submit() is
 * satisfied. Work submitted after shutdown fails its future with
 * std::runtime_error.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Block until the queue is empty and no task is running.
    void wait_idle();

    /// Stop intake, drain the queue and join the workers. Idempotent.
    void shutdown();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool accepting() const;
    [[nodiscard]] size_t active_count() const noexcept { return active_tasks_.load(); }
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept { return thread_count_; }
    [[nodiscard]] uint64_t completed_count() const noexcept { return completed_tasks_.load(); }

private:
    using Task = std::function<void()>;

    /// False once shutdown has begun.
    bool enqueue(Task task);
    void worker_loop(std::stop_token stop);

    std::string name_;
    size_t thread_count_;
    std::vector<std::jthread> workers_;
    std::deque<Task> queue_;
    bool accepting_{true};
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<uint64_t> completed_tasks_{0};
    std::mutex shutdown_mutex_;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    const bool queued = enqueue([promise, f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                promise->set_value();
            } else {
                promise->set_value(f());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("worker pool '" + name_ + "' is shut down")));
    }
    return future;
}

}  // namespace fleet_mirror
