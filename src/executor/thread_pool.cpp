/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace fleet_mirror {

namespace {

constexpr size_t FALLBACK_THREADS = 4;

}  // anonymous namespace

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = FALLBACK_THREADS;
    }
    thread_count_ = num_threads;

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    std::lock_guard guard(shutdown_mutex_);
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_ && workers_.empty()) return;
        accepting_ = false;
    }
    for (auto& worker : workers_) worker.request_stop();
    queue_cv_.notify_all();
    workers_.clear();  // joins after the queue is drained
}

void ThreadPool::worker_loop(std::stop_token stop) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                // Woken by stop with nothing left to drain
                if (stop.stop_requested()) return;
                continue;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_tasks_;
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
            ++completed_tasks_;
        }
        idle_cv_.notify_all();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_tasks_.load() == 0; });
}

bool ThreadPool::accepting() const {
    std::lock_guard lock(queue_mutex_);
    return accepting_;
}

size_t ThreadPool::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

}  // namespace fleet_mirror
