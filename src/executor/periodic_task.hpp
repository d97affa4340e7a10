/**
 * @file periodic_task.hpp
 * @brief A named callback run on a fixed interval by its own std::jthread.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace fleet_mirror {

/**
 * @brief Timer thread for tier loops, discovery and telemetry scans.
 *
 * The first tick happens one interval after start(). stop() interrupts the
 * wait immediately and joins; a tick already running is allowed to finish.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, Duration interval, std::function<void()> tick, Logger& logger);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }
    [[nodiscard]] uint64_t tick_count() const noexcept { return ticks_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] Duration interval() const noexcept { return interval_; }

private:
    void run(std::stop_token stop);

    std::string name_;
    Duration interval_;
    std::function<void()> tick_;
    Logger& logger_;

    std::jthread thread_;
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::atomic<uint64_t> ticks_{0};
};

}  // namespace fleet_mirror
