/**
 * @file periodic_task.cpp
 * @brief PeriodicTask implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/periodic_task.hpp"

#include <exception>

namespace fleet_mirror {

PeriodicTask::PeriodicTask(std::string name, Duration interval,
                           std::function<void()> tick, Logger& logger)
    : name_(std::move(name))
    , interval_(interval)
    , tick_(std::move(tick))
    , logger_(logger) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
    logger_.debug("timer", name_ + " scheduled every " +
                           std::to_string(interval_.count()) + " ms");
}

void PeriodicTask::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    wait_cv_.notify_all();
    thread_.join();
    thread_ = std::jthread{};
}

void PeriodicTask::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex_);
            if (wait_cv_.wait_for(lock, stop, interval_,
                                  [&stop] { return stop.stop_requested(); })) {
                break;
            }
        }
        if (stop.stop_requested()) break;

        try {
            tick_();
        } catch (const std::exception& ex) {
            logger_.error("timer", name_ + " tick failed: " + ex.what());
        } catch (...) {
            logger_.error("timer", name_ + " tick failed with a non-standard exception");
        }
        ++ticks_;
    }
}

}  // namespace fleet_mirror
