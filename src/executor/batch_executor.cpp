/**
 * @file batch_executor.cpp
 * @brief BatchExecutor implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/batch_executor.hpp"

namespace fleet_mirror {

BatchExecutor::BatchExecutor(size_t worker_threads, Logger& logger, Sleeper sleeper)
    : pool_(std::max<size_t>(worker_threads, 1), "batch")
    , logger_(logger)
    , sleeper_(std::move(sleeper)) {}

void BatchExecutor::pause(Duration delay) {
    if (sleeper_) {
        sleeper_(delay);
        return;
    }
    std::this_thread::sleep_for(delay);
}

}  // namespace fleet_mirror
