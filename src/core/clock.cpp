/**
 * @file clock.cpp
 * @brief SystemClock and ManualClock implementations.
 * @author Dimitris Kafetzis
 */

#include "core/clock.hpp"

namespace fleet_mirror {

SteadyTime SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

Timestamp SystemClock::wall_now() const {
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock()
    : steady_(std::chrono::steady_clock::now())
    , wall_(std::chrono::system_clock::now()) {}

SteadyTime ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return steady_;
}

Timestamp ManualClock::wall_now() const {
    std::lock_guard lock(mutex_);
    return wall_;
}

void ManualClock::advance(std::chrono::steady_clock::duration delta) {
    std::lock_guard lock(mutex_);
    steady_ += delta;
    wall_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
}

}  // namespace fleet_mirror
