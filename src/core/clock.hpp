/**
 * @file clock.hpp
 * @brief Injectable time source.
 * @author Dimitris Kafetzis
 *
 * Components that make time-based decisions (cache expiry, discovery
 * throttling, tier scheduling) read time through IClock so tests can
 * advance a ManualClock instead of sleeping.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>

namespace fleet_mirror {

class IClock {
public:
    virtual ~IClock() = default;

    /// Monotonic time for interval arithmetic.
    [[nodiscard]] virtual SteadyTime now() const = 0;

    /// Wall-clock time for timestamps reported to consumers.
    [[nodiscard]] virtual Timestamp wall_now() const = 0;
};

/**
 * @brief The real clocks.
 */
class SystemClock : public IClock {
public:
    [[nodiscard]] SteadyTime now() const override;
    [[nodiscard]] Timestamp wall_now() const override;
};

/**
 * @brief A clock that only moves when told to. Thread-safe.
 */
class ManualClock : public IClock {
public:
    ManualClock();

    [[nodiscard]] SteadyTime now() const override;
    [[nodiscard]] Timestamp wall_now() const override;

    void advance(std::chrono::steady_clock::duration delta);

private:
    mutable std::mutex mutex_;
    SteadyTime steady_;
    Timestamp wall_;
};

}  // namespace fleet_mirror
