/**
 * @file tier_scheduler.hpp
 * @brief Last-updated bookkeeping for the three organization refresh tiers.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

#include <array>
#include <mutex>
#include <optional>
#include <vector>

namespace fleet_mirror {

/**
 * @brief Decides which tiers are due and how fresh each one is.
 *
 * A tier is due when it never ran or its interval has elapsed on the clock
 * since it last completed. It is fresh while younger than twice its interval.
 */
class TierScheduler {
public:
    TierScheduler(const RefreshConfig& refresh, const IClock& clock);

    [[nodiscard]] bool due(RefreshTier tier) const;
    [[nodiscard]] std::vector<RefreshTier> due_tiers() const;

    /// Record completion of @p tier now.
    void mark_updated(RefreshTier tier);

    [[nodiscard]] std::optional<Timestamp> last_updated(RefreshTier tier) const;
    [[nodiscard]] Freshness freshness(RefreshTier tier) const;
    [[nodiscard]] std::chrono::seconds interval(RefreshTier tier) const noexcept;

private:
    static constexpr size_t index(RefreshTier tier) noexcept { return static_cast<size_t>(tier); }

    std::array<std::chrono::seconds, 3> intervals_;
    const IClock& clock_;

    mutable std::mutex mutex_;
    std::array<std::optional<SteadyTime>, 3> completed_at_;
    std::array<std::optional<Timestamp>, 3> updated_at_;
};

}  // namespace fleet_mirror
