/**
 * @file tier_scheduler.cpp
 * @brief TierScheduler implementation.
 * @author Dimitris Kafetzis
 */

#include "fleet/tier_scheduler.hpp"

namespace fleet_mirror {

TierScheduler::TierScheduler(const RefreshConfig& refresh, const IClock& clock)
    : intervals_{tier_interval(refresh, RefreshTier::Static),
                 tier_interval(refresh, RefreshTier::SemiStatic),
                 tier_interval(refresh, RefreshTier::Dynamic)}
    , clock_(clock) {}

bool TierScheduler::due(RefreshTier tier) const {
    std::lock_guard lock(mutex_);
    const auto& completed = completed_at_[index(tier)];
    if (!completed) return true;
    return clock_.now() - *completed >= intervals_[index(tier)];
}

std::vector<RefreshTier> TierScheduler::due_tiers() const {
    std::vector<RefreshTier> out;
    for (auto tier : kAllTiers) {
        if (due(tier)) out.push_back(tier);
    }
    return out;
}

void TierScheduler::mark_updated(RefreshTier tier) {
    std::lock_guard lock(mutex_);
    completed_at_[index(tier)] = clock_.now();
    updated_at_[index(tier)] = clock_.wall_now();
}

std::optional<Timestamp> TierScheduler::last_updated(RefreshTier tier) const {
    std::lock_guard lock(mutex_);
    return updated_at_[index(tier)];
}

Freshness TierScheduler::freshness(RefreshTier tier) const {
    std::lock_guard lock(mutex_);
    const auto& completed = completed_at_[index(tier)];
    if (!completed) return Freshness::Never;
    return clock_.now() - *completed < 2 * intervals_[index(tier)] ? Freshness::Fresh : Freshness::Stale;
}

std::chrono::seconds TierScheduler::interval(RefreshTier tier) const noexcept {
    return intervals_[index(tier)];
}

}  // namespace fleet_mirror
