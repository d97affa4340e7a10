/**
 * @file fleet_hub.hpp
 * @brief Organization-level hub: networks, device-class hubs and tiered refresh.
 * @author Dimitris Kafetzis
 *
 * The FleetHub owns one DeviceInventoryHub per (network, device class) with
 * matching devices and refreshes organization data in three tiers, each on
 * its own PeriodicTask. It is also the device status source its hubs consult
 * before a telemetry scan.
 */

#pragma once

#include "api/gateway.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/batch_executor.hpp"
#include "executor/periodic_task.hpp"
#include "fleet/org_data.hpp"
#include "fleet/tier_scheduler.hpp"
#include "inventory/device_hub.hpp"

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace fleet_mirror {

class MetricsCollector;

enum class FleetState : uint8_t {
    Setup,
    Ready,
    Unloaded
};

[[nodiscard]] constexpr std::string_view to_string(FleetState state) noexcept {
    switch (state) {
        case FleetState::Setup:    return "setup";
        case FleetState::Ready:    return "ready";
        case FleetState::Unloaded: return "unloaded";
    }
    return "unknown";
}

struct TierStatus {
    RefreshTier tier{RefreshTier::Static};
    Freshness freshness{Freshness::Never};
    std::optional<Timestamp> last_updated;
    std::chrono::seconds interval{0};
};

/**
 * @brief Point-in-time view of API, limiter, cache and tier health.
 */
struct FleetDiagnostics {
    FleetState state{FleetState::Setup};
    ApiCallStats api;
    size_t queue_depth{0};
    size_t calls_last_minute{0};
    size_t throttle_events_last_window{0};
    uint64_t total_throttle_events{0};
    Duration throttle_wait_total{0};
    Duration last_throttle_wait{0};
    size_t cache_entries{0};
    uint64_t cache_hits{0};
    uint64_t cache_misses{0};
    std::vector<TierStatus> tiers;
    uint64_t failed_tier_fetches{0};
    size_t network_count{0};
    size_t hub_count{0};
    size_t device_count{0};
};

class FleetHub : public IDeviceStatusSource {
public:
    FleetHub(ApiGateway& gateway,
             BatchExecutor& batch,
             const Config& config,
             Logger& logger,
             const IClock& clock,
             MetricsCollector* metrics = nullptr);
    ~FleetHub() override;

    FleetHub(const FleetHub&) = delete;
    FleetHub& operator=(const FleetHub&) = delete;

    /**
     * @brief Connect to the organization and start the tier loops.
     *
     * Fetches the organization and its networks, runs every tier once, then
     * schedules the loops. A missing key is an Authentication error; any
     * failure leaves the hub in Setup.
     */
    Result<void> setup(const std::string& api_key, const OrganizationId& organization_id);

    /**
     * @brief Create and set up a hub per enabled device class present in each network.
     *
     * A network whose device list cannot be fetched is logged and skipped.
     * Returns the number of hubs created by this call.
     */
    Result<size_t> create_device_class_hubs();

    /// Refresh every tier whose interval has elapsed on the clock.
    void run_due_tiers();
    void force_refresh_all_tiers();
    void refresh_tier(RefreshTier tier);

    /// Stop the tier loops and unload every hub. Idempotent.
    void unload();

    // ── IDeviceStatusSource ──────────────────

    [[nodiscard]] std::optional<DeviceStatusEntry> status_of(const Serial& serial) const override;
    [[nodiscard]] bool status_feed_loaded() const override;

    // ── Accessors ────────────────────────────

    [[nodiscard]] FleetState state() const noexcept { return state_.load(); }
    [[nodiscard]] std::optional<Organization> organization() const;
    [[nodiscard]] std::vector<Network> networks() const;
    [[nodiscard]] std::vector<DeviceInventoryHub*> hubs() const;
    [[nodiscard]] DeviceInventoryHub* hub(const HubId& id) const;

    [[nodiscard]] LicenseSummary license_summary() const;
    [[nodiscard]] StatusOverview status_overview() const;
    [[nodiscard]] AlertSummary alert_summary() const;
    [[nodiscard]] Json::Value memory_usage() const;
    [[nodiscard]] Json::Value ethernet_statuses() const;
    [[nodiscard]] uint64_t client_total() const;
    [[nodiscard]] std::map<NetworkId, size_t> bluetooth_clients() const;

    [[nodiscard]] const TierScheduler& tiers() const noexcept { return tiers_; }
    [[nodiscard]] FleetDiagnostics diagnostics() const;

private:
    /// Each returns the number of fetches that failed.
    uint32_t update_static_data();
    uint32_t update_semi_static_data();
    uint32_t update_dynamic_data();

    [[nodiscard]] Result<Json::Value> fetch(std::string_view endpoint, const std::string& arg,
                                            const RetryStrategy& strategy, int call_priority,
                                            Json::Value params = Json::Value{Json::objectValue});
    void start_tier_loops();

    ApiGateway& gateway_;
    BatchExecutor& batch_;
    const Config& config_;
    Logger& logger_;
    const IClock& clock_;
    MetricsCollector* metrics_;

    HubContext hub_context_;
    TierScheduler tiers_;
    std::atomic<FleetState> state_{FleetState::Setup};
    std::atomic<uint64_t> failed_tier_fetches_{0};

    mutable std::shared_mutex data_mutex_;
    std::optional<Organization> organization_;
    std::vector<Network> networks_;
    LicenseSummary licenses_;
    StatusOverview statuses_;
    bool statuses_loaded_{false};
    AlertSummary alerts_;
    Json::Value memory_usage_;
    Json::Value ethernet_statuses_;
    uint64_t client_total_{0};
    std::map<NetworkId, size_t> bluetooth_clients_;

    std::array<std::mutex, 3> tier_mutexes_;

    mutable std::mutex hubs_mutex_;
    std::map<HubId, std::unique_ptr<DeviceInventoryHub>> hubs_;

    std::vector<std::unique_ptr<PeriodicTask>> tier_loops_;
    std::mutex lifecycle_mutex_;
};

}  // namespace fleet_mirror
