/**
 * @file device_hub.hpp
 * @brief Device discovery and telemetry for one (network, device class) pair.
 * @author Dimitris Kafetzis
 *
 * A hub owns the latest device snapshot for its network and class plus the
 * per-serial telemetry records. Discovery and telemetry refresh each run on
 * their own PeriodicTask and never overlap with themselves.
 */

#pragma once

#include "api/gateway.hpp"
#include "cache/response_cache.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/batch_executor.hpp"
#include "executor/periodic_task.hpp"
#include "inventory/sensor_refresh.hpp"
#include "inventory/telemetry.hpp"
#include "inventory/wireless.hpp"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleet_mirror {

class MetricsCollector;

// ─────────────────────────────────────────────
// Device status feed
// ─────────────────────────────────────────────

struct DeviceStatusEntry {
    DeviceStatus status{DeviceStatus::Unknown};
    std::optional<Timestamp> last_reported;
};

/**
 * @brief Organization-wide status lookup consulted before each telemetry scan.
 */
class IDeviceStatusSource {
public:
    virtual ~IDeviceStatusSource() = default;

    [[nodiscard]] virtual std::optional<DeviceStatusEntry> status_of(const Serial& serial) const = 0;

    /// False until the first status feed has been fetched successfully.
    [[nodiscard]] virtual bool status_feed_loaded() const = 0;
};

// ─────────────────────────────────────────────
// Hub context
// ─────────────────────────────────────────────

/**
 * @brief Shared resources a hub works with. Owned by the FleetHub.
 */
struct HubContext {
    OrganizationId organization_id;
    ApiGateway& gateway;
    BatchExecutor& batch;
    const IDeviceStatusSource& statuses;
    const Config& config;
    Logger& logger;
    const IClock& clock;
    MetricsCollector* metrics{nullptr};
    CacheTtl ttl;
};

/// Device list for @p network_id, served from the device-list cache entry when fresh.
[[nodiscard]] Result<Json::Value> fetch_network_devices(ApiGateway& gateway,
                                                        const NetworkId& network_id,
                                                        std::chrono::seconds ttl);

/// Parse a getNetworkDevices payload. Entries without a serial are dropped.
[[nodiscard]] std::vector<Device> parse_devices(const Json::Value& payload,
                                                const NetworkId& network_id);

// ─────────────────────────────────────────────
// Hub state and reports
// ─────────────────────────────────────────────

enum class HubState : uint8_t {
    Uninitialized,
    Discovering,
    Ready,
    Refreshing,
    Unloaded
};

[[nodiscard]] constexpr std::string_view to_string(HubState state) noexcept {
    switch (state) {
        case HubState::Uninitialized: return "uninitialized";
        case HubState::Discovering:   return "discovering";
        case HubState::Ready:         return "ready";
        case HubState::Refreshing:    return "refreshing";
        case HubState::Unloaded:      return "unloaded";
    }
    return "unknown";
}

enum class DiscoveryOutcome : uint8_t {
    Completed,
    Skipped     ///< In flight, throttled or unloaded; no call issued
};

struct SkippedDevice {
    Serial serial;
    std::string reason;
};

struct RefreshReport {
    std::vector<Serial> refreshed;
    std::vector<SkippedDevice> skipped;
    size_t failed_metrics{0};
    bool skipped_in_flight{false};   ///< Another refresh was running; nothing was done
};

struct HubSnapshot {
    HubId id;
    NetworkId network_id;
    DeviceClass device_class{DeviceClass::Sensor};
    HubState state{HubState::Uninitialized};
    std::vector<Device> devices;
    std::map<Serial, DeviceTelemetry> telemetry;
    bool telemetry_available{true};
    std::optional<SsidSummary> ssids;       ///< Wireless hubs only
    std::optional<Timestamp> last_discovery;
    std::optional<Timestamp> last_refresh;
};

// ─────────────────────────────────────────────
// DeviceInventoryHub
// ─────────────────────────────────────────────

class DeviceInventoryHub {
public:
    DeviceInventoryHub(HubContext& context, Network network, DeviceClass device_class);
    ~DeviceInventoryHub();

    DeviceInventoryHub(const DeviceInventoryHub&) = delete;
    DeviceInventoryHub& operator=(const DeviceInventoryHub&) = delete;

    /**
     * @brief First discovery, then the discovery and scan timers.
     *
     * Only authentication and authorization failures are returned; any other
     * discovery failure leaves the hub empty until the next timer tick.
     */
    Result<void> setup();

    /**
     * @brief Replace the device list with the network's current devices of this class.
     *
     * Returns Skipped without issuing a call when a discovery is in flight or
     * the last completed one is younger than refresh.min_discovery_interval.
     * On failure the previous device list is kept.
     */
    Result<DiscoveryOutcome> discover();

    /**
     * @brief Fetch telemetry for every eligible device and merge it.
     *
     * Never fails as a whole: per-call failures are counted in the report,
     * and a cycle where every call fails clears telemetry_available.
     */
    RefreshReport refresh_telemetry();

    /// Stop the timers and the sensor refresh service. Idempotent.
    void unload();

    // ── Accessors ────────────────────────────

    [[nodiscard]] const HubId& id() const noexcept { return id_; }
    [[nodiscard]] const Network& network() const noexcept { return network_; }
    [[nodiscard]] DeviceClass device_class() const noexcept { return device_class_; }
    [[nodiscard]] HubState state() const;
    [[nodiscard]] std::vector<Device> devices() const;
    [[nodiscard]] size_t device_count() const;
    [[nodiscard]] std::optional<DeviceTelemetry> telemetry(const Serial& serial) const;
    [[nodiscard]] bool telemetry_available() const;
    /// SSID counts of the network; set once a wireless refresh has fetched them.
    [[nodiscard]] std::optional<SsidSummary> ssids() const;
    [[nodiscard]] HubSnapshot snapshot() const;

    /// Mean wall time of the last 50 completed discoveries.
    [[nodiscard]] Duration average_discovery_duration() const;
    [[nodiscard]] uint64_t discovery_count() const;

    /// Refresh command service; set on sensor hubs once setup() has run with it enabled.
    [[nodiscard]] const SensorRefreshService* sensor_refresh() const noexcept { return sensor_refresh_.get(); }

private:
    struct FetchTally {
        size_t calls{0};
        size_t failures{0};
        size_t cache_hits{0};
    };

    [[nodiscard]] bool eligible(const Serial& serial, std::string& reason) const;
    [[nodiscard]] CapabilitySet capabilities_for(const Device& device) const;

    void refresh_sensors(const std::vector<Device>& devices,
                         std::map<Serial, TelemetryRecord>& records,
                         RefreshReport& report, FetchTally& tally);
    void refresh_infrastructure(const std::vector<Device>& devices,
                                std::map<Serial, TelemetryRecord>& records,
                                RefreshReport& report, FetchTally& tally);
    void refresh_ssids(RefreshReport& report);

    [[nodiscard]] std::chrono::seconds ttl_for(Metric metric) const noexcept;
    void start_timers();

    HubContext& ctx_;
    Network network_;
    DeviceClass device_class_;
    HubId id_;

    mutable std::mutex mutex_;
    bool initialized_{false};
    bool discovering_{false};
    bool refreshing_{false};
    bool unloaded_{false};
    std::optional<SteadyTime> last_discovery_completed_;
    std::optional<Timestamp> last_discovery_;
    std::optional<Timestamp> last_refresh_;
    std::vector<Device> devices_;
    std::map<Serial, DeviceTelemetry> telemetry_;
    std::map<Serial, CapabilitySet> live_capabilities_;
    bool telemetry_available_{true};
    std::optional<SsidSummary> ssids_;
    std::deque<Duration> discovery_durations_;
    uint64_t discovery_count_{0};

    std::unique_ptr<PeriodicTask> discovery_timer_;
    std::unique_ptr<PeriodicTask> scan_timer_;
    std::unique_ptr<SensorRefreshService> sensor_refresh_;
};

}  // namespace fleet_mirror
