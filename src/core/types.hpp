/**
 * @file types.hpp
 * @brief Fundamental types used throughout FleetMirror.
 * @author Dimitris Kafetzis
 *
 * Defines the identity types, the organization → network → device model,
 * device classes and refresh tiers. All types are plain values.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_mirror {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using OrganizationId = std::string;
using NetworkId = std::string;
using Serial = std::string;
using HubId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Device Classes
// ─────────────────────────────────────────────

enum class DeviceClass : uint8_t {
    Sensor,     ///< MT environmental sensors
    Wireless,   ///< MR access points
    Switch,     ///< MS switches
    Camera      ///< MV cameras (inventory only)
};

inline constexpr DeviceClass kAllDeviceClasses[] = {
    DeviceClass::Sensor, DeviceClass::Wireless, DeviceClass::Switch, DeviceClass::Camera
};

/// Model prefix used by the provider ("MT", "MR", ...).
[[nodiscard]] constexpr std::string_view model_prefix(DeviceClass cls) noexcept {
    switch (cls) {
        case DeviceClass::Sensor:   return "MT";
        case DeviceClass::Wireless: return "MR";
        case DeviceClass::Switch:   return "MS";
        case DeviceClass::Camera:   return "MV";
    }
    return "??";
}

[[nodiscard]] constexpr std::string_view to_string(DeviceClass cls) noexcept {
    switch (cls) {
        case DeviceClass::Sensor:   return "sensor";
        case DeviceClass::Wireless: return "wireless";
        case DeviceClass::Switch:   return "switch";
        case DeviceClass::Camera:   return "camera";
    }
    return "unknown";
}

/// Classify a model string by prefix; nullopt for unsupported models (e.g. MX).
[[nodiscard]] std::optional<DeviceClass> classify_model(std::string_view model) noexcept;

// ─────────────────────────────────────────────
// Device Status
// ─────────────────────────────────────────────

enum class DeviceStatus : uint8_t {
    Unknown,
    Online,
    Offline,
    Alerting,
    Dormant
};

[[nodiscard]] constexpr std::string_view to_string(DeviceStatus status) noexcept {
    switch (status) {
        case DeviceStatus::Unknown:  return "unknown";
        case DeviceStatus::Online:   return "online";
        case DeviceStatus::Offline:  return "offline";
        case DeviceStatus::Alerting: return "alerting";
        case DeviceStatus::Dormant:  return "dormant";
    }
    return "unknown";
}

[[nodiscard]] DeviceStatus parse_device_status(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Capabilities
// ─────────────────────────────────────────────

/**
 * @brief A metric a device can report.
 *
 * Sensor metrics mirror the provider's reading names; infrastructure
 * metrics name the per-device calls a hub issues.
 */
enum class Metric : uint8_t {
    Temperature,
    Humidity,
    Water,
    Door,
    Tvoc,
    Pm25,
    Noise,
    Co2,
    IndoorAirQuality,
    Battery,
    Button,
    RealPower,
    ApparentPower,
    Voltage,
    Current,
    Frequency,
    PowerFactor,
    DownstreamPower,
    RemoteLockoutSwitch,
    ConnectionStats,
    ClientCount,
    WirelessStatus,
    RadioSettings,
    PortStatus,
    PortConfig,
    PowerModules
};

[[nodiscard]] std::string_view to_string(Metric metric) noexcept;
[[nodiscard]] std::optional<Metric> parse_metric(std::string_view name) noexcept;

using CapabilitySet = std::set<Metric>;

// ─────────────────────────────────────────────
// Inventory Model
// ─────────────────────────────────────────────

struct Organization {
    OrganizationId id;
    std::string name;
    std::string base_url;
};

struct Network {
    NetworkId id;
    std::string name;
    OrganizationId organization_id;     ///< Back-reference only
    std::vector<std::string> product_types;
};

/**
 * @brief One device record from the latest discovery snapshot.
 */
struct Device {
    Serial serial;
    std::string model;
    std::string name;
    NetworkId network_id;
    std::string mac;
    std::string firmware;
    std::vector<std::string> tags;
    DeviceStatus status{DeviceStatus::Unknown};
    std::optional<Timestamp> last_seen;
    CapabilitySet capabilities;

    /// Name if set, otherwise "<model> <serial>".
    [[nodiscard]] std::string display_name() const;
};

// ─────────────────────────────────────────────
// Refresh Tiers
// ─────────────────────────────────────────────

enum class RefreshTier : uint8_t {
    Static,
    SemiStatic,
    Dynamic
};

inline constexpr RefreshTier kAllTiers[] = {
    RefreshTier::Static, RefreshTier::SemiStatic, RefreshTier::Dynamic
};

[[nodiscard]] constexpr std::string_view to_string(RefreshTier tier) noexcept {
    switch (tier) {
        case RefreshTier::Static:     return "static";
        case RefreshTier::SemiStatic: return "semi_static";
        case RefreshTier::Dynamic:    return "dynamic";
    }
    return "unknown";
}

enum class Freshness : uint8_t {
    Never,
    Fresh,
    Stale
};

[[nodiscard]] constexpr std::string_view to_string(Freshness freshness) noexcept {
    switch (freshness) {
        case Freshness::Never: return "never";
        case Freshness::Fresh: return "fresh";
        case Freshness::Stale: return "stale";
    }
    return "unknown";
}

/// Hub identifier "<network_id>_<prefix>".
[[nodiscard]] HubId make_hub_id(const NetworkId& network_id, DeviceClass cls);

// ─────────────────────────────────────────────
// Timestamps
// ─────────────────────────────────────────────

/// "2024-05-01T12:00:00Z"
[[nodiscard]] std::string format_iso8601(Timestamp ts);

/// Accepts ISO 8601 UTC ("...Z", fractional seconds ignored) and "Mar 16, 2023 UTC".
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

}  // namespace fleet_mirror
