/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 *
 * The configuration is loaded once at startup and treated as immutable;
 * components receive a const reference to the section they need.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace fleet_mirror {

inline constexpr std::string_view DEFAULT_BASE_URL = "https://api.meraki.com/api/v1";

struct OrganizationConfig {
    std::string api_key;
    std::string organization_id;
    std::string base_url{DEFAULT_BASE_URL};
};

struct RateLimitConfig {
    uint32_t max_calls_per_second = 10;
    uint32_t max_concurrent = 5;
    uint32_t throttle_window_minutes = 60;
};

struct ApiConfig {
    uint32_t timeout_seconds = 30;
};

struct RefreshConfig {
    uint32_t sensor_scan_interval_s = 600;
    uint32_t wireless_scan_interval_s = 300;
    uint32_t switch_scan_interval_s = 300;
    uint32_t camera_scan_interval_s = 600;
    uint32_t discovery_interval_s = 3600;
    uint32_t min_discovery_interval_s = 30;
    bool auto_discovery = true;
    std::map<HubId, bool> hub_auto_discovery;  ///< Per-hub override of auto_discovery
    uint32_t static_interval_s = 3600;
    uint32_t semi_static_interval_s = 1800;
    uint32_t dynamic_interval_s = 300;
    uint32_t sensor_refresh_interval_s = 5;     ///< MT15/MT40 refreshData commands
};

struct CacheConfig {
    uint32_t standard_ttl_s = 120;     ///< Port status
    uint32_t extended_ttl_s = 900;     ///< Connection stats
    uint32_t long_ttl_s = 1800;        ///< SSID / port configuration
    uint32_t device_list_ttl_s = 600;
};

struct BatchConfig {
    uint32_t max_concurrent = 3;
    uint32_t inter_batch_delay_ms = 100;
    uint32_t sensor_serials_per_call = 25;
};

struct FeaturesConfig {
    bool enable_sensor = true;
    bool enable_wireless = true;
    bool enable_switch = true;
    bool enable_camera = true;
    std::vector<Serial> selected_devices;   ///< Empty = all devices
    bool treat_unknown_status_as_online = false;
    bool sensor_refresh_enabled = true;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool log_to_stdout = false;
};

/// In-process dashboard used by the daemon when no live transport is wired.
struct SimulationConfig {
    bool enabled = true;
    uint32_t networks = 2;
    uint32_t devices_per_class = 3;
    uint32_t latency_ms = 20;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    OrganizationConfig organization;
    RateLimitConfig rate_limit;
    ApiConfig api;
    RefreshConfig refresh;
    CacheConfig cache;
    BatchConfig batch;
    FeaturesConfig features;
    TelemetryConfig telemetry;
    SimulationConfig simulation;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. A "region" key under [organization]
 * selects a regional base URL when base_url is absent.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief load_config(), except that a missing file yields default_config()
 * when @p required is false. A file that exists but fails to load is an
 * error either way.
 */
Result<Config> load_config_or_default(const std::filesystem::path& path, bool required);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check value ranges and the API key format.
 *
 * Returns a Configuration error naming the first offending field.
 */
Result<void> validate_config(const Config& config);

/// Base URL for "Global", "Canada", "China", "India", "US Government".
[[nodiscard]] std::optional<std::string> regional_base_url(std::string_view region);

/// True for a 40-character hexadecimal key.
[[nodiscard]] bool is_valid_api_key(std::string_view key) noexcept;

[[nodiscard]] std::chrono::seconds scan_interval(const RefreshConfig& refresh, DeviceClass cls) noexcept;
[[nodiscard]] std::chrono::seconds tier_interval(const RefreshConfig& refresh, RefreshTier tier) noexcept;
/// auto_discovery, unless [refresh.hub_auto_discovery] names @p hub.
[[nodiscard]] bool auto_discovery_enabled(const RefreshConfig& refresh, const HubId& hub);
[[nodiscard]] bool class_enabled(const FeaturesConfig& features, DeviceClass cls) noexcept;

}  // namespace fleet_mirror
