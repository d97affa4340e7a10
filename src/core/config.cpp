/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <array>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

namespace fleet_mirror {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> REGIONAL_BASE_URLS{{
    {"Global", "https://api.meraki.com/api/v1"},
    {"Canada", "https://api.meraki.ca/api/v1"},
    {"China", "https://api.meraki.cn/api/v1"},
    {"India", "https://api.meraki.in/api/v1"},
    {"US Government", "https://api.gov-meraki.com/api/v1"},
}};

constexpr uint32_t MAX_CALLS_PER_SECOND = 100;
constexpr uint32_t MAX_CONCURRENCY = 64;
constexpr uint32_t MAX_TIMEOUT_S = 600;
constexpr uint32_t MAX_THROTTLE_WINDOW_MIN = 1440;
constexpr uint32_t MAX_TIER_INTERVAL_S = 7 * 86400;
constexpr uint32_t MAX_SERIALS_PER_CALL = 100;
constexpr uint32_t MIN_SENSOR_REFRESH_S = 1;
constexpr uint32_t MAX_SENSOR_REFRESH_S = 60;

/// A present key whose value is not a non-negative 32-bit integer.
class InvalidValue : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

uint32_t read_u32(toml::node_view<toml::node> node, std::string_view key, uint32_t fallback) {
    if (!node) return fallback;
    auto value = node.value<int64_t>();
    if (!value) {
        throw InvalidValue(std::string{key} + " must be an integer");
    }
    if (*value < 0 || *value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw InvalidValue(std::string{key} + " is out of range: " + std::to_string(*value));
    }
    return static_cast<uint32_t>(*value);
}

Error config_error(std::string message) {
    return Error{ErrorKind::Configuration, std::move(message)};
}

}  // anonymous namespace

std::optional<std::string> regional_base_url(std::string_view region) {
    for (const auto& [name, url] : REGIONAL_BASE_URLS) {
        if (name == region) return std::string{url};
    }
    return std::nullopt;
}

bool is_valid_api_key(std::string_view key) noexcept {
    if (key.size() != 40) return false;
    for (char c : key) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [organization]
        if (auto org = tbl["organization"]; org.is_table()) {
            config.organization.api_key = org["api_key"].value_or(std::string{});
            config.organization.organization_id = org["organization_id"].value_or(std::string{});
            if (auto url = org["base_url"].value<std::string>()) {
                config.organization.base_url = *url;
            } else if (auto region = org["region"].value<std::string>()) {
                auto resolved = regional_base_url(*region);
                if (!resolved) {
                    return config_error("Unknown region: " + *region);
                }
                config.organization.base_url = *resolved;
            }
        }

        // [rate_limit]
        if (auto rl = tbl["rate_limit"]; rl.is_table()) {
            auto& c = config.rate_limit;
            c.max_calls_per_second = read_u32(rl["max_calls_per_second"], "rate_limit.max_calls_per_second",
                    c.max_calls_per_second);
            c.max_concurrent = read_u32(rl["max_concurrent"], "rate_limit.max_concurrent",
                    c.max_concurrent);
            c.throttle_window_minutes = read_u32(rl["throttle_window_minutes"], "rate_limit.throttle_window_minutes",
                    c.throttle_window_minutes);
        }

        // [api]
        if (auto api = tbl["api"]; api.is_table()) {
            config.api.timeout_seconds = read_u32(api["timeout_seconds"], "api.timeout_seconds",
                    config.api.timeout_seconds);
        }

        // [refresh]
        if (auto refresh = tbl["refresh"]; refresh.is_table()) {
            auto& c = config.refresh;
            c.sensor_scan_interval_s = read_u32(refresh["sensor_scan_interval"], "refresh.sensor_scan_interval",
                    c.sensor_scan_interval_s);
            c.wireless_scan_interval_s = read_u32(refresh["wireless_scan_interval"], "refresh.wireless_scan_interval",
                    c.wireless_scan_interval_s);
            c.switch_scan_interval_s = read_u32(refresh["switch_scan_interval"], "refresh.switch_scan_interval",
                    c.switch_scan_interval_s);
            c.camera_scan_interval_s = read_u32(refresh["camera_scan_interval"], "refresh.camera_scan_interval",
                    c.camera_scan_interval_s);
            c.discovery_interval_s = read_u32(refresh["discovery_interval"], "refresh.discovery_interval",
                    c.discovery_interval_s);
            c.min_discovery_interval_s = read_u32(refresh["min_discovery_interval"], "refresh.min_discovery_interval",
                    c.min_discovery_interval_s);
            c.auto_discovery = refresh["auto_discovery"].value_or(c.auto_discovery);
            if (auto* overrides = refresh["hub_auto_discovery"].as_table()) {
                for (const auto& [hub, value] : *overrides) {
                    if (auto enabled = value.value<bool>()) {
                        c.hub_auto_discovery[HubId{hub.str()}] = *enabled;
                    }
                }
            }
            c.static_interval_s = read_u32(refresh["static_interval"], "refresh.static_interval",
                    c.static_interval_s);
            c.semi_static_interval_s = read_u32(refresh["semi_static_interval"], "refresh.semi_static_interval",
                    c.semi_static_interval_s);
            c.dynamic_interval_s = read_u32(refresh["dynamic_interval"], "refresh.dynamic_interval",
                    c.dynamic_interval_s);
            c.sensor_refresh_interval_s = read_u32(refresh["mt_refresh_interval"], "refresh.mt_refresh_interval",
                    c.sensor_refresh_interval_s);
        }

        // [cache]
        if (auto cache = tbl["cache"]; cache.is_table()) {
            auto& c = config.cache;
            c.standard_ttl_s = read_u32(cache["standard_ttl"], "cache.standard_ttl",
                    c.standard_ttl_s);
            c.extended_ttl_s = read_u32(cache["extended_ttl"], "cache.extended_ttl",
                    c.extended_ttl_s);
            c.long_ttl_s = read_u32(cache["long_ttl"], "cache.long_ttl", c.long_ttl_s);
            c.device_list_ttl_s = read_u32(cache["device_list_ttl"], "cache.device_list_ttl",
                    c.device_list_ttl_s);
        }

        // [batch]
        if (auto batch = tbl["batch"]; batch.is_table()) {
            auto& c = config.batch;
            c.max_concurrent = read_u32(batch["max_concurrent"], "batch.max_concurrent",
                    c.max_concurrent);
            c.inter_batch_delay_ms = read_u32(batch["inter_batch_delay_ms"], "batch.inter_batch_delay_ms",
                    c.inter_batch_delay_ms);
            c.sensor_serials_per_call = read_u32(batch["sensor_serials_per_call"], "batch.sensor_serials_per_call",
                    c.sensor_serials_per_call);
        }

        // [features]
        if (auto features = tbl["features"]; features.is_table()) {
            auto& c = config.features;
            c.enable_sensor = features["enable_sensor"].value_or(c.enable_sensor);
            c.enable_wireless = features["enable_wireless"].value_or(c.enable_wireless);
            c.enable_switch = features["enable_switch"].value_or(c.enable_switch);
            c.enable_camera = features["enable_camera"].value_or(c.enable_camera);
            c.treat_unknown_status_as_online =
                features["treat_unknown_status_as_online"].value_or(c.treat_unknown_status_as_online);
            c.sensor_refresh_enabled = features["mt_refresh_enabled"].value_or(c.sensor_refresh_enabled);
            if (auto* selected = features["selected_devices"].as_array()) {
                for (const auto& item : *selected) {
                    if (auto serial = item.value<std::string>()) {
                        c.selected_devices.push_back(*serial);
                    }
                }
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = read_u32(telemetry["max_file_size_mb"], "telemetry.max_file_size_mb",
                    50);
            config.telemetry.rotate_count = read_u32(telemetry["rotate_count"], "telemetry.rotate_count",
                    5);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.log_to_stdout = telemetry["log_to_stdout"].value_or(false);
        }

        // [simulation]
        if (auto sim = tbl["simulation"]; sim.is_table()) {
            auto& c = config.simulation;
            c.enabled = sim["enabled"].value_or(c.enabled);
            c.networks = read_u32(sim["networks"], "simulation.networks", c.networks);
            c.devices_per_class = read_u32(sim["devices_per_class"], "simulation.devices_per_class",
                    c.devices_per_class);
            c.latency_ms = read_u32(sim["latency_ms"], "simulation.latency_ms", c.latency_ms);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    } catch (const InvalidValue& err) {
        return config_error(err.what());
    }
}

Result<Config> load_config_or_default(const std::filesystem::path& path, bool required) {
    if (!required && !std::filesystem::exists(path)) {
        return default_config();
    }
    return load_config(path);
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& org = config.organization;
    if (!org.api_key.empty() && !is_valid_api_key(org.api_key)) {
        return config_error("organization.api_key must be 40 hexadecimal characters");
    }
    if (org.base_url.rfind("https://", 0) != 0) {
        return config_error("organization.base_url must be an https URL");
    }

    const auto& rl = config.rate_limit;
    if (rl.max_calls_per_second == 0 || rl.max_calls_per_second > MAX_CALLS_PER_SECOND) {
        return config_error("rate_limit.max_calls_per_second must be between 1 and " +
                            std::to_string(MAX_CALLS_PER_SECOND));
    }
    if (rl.max_concurrent == 0 || rl.max_concurrent > MAX_CONCURRENCY) {
        return config_error("rate_limit.max_concurrent must be between 1 and " +
                            std::to_string(MAX_CONCURRENCY));
    }
    if (rl.throttle_window_minutes == 0 || rl.throttle_window_minutes > MAX_THROTTLE_WINDOW_MIN) {
        return config_error("rate_limit.throttle_window_minutes must be between 1 and " +
                            std::to_string(MAX_THROTTLE_WINDOW_MIN));
    }
    if (config.api.timeout_seconds == 0 || config.api.timeout_seconds > MAX_TIMEOUT_S) {
        return config_error("api.timeout_seconds must be between 1 and " + std::to_string(MAX_TIMEOUT_S));
    }

    const auto& r = config.refresh;
    for (auto cls : kAllDeviceClasses) {
        if (scan_interval(r, cls).count() < 30) {
            return config_error("refresh scan interval for " + std::string{to_string(cls)} +
                                " must be at least 30 seconds");
        }
    }
    if (r.discovery_interval_s < 300 || r.discovery_interval_s > 86400) {
        return config_error("refresh.discovery_interval must be between 300 and 86400 seconds");
    }
    for (auto tier : kAllTiers) {
        const auto interval = tier_interval(r, tier).count();
        if (interval == 0 || interval > MAX_TIER_INTERVAL_S) {
            return config_error("refresh interval for tier " + std::string{to_string(tier)} +
                                " must be between 1 and " + std::to_string(MAX_TIER_INTERVAL_S) +
                                " seconds");
        }
    }

    if (r.sensor_refresh_interval_s < MIN_SENSOR_REFRESH_S || r.sensor_refresh_interval_s > MAX_SENSOR_REFRESH_S) {
        return config_error("refresh.mt_refresh_interval must be between " +
                            std::to_string(MIN_SENSOR_REFRESH_S) + " and " +
                            std::to_string(MAX_SENSOR_REFRESH_S) + " seconds");
    }

    if (config.batch.max_concurrent == 0 || config.batch.max_concurrent > MAX_CONCURRENCY) {
        return config_error("batch.max_concurrent must be between 1 and " + std::to_string(MAX_CONCURRENCY));
    }
    if (config.batch.sensor_serials_per_call == 0 ||
        config.batch.sensor_serials_per_call > MAX_SERIALS_PER_CALL) {
        return config_error("batch.sensor_serials_per_call must be between 1 and " +
                            std::to_string(MAX_SERIALS_PER_CALL));
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return config_error("telemetry.log_level must be debug, info, warn or error");
    }
    return {};
}

std::chrono::seconds scan_interval(const RefreshConfig& refresh, DeviceClass cls) noexcept {
    switch (cls) {
        case DeviceClass::Sensor:   return std::chrono::seconds{refresh.sensor_scan_interval_s};
        case DeviceClass::Wireless: return std::chrono::seconds{refresh.wireless_scan_interval_s};
        case DeviceClass::Switch:   return std::chrono::seconds{refresh.switch_scan_interval_s};
        case DeviceClass::Camera:   return std::chrono::seconds{refresh.camera_scan_interval_s};
    }
    return std::chrono::seconds{refresh.sensor_scan_interval_s};
}

std::chrono::seconds tier_interval(const RefreshConfig& refresh, RefreshTier tier) noexcept {
    switch (tier) {
        case RefreshTier::Static:     return std::chrono::seconds{refresh.static_interval_s};
        case RefreshTier::SemiStatic: return std::chrono::seconds{refresh.semi_static_interval_s};
        case RefreshTier::Dynamic:    return std::chrono::seconds{refresh.dynamic_interval_s};
    }
    return std::chrono::seconds{refresh.dynamic_interval_s};
}

bool auto_discovery_enabled(const RefreshConfig& refresh, const HubId& hub) {
    if (auto it = refresh.hub_auto_discovery.find(hub); it != refresh.hub_auto_discovery.end()) {
        return it->second;
    }
    return refresh.auto_discovery;
}

bool class_enabled(const FeaturesConfig& features, DeviceClass cls) noexcept {
    switch (cls) {
        case DeviceClass::Sensor:   return features.enable_sensor;
        case DeviceClass::Wireless: return features.enable_wireless;
        case DeviceClass::Switch:   return features.enable_switch;
        case DeviceClass::Camera:   return features.enable_camera;
    }
    return false;
}

}  // namespace fleet_mirror
