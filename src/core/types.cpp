/**
 * @file types.cpp
 * @brief Parsing helpers for the inventory vocabulary types.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fleet_mirror {

namespace {

constexpr std::array<std::pair<Metric, std::string_view>, 26> METRIC_NAMES{{
    {Metric::Temperature, "temperature"},
    {Metric::Humidity, "humidity"},
    {Metric::Water, "water"},
    {Metric::Door, "door"},
    {Metric::Tvoc, "tvoc"},
    {Metric::Pm25, "pm25"},
    {Metric::Noise, "noise"},
    {Metric::Co2, "co2"},
    {Metric::IndoorAirQuality, "indoorAirQuality"},
    {Metric::Battery, "battery"},
    {Metric::Button, "button"},
    {Metric::RealPower, "realPower"},
    {Metric::ApparentPower, "apparentPower"},
    {Metric::Voltage, "voltage"},
    {Metric::Current, "current"},
    {Metric::Frequency, "frequency"},
    {Metric::PowerFactor, "powerFactor"},
    {Metric::DownstreamPower, "downstreamPower"},
    {Metric::RemoteLockoutSwitch, "remoteLockoutSwitch"},
    {Metric::ConnectionStats, "connectionStats"},
    {Metric::ClientCount, "clientCount"},
    {Metric::WirelessStatus, "wirelessStatus"},
    {Metric::RadioSettings, "radioSettings"},
    {Metric::PortStatus, "portStatus"},
    {Metric::PortConfig, "portConfig"},
    {Metric::PowerModules, "powerModules"},
}};

}  // anonymous namespace

std::optional<DeviceClass> classify_model(std::string_view model) noexcept {
    for (auto cls : kAllDeviceClasses) {
        if (model.starts_with(model_prefix(cls))) return cls;
    }
    return std::nullopt;
}

DeviceStatus parse_device_status(std::string_view text) noexcept {
    if (text == "online") return DeviceStatus::Online;
    if (text == "offline") return DeviceStatus::Offline;
    if (text == "alerting") return DeviceStatus::Alerting;
    if (text == "dormant") return DeviceStatus::Dormant;
    return DeviceStatus::Unknown;
}

std::string_view to_string(Metric metric) noexcept {
    for (const auto& [m, name] : METRIC_NAMES) {
        if (m == metric) return name;
    }
    return "unknown";
}

std::optional<Metric> parse_metric(std::string_view name) noexcept {
    for (const auto& [m, metric_name] : METRIC_NAMES) {
        if (metric_name == name) return m;
    }
    return std::nullopt;
}

std::string Device::display_name() const {
    if (!name.empty()) return name;
    return model + " " + serial;
}

HubId make_hub_id(const NetworkId& network_id, DeviceClass cls) {
    return network_id + "_" + std::string{model_prefix(cls)};
}

std::string format_iso8601(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%TZ");
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::tm tm{};
    std::istringstream in{std::string{text}};
    if (text.ends_with(" UTC")) {
        in >> std::get_time(&tm, "%b %d, %Y");
    } else {
        in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    }
    if (in.fail()) return std::nullopt;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

}  // namespace fleet_mirror
