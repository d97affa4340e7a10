/**
 * @file capabilities.cpp
 * @brief Static capability table and live capability resolution.
 * @author Dimitris Kafetzis
 */

#include "inventory/capabilities.hpp"

#include "api/dashboard_api.hpp"

#include <array>
#include <utility>

namespace fleet_mirror {

namespace {

struct ModelCapabilities {
    std::string_view model;
    std::vector<Metric> metrics;
};

const std::array<ModelCapabilities, 9> SENSOR_MODELS{{
    {"MT10", {Metric::Temperature, Metric::Humidity}},
    {"MT11", {Metric::Temperature}},
    {"MT12", {Metric::Water}},
    {"MT14", {Metric::Temperature, Metric::Humidity, Metric::Pm25, Metric::Tvoc, Metric::Noise}},
    {"MT15", {Metric::Temperature, Metric::Humidity, Metric::Co2, Metric::Pm25, Metric::Tvoc,
              Metric::Noise, Metric::IndoorAirQuality}},
    {"MT20", {Metric::Temperature, Metric::Humidity, Metric::Button, Metric::Door, Metric::Battery}},
    {"MT21", {Metric::Temperature, Metric::Humidity, Metric::Button, Metric::Door, Metric::Battery}},
    {"MT30", {Metric::Button}},
    {"MT40", {Metric::RealPower, Metric::ApparentPower, Metric::Current, Metric::Voltage,
              Metric::Frequency, Metric::PowerFactor}},
}};

}  // anonymous namespace

std::vector<Metric> infrastructure_metrics(DeviceClass cls) {
    switch (cls) {
        case DeviceClass::Wireless:
            return {Metric::ConnectionStats, Metric::ClientCount, Metric::WirelessStatus,
                    Metric::RadioSettings};
        case DeviceClass::Switch:
            return {Metric::PortStatus, Metric::PortConfig, Metric::PowerModules};
        case DeviceClass::Sensor:
        case DeviceClass::Camera:
            break;
    }
    return {};
}

CapabilitySet static_capabilities(std::string_view model) {
    auto cls = classify_model(model);
    if (!cls) return {};

    if (*cls == DeviceClass::Sensor) {
        for (const auto& entry : SENSOR_MODELS) {
            if (entry.model == model) return CapabilitySet(entry.metrics.begin(), entry.metrics.end());
        }
        return {};
    }
    auto metrics = infrastructure_metrics(*cls);
    return CapabilitySet(metrics.begin(), metrics.end());
}

CapabilitySet capabilities_from_readings(const Json::Value& device_readings) {
    CapabilitySet out;
    if (!device_readings.isObject()) return out;
    const Json::Value& readings = device_readings["readings"];
    if (!readings.isArray()) return out;
    for (const auto& reading : readings) {
        if (auto metric = parse_metric(string_field(reading, "metric"))) {
            out.insert(*metric);
        }
    }
    return out;
}

CapabilitySet resolve_capabilities(std::string_view model, const Json::Value& device_readings) {
    if (device_readings.isObject()) {
        auto live = capabilities_from_readings(device_readings);
        if (!live.empty()) return live;
    }
    return static_capabilities(model);
}

}  // namespace fleet_mirror
