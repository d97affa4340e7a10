/**
 * @file telemetry.cpp
 * @brief TelemetryRecord accessors.
 * @author Dimitris Kafetzis
 */

#include "inventory/telemetry.hpp"

#include <type_traits>

namespace fleet_mirror {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::optional<Json::Value>* wireless_slot(WirelessTelemetry& t, Metric metric) {
    switch (metric) {
        case Metric::ConnectionStats: return &t.connection_stats;
        case Metric::ClientCount:     return &t.clients;
        case Metric::WirelessStatus:  return &t.status;
        case Metric::RadioSettings:   return &t.radio_settings;
        default:                      return nullptr;
    }
}

std::optional<Json::Value>* switch_slot(SwitchTelemetry& t, Metric metric) {
    switch (metric) {
        case Metric::PortStatus:   return &t.port_statuses;
        case Metric::PortConfig:   return &t.port_config;
        case Metric::PowerModules: return &t.power_modules;
        default:                   return nullptr;
    }
}

}  // anonymous namespace

TelemetryRecord empty_record(DeviceClass cls) {
    switch (cls) {
        case DeviceClass::Sensor:   return SensorTelemetry{};
        case DeviceClass::Wireless: return WirelessTelemetry{};
        case DeviceClass::Switch:   return SwitchTelemetry{};
        case DeviceClass::Camera:   break;
    }
    return std::monostate{};
}

void set_metric(TelemetryRecord& record, Metric metric, Json::Value payload) {
    std::visit(Overloaded{
        [](std::monostate&) {},
        [&](SensorTelemetry& t) { t.readings[metric] = std::move(payload); },
        [&](WirelessTelemetry& t) {
            if (auto* slot = wireless_slot(t, metric)) *slot = std::move(payload);
        },
        [&](SwitchTelemetry& t) {
            if (auto* slot = switch_slot(t, metric)) *slot = std::move(payload);
        },
    }, record);
}

std::optional<Json::Value> metric_payload(const TelemetryRecord& record, Metric metric) {
    // const_cast keeps one slot table per class; nothing is written
    auto& mutable_record = const_cast<TelemetryRecord&>(record);
    return std::visit(Overloaded{
        [](std::monostate&) -> std::optional<Json::Value> { return std::nullopt; },
        [&](SensorTelemetry& t) -> std::optional<Json::Value> {
            auto it = t.readings.find(metric);
            if (it == t.readings.end()) return std::nullopt;
            return it->second;
        },
        [&](WirelessTelemetry& t) -> std::optional<Json::Value> {
            auto* slot = wireless_slot(t, metric);
            return slot ? *slot : std::nullopt;
        },
        [&](SwitchTelemetry& t) -> std::optional<Json::Value> {
            auto* slot = switch_slot(t, metric);
            return slot ? *slot : std::nullopt;
        },
    }, mutable_record);
}

size_t metric_count(const TelemetryRecord& record) {
    return std::visit(Overloaded{
        [](const std::monostate&) -> size_t { return 0; },
        [](const SensorTelemetry& t) -> size_t { return t.readings.size(); },
        [](const WirelessTelemetry& t) -> size_t {
            return static_cast<size_t>(t.connection_stats.has_value()) + t.clients.has_value() +
                   t.status.has_value() + t.radio_settings.has_value();
        },
        [](const SwitchTelemetry& t) -> size_t {
            return static_cast<size_t>(t.port_statuses.has_value()) + t.port_config.has_value() +
                   t.power_modules.has_value();
        },
    }, record);
}

}  // namespace fleet_mirror
