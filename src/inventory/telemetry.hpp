/**
 * @file telemetry.hpp
 * @brief Per-device telemetry records, one shape per device class.
 * @author Dimitris Kafetzis
 *
 * Payloads are stored as returned by the provider. A metric that failed
 * this cycle is absent rather than carried over.
 */

#pragma once

#include "core/types.hpp"

#include <json/json.h>

#include <map>
#include <optional>
#include <variant>

namespace fleet_mirror {

struct SensorTelemetry {
    std::map<Metric, Json::Value> readings;     ///< Latest reading per metric
};

struct WirelessTelemetry {
    std::optional<Json::Value> connection_stats;
    std::optional<Json::Value> clients;
    std::optional<Json::Value> status;              ///< Basic service sets per band
    std::optional<Json::Value> radio_settings;
};

struct SwitchTelemetry {
    std::optional<Json::Value> port_statuses;
    std::optional<Json::Value> port_config;
    std::optional<Json::Value> power_modules;
};

using TelemetryRecord = std::variant<std::monostate, SensorTelemetry, WirelessTelemetry, SwitchTelemetry>;

struct DeviceTelemetry {
    Serial serial;
    TelemetryRecord record;
    Timestamp updated_at;
};

/// Store @p payload for @p metric in the record matching its class.
void set_metric(TelemetryRecord& record, Metric metric, Json::Value payload);

/// The payload for @p metric, if present.
[[nodiscard]] std::optional<Json::Value> metric_payload(const TelemetryRecord& record, Metric metric);

/// Number of metrics present.
[[nodiscard]] size_t metric_count(const TelemetryRecord& record);

/// An empty record of the right alternative for @p cls.
[[nodiscard]] TelemetryRecord empty_record(DeviceClass cls);

}  // namespace fleet_mirror
