/**
 * @file capabilities.hpp
 * @brief Which metrics a device can report.
 * @author Dimitris Kafetzis
 *
 * Live sensor readings are authoritative; the per-model table is the
 * fallback for devices that have not reported yet.
 */

#pragma once

#include "core/types.hpp"

#include <json/json.h>

#include <string_view>
#include <vector>

namespace fleet_mirror {

/// Metrics a device of @p model supports according to the static table.
[[nodiscard]] CapabilitySet static_capabilities(std::string_view model);

/// Metrics present in one device's latest-readings entry ({"serial", "readings": [...]}).
[[nodiscard]] CapabilitySet capabilities_from_readings(const Json::Value& device_readings);

/**
 * @brief Live capabilities when @p device_readings names any metric, else the static table.
 */
[[nodiscard]] CapabilitySet resolve_capabilities(std::string_view model,
                                                 const Json::Value& device_readings);

/// The per-device calls a hub issues for @p cls, in issue order.
[[nodiscard]] std::vector<Metric> infrastructure_metrics(DeviceClass cls);

}  // namespace fleet_mirror
