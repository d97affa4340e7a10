/**
 * @file dashboard_api.hpp
 * @brief Outbound call shape and the transport interface.
 * @author Dimitris Kafetzis
 *
 * The orchestration layer never interprets endpoints beyond choosing which
 * one to call; a transport executes an ApiRequest and returns the decoded
 * JSON payload or a classified Error.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_mirror {

// ─────────────────────────────────────────────
// Endpoint names
// ─────────────────────────────────────────────

namespace endpoint {
inline constexpr std::string_view GET_ORGANIZATION = "organizations.getOrganization";
inline constexpr std::string_view GET_ORGANIZATION_NETWORKS = "organizations.getOrganizationNetworks";
inline constexpr std::string_view GET_ORGANIZATION_DEVICES_STATUSES = "organizations.getOrganizationDevicesStatuses";
inline constexpr std::string_view GET_ORGANIZATION_LICENSES_OVERVIEW = "organizations.getOrganizationLicensesOverview";
inline constexpr std::string_view GET_ORGANIZATION_LICENSES = "organizations.getOrganizationLicenses";
inline constexpr std::string_view GET_ORGANIZATION_EVENTS = "organizations.getOrganizationEvents";
inline constexpr std::string_view GET_ORGANIZATION_MEMORY_USAGE = "organizations.getOrganizationDevicesSystemMemoryUsageHistoryByInterval";
inline constexpr std::string_view GET_ORGANIZATION_ETHERNET_STATUSES = "wireless.getOrganizationWirelessDevicesEthernetStatuses";
inline constexpr std::string_view GET_ORGANIZATION_CLIENTS_OVERVIEW = "organizations.getOrganizationClientsOverview";
inline constexpr std::string_view GET_ORGANIZATION_SENSOR_READINGS = "sensor.getOrganizationSensorReadingsLatest";
inline constexpr std::string_view GET_NETWORK_DEVICES = "networks.getNetworkDevices";
inline constexpr std::string_view GET_NETWORK_BLUETOOTH_CLIENTS = "networks.getNetworkBluetoothClients";
inline constexpr std::string_view GET_DEVICE_WIRELESS_CONNECTION_STATS = "wireless.getDeviceWirelessConnectionStats";
inline constexpr std::string_view GET_DEVICE_CLIENTS = "devices.getDeviceClients";
inline constexpr std::string_view GET_DEVICE_WIRELESS_STATUS = "wireless.getDeviceWirelessStatus";
inline constexpr std::string_view GET_DEVICE_WIRELESS_RADIO_SETTINGS = "wireless.getDeviceWirelessRadioSettings";
inline constexpr std::string_view GET_NETWORK_WIRELESS_SSIDS = "wireless.getNetworkWirelessSsids";
inline constexpr std::string_view CREATE_DEVICE_SENSOR_COMMAND = "sensor.createDeviceSensorCommand";
inline constexpr std::string_view GET_DEVICE_SWITCH_PORT_STATUSES = "switch.getDeviceSwitchPortsStatuses";
inline constexpr std::string_view GET_DEVICE_SWITCH_PORTS = "switch.getDeviceSwitchPorts";
inline constexpr std::string_view GET_DEVICE_SWITCH_POWER_MODULES = "switch.getDeviceSwitchPowerModulesStatuses";
}  // namespace endpoint

// ─────────────────────────────────────────────
// Payload field access
// ─────────────────────────────────────────────

// Provider payloads are untrusted: a member of the wrong type yields the
// fallback instead of a Json::LogicError.

/// String member @p key of @p object, or @p fallback when absent or not a string.
[[nodiscard]] std::string string_field(const Json::Value& object, const char* key,
                                       std::string fallback = {});

/// Integral member @p key of @p object; nullopt when absent, non-numeric or out of range.
[[nodiscard]] std::optional<int64_t> integer_field(const Json::Value& object, const char* key);

/// Numeric member @p key of @p object, or nullopt.
[[nodiscard]] std::optional<double> number_field(const Json::Value& object, const char* key);

// ─────────────────────────────────────────────
// ApiRequest
// ─────────────────────────────────────────────

/**
 * @brief One outbound call: endpoint, positional args, keyword params, deadline.
 *
 * The API key travels with the request so a transport can stamp its auth
 * header; it is never part of describe().
 */
struct ApiRequest {
    std::string endpoint;
    std::vector<std::string> args;
    Json::Value params{Json::objectValue};
    Duration timeout{30000};
    std::string api_key;

    /// "endpoint(arg1, arg2)" for logs.
    [[nodiscard]] std::string describe() const;

    /// First positional argument, or empty.
    [[nodiscard]] const std::string& primary_arg() const noexcept;
};

// ─────────────────────────────────────────────
// IDashboardApi (Virtual: swappable transport)
// ─────────────────────────────────────────────

/**
 * @brief Executes requests against the provider.
 *
 * Implementations must honor ApiRequest::timeout and report an expired call
 * as ErrorKind::Timeout. They must be safe to call from several threads.
 */
class IDashboardApi {
public:
    virtual ~IDashboardApi() = default;

    [[nodiscard]] virtual Result<Json::Value> execute(const ApiRequest& request) = 0;
};

}  // namespace fleet_mirror
