/**
 * @file wireless.hpp
 * @brief Access point radio and SSID summaries.
 * @author Dimitris Kafetzis
 *
 * Reduces the raw wireless status, radio settings and SSID payloads to the
 * figures the mirror exposes. Missing or wrong-typed members leave the
 * matching field empty.
 */

#pragma once

#include "api/gateway.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "inventory/telemetry.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fleet_mirror {

struct BandSummary {
    std::optional<double> channel_utilization;  ///< Percent
    std::optional<int64_t> channel;
    std::optional<double> data_rate_mbps;
};

struct RadioSummary {
    BandSummary band_2_4;
    BandSummary band_5;
    std::optional<int64_t> rf_power_2_4;        ///< dBm
    std::optional<int64_t> rf_power_5;
    std::optional<int64_t> rf_power;            ///< Highest of the two bands
    std::optional<int64_t> channel_width_5;     ///< MHz
    std::string rf_profile_id;
};

struct SsidSummary {
    size_t total{0};
    size_t enabled{0};
    size_t open{0};     ///< Open or RADIUS-authenticated

    bool operator==(const SsidSummary&) const = default;
};

/// Summarize a getDeviceWirelessStatus payload and a getDeviceWirelessRadioSettings payload.
[[nodiscard]] RadioSummary summarize_radio(const Json::Value& status, const Json::Value& radio_settings);

/// Summarize whatever wireless status and radio settings @p telemetry holds.
[[nodiscard]] RadioSummary summarize_radio(const WirelessTelemetry& telemetry);

/// Count the SSIDs of a getNetworkWirelessSsids payload. Non-object entries are ignored.
[[nodiscard]] SsidSummary summarize_ssids(const Json::Value& payload);

/// SSID list for @p network_id, served from the SSID cache entry when fresh.
[[nodiscard]] Result<Json::Value> fetch_network_ssids(ApiGateway& gateway,
                                                      const NetworkId& network_id,
                                                      std::chrono::seconds ttl);

}  // namespace fleet_mirror
