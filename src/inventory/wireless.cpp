/**
 * @file wireless.cpp
 * @brief Radio and SSID summaries.
 * @author Dimitris Kafetzis
 */

#include "inventory/wireless.hpp"

#include "api/dashboard_api.hpp"

#include <algorithm>

namespace fleet_mirror {

namespace {

BandSummary* band_for(RadioSummary& summary, const std::string& band) {
    if (band == "2.4") return &summary.band_2_4;
    if (band == "5") return &summary.band_5;
    return nullptr;
}

void summarize_status(const Json::Value& status, RadioSummary& summary) {
    if (!status.isObject() || !status["basicServiceSets"].isArray()) return;

    for (const auto& bss : status["basicServiceSets"]) {
        if (!bss.isObject()) continue;
        BandSummary* band = band_for(summary, string_field(bss, "band"));
        if (!band) continue;

        // Several SSIDs share a radio; the first one seen fills the band
        const Json::Value& utilization = bss["channelUtilization"];
        if (!band->channel_utilization) {
            if (utilization.isObject()) {
                band->channel_utilization = number_field(utilization, "total");
            } else if (utilization.isNumeric()) {
                band->channel_utilization = utilization.asDouble();
            }
        }
        if (!band->channel) band->channel = integer_field(bss, "channel");
        if (!band->data_rate_mbps) {
            band->data_rate_mbps = number_field(bss["performance"], "avgDataRateMbps");
        }
    }
}

void summarize_settings(const Json::Value& radio, RadioSummary& summary) {
    if (!radio.isObject()) return;

    const Json::Value& profile = radio["rfProfileId"];
    if (profile.isString()) {
        summary.rf_profile_id = profile.asString();
    } else if (profile.isIntegral()) {
        summary.rf_profile_id = std::to_string(profile.asLargestInt());
    }

    summary.rf_power_2_4 = integer_field(radio["twoFourGhzSettings"], "targetPower");
    summary.rf_power_5 = integer_field(radio["fiveGhzSettings"], "targetPower");
    summary.channel_width_5 = integer_field(radio["fiveGhzSettings"], "channelWidth");

    if (summary.rf_power_2_4 && summary.rf_power_5) {
        summary.rf_power = std::max(*summary.rf_power_2_4, *summary.rf_power_5);
    } else if (summary.rf_power_2_4) {
        summary.rf_power = summary.rf_power_2_4;
    } else {
        summary.rf_power = summary.rf_power_5;
    }
}

}  // anonymous namespace

RadioSummary summarize_radio(const Json::Value& status, const Json::Value& radio_settings) {
    RadioSummary summary;
    summarize_status(status, summary);
    summarize_settings(radio_settings, summary);
    return summary;
}

RadioSummary summarize_radio(const WirelessTelemetry& telemetry) {
    return summarize_radio(telemetry.status.value_or(Json::Value{}),
                           telemetry.radio_settings.value_or(Json::Value{}));
}

SsidSummary summarize_ssids(const Json::Value& payload) {
    SsidSummary summary;
    if (!payload.isArray()) return summary;

    for (const auto& ssid : payload) {
        if (!ssid.isObject()) continue;
        ++summary.total;
        if (ssid["enabled"].isBool() && ssid["enabled"].asBool()) ++summary.enabled;
        const std::string auth = string_field(ssid, "authMode");
        if (auth == "open" || auth == "8021x-radius") ++summary.open;
    }
    return summary;
}

Result<Json::Value> fetch_network_ssids(ApiGateway& gateway, const NetworkId& network_id,
                                        std::chrono::seconds ttl) {
    CallPolicy policy{
        .priority = priority::TELEMETRY,
        .retry = &retry_strategies::STANDARD,
        .cache_key = make_cache_key(network_id, "ssids"),
        .cache_ttl = ttl,
    };
    return gateway.call(endpoint::GET_NETWORK_WIRELESS_SSIDS, {network_id}, policy);
}

}  // namespace fleet_mirror
