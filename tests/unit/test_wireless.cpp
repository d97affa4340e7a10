/**
 * @file test_wireless.cpp
 * @brief Unit tests for radio and SSID summaries.
 * @author Dimitris Kafetzis
 */

#include "inventory/wireless.hpp"

#include <gtest/gtest.h>

using namespace fleet_mirror;

namespace {

Json::Value bss(const char* band, Json::Value utilization, int channel, double rate) {
    Json::Value b;
    b["band"] = band;
    b["channelUtilization"] = std::move(utilization);
    b["channel"] = channel;
    b["performance"]["avgDataRateMbps"] = rate;
    return b;
}

Json::Value utilization_object(double total) {
    Json::Value u;
    u["total"] = total;
    return u;
}

Json::Value ssid(const char* name, bool enabled, const char* auth) {
    Json::Value s;
    s["name"] = name;
    s["enabled"] = enabled;
    s["authMode"] = auth;
    return s;
}

}  // namespace

TEST(WirelessTest, RadioSummaryPerBand) {
    Json::Value status;
    status["basicServiceSets"].append(bss("2.4", utilization_object(40.0), 6, 72.0));
    status["basicServiceSets"].append(bss("5", Json::Value{18.5}, 36, 300.0));

    Json::Value radio;
    radio["rfProfileId"] = 7;
    radio["twoFourGhzSettings"]["targetPower"] = 14;
    radio["fiveGhzSettings"]["targetPower"] = 17;
    radio["fiveGhzSettings"]["channelWidth"] = 80;

    auto summary = summarize_radio(status, radio);
    EXPECT_DOUBLE_EQ(summary.band_2_4.channel_utilization.value_or(-1), 40.0);
    EXPECT_DOUBLE_EQ(summary.band_5.channel_utilization.value_or(-1), 18.5);
    EXPECT_EQ(summary.band_2_4.channel, 6);
    EXPECT_EQ(summary.band_5.channel, 36);
    EXPECT_DOUBLE_EQ(summary.band_5.data_rate_mbps.value_or(-1), 300.0);
    EXPECT_EQ(summary.rf_power_2_4, 14);
    EXPECT_EQ(summary.rf_power_5, 17);
    EXPECT_EQ(summary.rf_power, 17);
    EXPECT_EQ(summary.channel_width_5, 80);
    EXPECT_EQ(summary.rf_profile_id, "7");
}

TEST(WirelessTest, FirstServiceSetOfABandWins) {
    Json::Value status;
    status["basicServiceSets"].append(bss("5", utilization_object(10.0), 44, 200.0));
    status["basicServiceSets"].append(bss("5", utilization_object(90.0), 149, 50.0));

    auto summary = summarize_radio(status, Json::Value{});
    EXPECT_EQ(summary.band_5.channel, 44);
    EXPECT_DOUBLE_EQ(summary.band_5.channel_utilization.value_or(-1), 10.0);
    EXPECT_FALSE(summary.band_2_4.channel.has_value());
}

TEST(WirelessTest, SingleBandPowerIsTheRfPower) {
    Json::Value radio;
    radio["twoFourGhzSettings"]["targetPower"] = 12;
    radio["fiveGhzSettings"] = "unexpected";

    auto summary = summarize_radio(Json::Value{}, radio);
    EXPECT_EQ(summary.rf_power, 12);
    EXPECT_FALSE(summary.rf_power_5.has_value());
    EXPECT_TRUE(summary.rf_profile_id.empty());
}

TEST(WirelessTest, MalformedPayloadsGiveEmptySummary) {
    Json::Value status;
    status["basicServiceSets"] = "none";
    Json::Value radio{Json::arrayValue};
    radio.append(1);

    auto summary = summarize_radio(status, radio);
    EXPECT_FALSE(summary.band_2_4.channel.has_value());
    EXPECT_FALSE(summary.band_5.channel_utilization.has_value());
    EXPECT_FALSE(summary.rf_power.has_value());

    auto from_telemetry = summarize_radio(WirelessTelemetry{});
    EXPECT_FALSE(from_telemetry.rf_power.has_value());
}

TEST(WirelessTest, SsidCounts) {
    Json::Value payload{Json::arrayValue};
    payload.append(ssid("Corp", true, "psk"));
    payload.append(ssid("Guest", true, "open"));
    payload.append(ssid("Radius", false, "8021x-radius"));
    payload.append(ssid("Unconfigured SSID 4", false, "open"));
    payload.append(Json::Value{"stray"});

    EXPECT_EQ(summarize_ssids(payload), (SsidSummary{.total = 4, .enabled = 2, .open = 3}));
    EXPECT_EQ(summarize_ssids(Json::Value{}), SsidSummary{});
}

TEST(WirelessTest, NonBooleanEnabledIsNotCounted) {
    Json::Value payload{Json::arrayValue};
    Json::Value s = ssid("Odd", true, "psk");
    s["enabled"] = "yes";
    payload.append(s);

    auto summary = summarize_ssids(payload);
    EXPECT_EQ(summary.total, 1u);
    EXPECT_EQ(summary.enabled, 0u);
}
