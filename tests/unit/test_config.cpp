/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace fleet_mirror;

namespace {

constexpr const char* VALID_KEY = "0123456789abcdef0123456789abcdef01234567";

}  // namespace

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "fm_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.organization.base_url, "https://api.meraki.com/api/v1");
    EXPECT_EQ(config.rate_limit.max_calls_per_second, 10u);
    EXPECT_EQ(config.rate_limit.max_concurrent, 5u);
    EXPECT_EQ(config.api.timeout_seconds, 30u);
    EXPECT_EQ(config.refresh.sensor_scan_interval_s, 600u);
    EXPECT_EQ(config.refresh.wireless_scan_interval_s, 300u);
    EXPECT_EQ(config.refresh.discovery_interval_s, 3600u);
    EXPECT_EQ(config.cache.standard_ttl_s, 120u);
    EXPECT_EQ(config.cache.extended_ttl_s, 900u);
    EXPECT_EQ(config.cache.long_ttl_s, 1800u);
    EXPECT_EQ(config.batch.max_concurrent, 3u);
    EXPECT_FALSE(config.features.treat_unknown_status_as_online);
    EXPECT_TRUE(config.features.sensor_refresh_enabled);
    EXPECT_EQ(config.refresh.sensor_refresh_interval_s, 5u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [organization]
        api_key = "0123456789abcdef0123456789abcdef01234567"
        organization_id = "123456"
        region = "Canada"

        [rate_limit]
        max_calls_per_second = 8
        max_concurrent = 3
        throttle_window_minutes = 15

        [api]
        timeout_seconds = 20

        [refresh]
        sensor_scan_interval = 120
        discovery_interval = 900
        auto_discovery = false
        dynamic_interval = 60
        mt_refresh_interval = 15

        [refresh.hub_auto_discovery]
        N_1_MT = true

        [cache]
        standard_ttl = 60
        device_list_ttl = 300

        [batch]
        max_concurrent = 2
        inter_batch_delay_ms = 250
        sensor_serials_per_call = 10

        [features]
        enable_camera = false
        selected_devices = ["Q2AA-0001", "Q2AA-0002"]
        treat_unknown_status_as_online = true
        mt_refresh_enabled = false

        [telemetry]
        log_dir = "/tmp/fm_logs"
        log_level = "debug"
        rotate_count = 3

        [simulation]
        networks = 4
        latency_ms = 0
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.organization.organization_id, "123456");
    EXPECT_EQ(config.organization.base_url, "https://api.meraki.ca/api/v1");
    EXPECT_EQ(config.rate_limit.max_calls_per_second, 8u);
    EXPECT_EQ(config.rate_limit.throttle_window_minutes, 15u);
    EXPECT_EQ(config.api.timeout_seconds, 20u);
    EXPECT_EQ(config.refresh.sensor_scan_interval_s, 120u);
    EXPECT_EQ(config.refresh.discovery_interval_s, 900u);
    EXPECT_FALSE(config.refresh.auto_discovery);
    EXPECT_TRUE(auto_discovery_enabled(config.refresh, "N_1_MT"));
    EXPECT_FALSE(auto_discovery_enabled(config.refresh, "N_2_MT"));
    EXPECT_EQ(config.refresh.dynamic_interval_s, 60u);
    EXPECT_EQ(config.refresh.sensor_refresh_interval_s, 15u);
    EXPECT_EQ(config.cache.standard_ttl_s, 60u);
    EXPECT_EQ(config.cache.device_list_ttl_s, 300u);
    EXPECT_EQ(config.batch.inter_batch_delay_ms, 250u);
    EXPECT_EQ(config.batch.sensor_serials_per_call, 10u);
    EXPECT_FALSE(config.features.enable_camera);
    ASSERT_EQ(config.features.selected_devices.size(), 2u);
    EXPECT_EQ(config.features.selected_devices[1], "Q2AA-0002");
    EXPECT_TRUE(config.features.treat_unknown_status_as_online);
    EXPECT_FALSE(config.features.sensor_refresh_enabled);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
    EXPECT_EQ(config.simulation.networks, 4u);
    EXPECT_EQ(config.simulation.latency_ms, 0u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [rate_limit]
        max_calls_per_second = 4
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->rate_limit.max_calls_per_second, 4u);
    // Defaults for everything else
    EXPECT_EQ(result->rate_limit.max_concurrent, 5u);
    EXPECT_EQ(result->refresh.static_interval_s, 3600u);
}

TEST_F(ConfigTest, UnknownRegion) {
    auto path = write_toml(R"(
        [organization]
        region = "Atlantis"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, NegativeIntegerIsRejected) {
    auto path = write_toml(R"(
        [rate_limit]
        max_calls_per_second = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
    EXPECT_NE(result.error().message.find("rate_limit.max_calls_per_second"), std::string::npos);

    path = write_toml(R"(
        [rate_limit]
        max_concurrent = -1
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, OversizedOrNonIntegerValueIsRejected) {
    auto path = write_toml(R"(
        [batch]
        max_concurrent = 5000000000
    )");
    EXPECT_FALSE(load_config(path).has_value());

    path = write_toml(R"(
        [api]
        timeout_seconds = "thirty"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("api.timeout_seconds"), std::string::npos);
}

TEST_F(ConfigTest, MissingOptionalFileUsesDefaults) {
    auto result = load_config_or_default(temp_dir_ / "absent.toml", false);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rate_limit.max_calls_per_second, 10u);

    auto required = load_config_or_default(temp_dir_ / "absent.toml", true);
    ASSERT_FALSE(required.has_value());
    EXPECT_EQ(required.error().kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, BrokenFileIsErrorEvenWhenOptional) {
    auto path = write_toml(R"(
        [organization]
        region = "Atlantis"
    )");
    auto result = load_config_or_default(path, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("Atlantis"), std::string::npos);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
}

TEST(ConfigValidationTest, RejectsMalformedApiKey) {
    auto config = default_config();
    config.organization.api_key = "not-a-key";
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_NE(valid.error().message.find("api_key"), std::string::npos);

    config.organization.api_key = VALID_KEY;
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST(ConfigValidationTest, RejectsOutOfRangeValues) {
    auto config = default_config();
    config.refresh.discovery_interval_s = 60;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.refresh.wireless_scan_interval_s = 10;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.rate_limit.max_calls_per_second = 0;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.organization.base_url = "http://insecure.example";
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.rate_limit.max_calls_per_second = 101;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.rate_limit.max_concurrent = 65;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.batch.sensor_serials_per_call = 500;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.api.timeout_seconds = 3600;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.refresh.sensor_refresh_interval_s = 0;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.refresh.sensor_refresh_interval_s = 61;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.telemetry.log_level = "verbose";
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST(ConfigHelpersTest, RegionalUrls) {
    EXPECT_EQ(regional_base_url("China"), "https://api.meraki.cn/api/v1");
    EXPECT_EQ(regional_base_url("US Government"), "https://api.gov-meraki.com/api/v1");
    EXPECT_FALSE(regional_base_url("Mars").has_value());
}

TEST(ConfigHelpersTest, ApiKeyFormat) {
    EXPECT_TRUE(is_valid_api_key(VALID_KEY));
    EXPECT_FALSE(is_valid_api_key("0123456789abcdef"));
    EXPECT_FALSE(is_valid_api_key("z123456789abcdef0123456789abcdef01234567"));
}

TEST(ConfigHelpersTest, IntervalsByClassAndTier) {
    RefreshConfig refresh;
    EXPECT_EQ(scan_interval(refresh, DeviceClass::Sensor).count(), 600);
    EXPECT_EQ(scan_interval(refresh, DeviceClass::Switch).count(), 300);
    EXPECT_EQ(tier_interval(refresh, RefreshTier::Static).count(), 3600);
    EXPECT_EQ(tier_interval(refresh, RefreshTier::SemiStatic).count(), 1800);
    EXPECT_EQ(tier_interval(refresh, RefreshTier::Dynamic).count(), 300);
}
