/**
 * @file test_sensor_refresh.cpp
 * @brief Unit tests for SensorRefreshService.
 * @author Dimitris Kafetzis
 */

#include "api/simulated_dashboard.hpp"
#include "inventory/device_hub.hpp"
#include "inventory/sensor_refresh.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace fleet_mirror;

namespace {

constexpr const char* API_KEY = "0123456789abcdef0123456789abcdef01234567";

Device sensor(const Serial& serial, const std::string& model) {
    Device device;
    device.serial = serial;
    device.model = model;
    device.network_id = "N_1";
    return device;
}

size_t warnings_mentioning(const MemorySink& sink, std::string_view needle) {
    auto lines = sink.lines();
    return static_cast<size_t>(std::count_if(lines.begin(), lines.end(), [needle](const std::string& line) {
        return line.find(R"("level":"warn")") != std::string::npos && line.find(needle) != std::string::npos;
    }));
}

class NoStatuses : public IDeviceStatusSource {
public:
    std::optional<DeviceStatusEntry> status_of(const Serial&) const override { return std::nullopt; }
    bool status_feed_loaded() const override { return false; }
};

}  // namespace

class SensorRefreshTest : public ::testing::Test {
protected:
    MemorySink sink_;
    Logger logger_{std::make_unique<MemorySink>(sink_)};
    ManualClock clock_;
    SimulatedDashboard sim_{"org-1"};
    RateLimiter limiter_{RateLimiterOptions{.max_calls_per_second = 1000, .max_concurrent = 4}, logger_};
    RetryOrchestrator retry_{logger_, [](Duration) {}};
    ResponseCache cache_{clock_};
    ApiGateway gateway_{sim_, limiter_, retry_, cache_, logger_, Duration{5000}};
    BatchExecutor batch_{3, logger_, [](Duration) {}};
    std::vector<Device> devices_;

    void SetUp() override {
        gateway_.set_api_key(API_KEY);
        sim_.add_network("N_1", "HQ");
        sim_.add_device("N_1", "Q2MT-0015", "MT15", "Meeting room");
        sim_.add_device("N_1", "Q2MT-0040", "MT40", "Rack outlet");
        sim_.add_device("N_1", "Q2MT-0010", "MT10", "Fridge");
        devices_ = {sensor("Q2MT-0015", "MT15"), sensor("Q2MT-0040", "MT40"), sensor("Q2MT-0010", "MT10")};
    }

    std::unique_ptr<SensorRefreshService> make_service() {
        // Long interval: only start() and explicit refresh_now() send commands
        return std::make_unique<SensorRefreshService>(
            "N_1_MT.refresh", gateway_, batch_, logger_, std::chrono::hours{1},
            [this] { return devices_; }, 3);
    }
};

TEST_F(SensorRefreshTest, SupportedModels) {
    EXPECT_TRUE(SensorRefreshService::supports_refresh("MT15"));
    EXPECT_TRUE(SensorRefreshService::supports_refresh("mt40"));
    EXPECT_FALSE(SensorRefreshService::supports_refresh("MT10"));
    EXPECT_FALSE(SensorRefreshService::supports_refresh("MT14"));
    EXPECT_FALSE(SensorRefreshService::supports_refresh(""));
}

TEST_F(SensorRefreshTest, StartSendsCommandsImmediately) {
    auto service = make_service();
    EXPECT_FALSE(service->running());
    EXPECT_DOUBLE_EQ(service->stats().success_rate, 100.0);

    service->start();
    EXPECT_TRUE(service->running());
    EXPECT_EQ(sim_.call_count(endpoint::CREATE_DEVICE_SENSOR_COMMAND), 2u);

    auto calls = sim_.recorded_calls();
    for (const auto& call : calls) {
        if (call.endpoint != endpoint::CREATE_DEVICE_SENSOR_COMMAND) continue;
        EXPECT_NE(call.primary_arg(), "Q2MT-0010");
        EXPECT_EQ(call.params["operation"].asString(), "refreshData");
    }

    auto stats = service->stats();
    EXPECT_EQ(stats.attempts, 2u);
    EXPECT_EQ(stats.successful, 2u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_TRUE(stats.running);
    service->stop();
}

TEST_F(SensorRefreshTest, StartAndStopAreIdempotent) {
    auto service = make_service();
    service->start();
    service->start();
    EXPECT_EQ(sim_.call_count(endpoint::CREATE_DEVICE_SENSOR_COMMAND), 2u);

    service->stop();
    service->stop();
    EXPECT_FALSE(service->running());
    EXPECT_FALSE(service->stats().running);
    EXPECT_TRUE(sink_.contains("2 attempts, 2 successful, 0 failed"));
}

TEST_F(SensorRefreshTest, NothingIsSentWhileStopped) {
    auto service = make_service();
    EXPECT_EQ(service->refresh_now(), 0u);
    EXPECT_EQ(sim_.call_count(endpoint::CREATE_DEVICE_SENSOR_COMMAND), 0u);
}

TEST_F(SensorRefreshTest, NoSupportedSensorsMeansNoCalls) {
    devices_ = {sensor("Q2MT-0010", "MT10")};
    auto service = make_service();
    service->start();
    EXPECT_EQ(sim_.call_count(endpoint::CREATE_DEVICE_SENSOR_COMMAND), 0u);
    EXPECT_EQ(service->stats().attempts, 0u);
    service->stop();
}

TEST_F(SensorRefreshTest, ConsecutiveFailuresResetOnSuccess) {
    sim_.fail_for(endpoint::CREATE_DEVICE_SENSOR_COMMAND, "Q2MT-0040", SimulatedDashboard::Failure::forbidden());
    auto service = make_service();
    service->start();
    (void)service->refresh_now();
    EXPECT_EQ(service->consecutive_failures("Q2MT-0040"), 2u);
    EXPECT_EQ(service->consecutive_failures("Q2MT-0015"), 0u);

    auto stats = service->stats();
    EXPECT_EQ(stats.attempts, 4u);
    EXPECT_EQ(stats.successful, 2u);
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 50.0);

    sim_.clear_failures();
    (void)service->refresh_now();
    EXPECT_EQ(service->consecutive_failures("Q2MT-0040"), 0u);
    service->stop();
}

TEST_F(SensorRefreshTest, RepeatedFailureWarnsOnceAtThreshold) {
    sim_.fail_for(endpoint::CREATE_DEVICE_SENSOR_COMMAND, "Q2MT-0040", SimulatedDashboard::Failure::forbidden());
    auto service = make_service();
    service->start();
    (void)service->refresh_now();
    EXPECT_EQ(warnings_mentioning(sink_, "Q2MT-0040"), 0u);

    (void)service->refresh_now();
    EXPECT_EQ(service->consecutive_failures("Q2MT-0040"), SensorRefreshService::FAILURE_WARN_THRESHOLD);
    EXPECT_EQ(warnings_mentioning(sink_, "Q2MT-0040"), 1u);

    // Same failure again: no new warning
    (void)service->refresh_now();
    EXPECT_EQ(warnings_mentioning(sink_, "Q2MT-0040"), 1u);

    // A different failure is reported
    sim_.fail_for(endpoint::CREATE_DEVICE_SENSOR_COMMAND, "Q2MT-0040", SimulatedDashboard::Failure::not_found());
    (void)service->refresh_now();
    EXPECT_EQ(warnings_mentioning(sink_, "Q2MT-0040"), 2u);
    service->stop();
}

TEST_F(SensorRefreshTest, ResponseWithoutCommandIdIsAFailure) {
    Json::Value payload;
    payload["status"] = "pending";
    sim_.set_response(endpoint::CREATE_DEVICE_SENSOR_COMMAND, payload);

    auto service = make_service();
    service->start();
    auto stats = service->stats();
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.successful, 0u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.0);
    EXPECT_EQ(service->consecutive_failures("Q2MT-0015"), 1u);
    service->stop();
}

TEST_F(SensorRefreshTest, SensorHubRunsServiceWhenEnabled) {
    Config config = default_config();
    NoStatuses statuses;
    HubContext ctx{
        .organization_id = "org-1",
        .gateway = gateway_,
        .batch = batch_,
        .statuses = statuses,
        .config = config,
        .logger = logger_,
        .clock = clock_,
        .metrics = nullptr,
        .ttl = CacheTtl{},
    };

    DeviceInventoryHub sensors(ctx, Network{"N_1", "HQ", "org-1", {}}, DeviceClass::Sensor);
    ASSERT_TRUE(sensors.setup().has_value());
    ASSERT_NE(sensors.sensor_refresh(), nullptr);
    EXPECT_TRUE(sensors.sensor_refresh()->running());
    EXPECT_EQ(sim_.call_count(endpoint::CREATE_DEVICE_SENSOR_COMMAND), 2u);

    sensors.unload();
    EXPECT_FALSE(sensors.sensor_refresh()->running());

    config.features.sensor_refresh_enabled = false;
    DeviceInventoryHub quiet(ctx, Network{"N_1", "HQ", "org-1", {}}, DeviceClass::Sensor);
    ASSERT_TRUE(quiet.setup().has_value());
    EXPECT_EQ(quiet.sensor_refresh(), nullptr);
    quiet.unload();

    DeviceInventoryHub wireless(ctx, Network{"N_1", "HQ", "org-1", {}}, DeviceClass::Wireless);
    config.features.sensor_refresh_enabled = true;
    ASSERT_TRUE(wireless.setup().has_value());
    EXPECT_EQ(wireless.sensor_refresh(), nullptr);
    wireless.unload();
}
