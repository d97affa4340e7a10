/**
 * @file test_fleet_hub.cpp
 * @brief Unit tests for FleetHub setup, hub creation, tiers and unload.
 * @author Dimitris Kafetzis
 */

#include "api/simulated_dashboard.hpp"
#include "fleet/fleet_hub.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace fleet_mirror;

namespace {

constexpr const char* API_KEY = "0123456789abcdef0123456789abcdef01234567";

}  // namespace

class FleetHubTest : public ::testing::Test {
protected:
    MemorySink sink_;
    Logger logger_{std::make_unique<MemorySink>(sink_), LogLevel::Debug};
    ManualClock clock_;
    Config config_ = default_config();
    SimulatedDashboard sim_{"org-1"};
    RateLimiter limiter_{RateLimiterOptions{.max_calls_per_second = 1000, .max_concurrent = 4}, logger_};
    RetryOrchestrator retry_{logger_, [](Duration) {}};
    ResponseCache cache_{clock_};
    ApiGateway gateway_{sim_, limiter_, retry_, cache_, logger_, Duration{5000}};
    BatchExecutor batch_{3, logger_, [](Duration) {}};

    void SetUp() override {
        sim_.add_network("N_1", "HQ");
        sim_.add_network("N_2", "Branch");
        sim_.add_device("N_1", "Q2MT-0001", "MT10");
        sim_.add_device("N_1", "Q2MT-0002", "MT10", {}, DeviceStatus::Offline);
        sim_.add_device("N_1", "Q2MR-0001", "MR46");
        sim_.add_device("N_2", "Q2MS-0001", "MS220-8P");
        sim_.add_device("N_2", "Q2MV-0001", "MV12");
    }

    std::unique_ptr<FleetHub> make_fleet() {
        return std::make_unique<FleetHub>(gateway_, batch_, config_, logger_, clock_);
    }
};

// ── Setup ────────────────────────────────────

TEST_F(FleetHubTest, MissingKeyIsAuthenticationError) {
    auto fleet = make_fleet();
    auto result = fleet->setup("", "org-1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Authentication);
    EXPECT_EQ(result.error().message, "No API key configured");
    EXPECT_EQ(sim_.total_calls(), 0u);
    EXPECT_EQ(fleet->state(), FleetState::Setup);
}

TEST_F(FleetHubTest, MissingOrganizationIsConfigurationError) {
    auto fleet = make_fleet();
    auto result = fleet->setup(API_KEY, "");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
}

TEST_F(FleetHubTest, RejectedKeyIsTerminal) {
    sim_.accept_api_key("ffffffffffffffffffffffffffffffffffffffff");
    auto fleet = make_fleet();
    auto result = fleet->setup(API_KEY, "org-1");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_auth_failure());
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION), 1u);
    EXPECT_EQ(fleet->state(), FleetState::Setup);
    EXPECT_FALSE(sink_.contains(API_KEY));
}

TEST_F(FleetHubTest, UnknownOrganizationFailsSetup) {
    auto fleet = make_fleet();
    auto result = fleet->setup(API_KEY, "org-2");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Client);
    EXPECT_EQ(result.error().status_code.value_or(0), 404);
    EXPECT_FALSE(fleet->organization().has_value());
}

TEST_F(FleetHubTest, TransientSetupFailureIsRetried) {
    sim_.fail_next(endpoint::GET_ORGANIZATION, SimulatedDashboard::Failure::rate_limited(std::chrono::seconds{1}), 2);
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION), 3u);
}

TEST_F(FleetHubTest, SetupLoadsOrganizationAndTiers) {
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    EXPECT_EQ(fleet->state(), FleetState::Ready);

    auto org = fleet->organization();
    ASSERT_TRUE(org.has_value());
    EXPECT_EQ(org->id, "org-1");
    EXPECT_EQ(org->base_url, config_.organization.base_url);
    ASSERT_EQ(fleet->networks().size(), 2u);
    EXPECT_EQ(fleet->networks()[1].name, "Branch");

    for (auto tier : kAllTiers) {
        EXPECT_TRUE(fleet->tiers().last_updated(tier).has_value());
        EXPECT_EQ(fleet->tiers().freshness(tier), Freshness::Fresh);
    }

    auto licenses = fleet->license_summary();
    EXPECT_EQ(licenses.licensing_model, "co-term");
    EXPECT_EQ(licenses.licensed_device_counts.at("MT"), 2);

    EXPECT_TRUE(fleet->status_feed_loaded());
    auto offline = fleet->status_of("Q2MT-0002");
    ASSERT_TRUE(offline.has_value());
    EXPECT_EQ(offline->status, DeviceStatus::Offline);
    EXPECT_FALSE(fleet->status_of("nope").has_value());
    EXPECT_EQ(fleet->status_overview().online, 4u);

    EXPECT_EQ(fleet->client_total(), 10u);
    EXPECT_EQ(fleet->bluetooth_clients().size(), 2u);
    EXPECT_EQ(fleet->alert_summary().active_alerts, 0u);
}

TEST_F(FleetHubTest, LicenseFallbackToPerDevice) {
    sim_.fail_always(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW, SimulatedDashboard::Failure::not_found());
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    EXPECT_EQ(fleet->license_summary().licensing_model, "per-device");
    EXPECT_EQ(fleet->diagnostics().failed_tier_fetches, 0u);
}

TEST_F(FleetHubTest, LicensingUnavailableWhenBothFail) {
    sim_.fail_always(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW, SimulatedDashboard::Failure::forbidden());
    sim_.fail_always(endpoint::GET_ORGANIZATION_LICENSES, SimulatedDashboard::Failure::forbidden());
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());

    auto licenses = fleet->license_summary();
    EXPECT_EQ(licenses.licensing_model, "unavailable");
    EXPECT_EQ(licenses.status, "Unable to determine licensing model");
    EXPECT_EQ(fleet->diagnostics().failed_tier_fetches, 1u);
}

TEST_F(FleetHubTest, MalformedLicensePayloadDoesNotAbortSetup) {
    Json::Value overview;
    overview["status"] = Json::Value{Json::objectValue};
    overview["licensedDeviceCounts"]["MR"] = "unlimited";
    overview["licensedDeviceCounts"]["MT"] = 3;
    sim_.set_response(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW, overview);

    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    auto licenses = fleet->license_summary();
    EXPECT_EQ(licenses.licensing_model, "co-term");
    EXPECT_EQ(licenses.licensed_device_counts.count("MR"), 0u);
    EXPECT_EQ(licenses.licensed_device_counts.at("MT"), 3);
    EXPECT_TRUE(fleet->tiers().last_updated(RefreshTier::Static).has_value());
    EXPECT_EQ(fleet->diagnostics().failed_tier_fetches, 0u);
}

TEST_F(FleetHubTest, FailedTierFetchKeepsTierRunning) {
    sim_.fail_always(endpoint::GET_ORGANIZATION_DEVICES_STATUSES, SimulatedDashboard::Failure::server_error());
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    EXPECT_FALSE(fleet->status_feed_loaded());
    EXPECT_TRUE(fleet->tiers().last_updated(RefreshTier::SemiStatic).has_value());
    EXPECT_GE(fleet->diagnostics().failed_tier_fetches, 1u);
}

// ── Hubs ─────────────────────────────────────

TEST_F(FleetHubTest, CreatesHubPerPresentEnabledClass) {
    config_.features.enable_camera = false;
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());

    auto created = fleet->create_device_class_hubs();
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(*created, 3u);
    EXPECT_NE(fleet->hub("N_1_MT"), nullptr);
    EXPECT_NE(fleet->hub("N_1_MR"), nullptr);
    EXPECT_NE(fleet->hub("N_2_MS"), nullptr);
    EXPECT_EQ(fleet->hub("N_2_MV"), nullptr);
    EXPECT_EQ(fleet->hub("N_1_MT")->device_count(), 2u);

    // Second call creates nothing new
    auto again = fleet->create_device_class_hubs();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, 0u);
}

TEST_F(FleetHubTest, FailingNetworkIsSkipped) {
    sim_.fail_for(endpoint::GET_NETWORK_DEVICES, "N_2", SimulatedDashboard::Failure::server_error());
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());

    auto created = fleet->create_device_class_hubs();
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(*created, 2u);
    EXPECT_EQ(fleet->hub("N_2_MS"), nullptr);
    EXPECT_TRUE(sink_.contains("Skipping network N_2"));
}

TEST_F(FleetHubTest, HubsUseFleetStatusFeed) {
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    ASSERT_TRUE(fleet->create_device_class_hubs().has_value());

    auto* sensors = fleet->hub("N_1_MT");
    ASSERT_NE(sensors, nullptr);
    auto report = sensors->refresh_telemetry();
    ASSERT_EQ(report.refreshed.size(), 1u);
    EXPECT_EQ(report.refreshed[0], "Q2MT-0001");
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].reason, "offline");
}

// ── Tiers ────────────────────────────────────

TEST_F(FleetHubTest, RunDueTiersRefreshesOnlyElapsedTiers) {
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    const auto events_before = sim_.call_count(endpoint::GET_ORGANIZATION_EVENTS);
    const auto statuses_before = sim_.call_count(endpoint::GET_ORGANIZATION_DEVICES_STATUSES);
    const auto licenses_before = sim_.call_count(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW);

    fleet->run_due_tiers();
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION_EVENTS), events_before);

    clock_.advance(std::chrono::seconds{config_.refresh.dynamic_interval_s});
    fleet->run_due_tiers();
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION_EVENTS), events_before + 1);
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION_DEVICES_STATUSES), statuses_before);
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW), licenses_before);
}

TEST_F(FleetHubTest, ForceRefreshRunsEveryTierRegardlessOfInterval) {
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    const auto events_before = sim_.call_count(endpoint::GET_ORGANIZATION_EVENTS);
    const auto statuses_before = sim_.call_count(endpoint::GET_ORGANIZATION_DEVICES_STATUSES);
    const auto licenses_before = sim_.call_count(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW);

    fleet->force_refresh_all_tiers();
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION_EVENTS), events_before + 1);
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION_DEVICES_STATUSES), statuses_before + 1);
    EXPECT_EQ(sim_.call_count(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW), licenses_before + 1);
}

TEST_F(FleetHubTest, EventsRequestCoversLastDay) {
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());

    bool found = false;
    for (const auto& call : sim_.recorded_calls()) {
        if (call.endpoint != endpoint::GET_ORGANIZATION_EVENTS) continue;
        found = true;
        EXPECT_EQ(call.params["perPage"].asInt(), 100);
        auto start = parse_timestamp(call.params["startingAfter"].asString());
        auto end = parse_timestamp(call.params["endingBefore"].asString());
        ASSERT_TRUE(start && end);
        EXPECT_EQ(std::chrono::duration_cast<std::chrono::hours>(*end - *start).count(), 24);
    }
    EXPECT_TRUE(found);
}

// ── Lifecycle ────────────────────────────────

TEST_F(FleetHubTest, UnloadIsIdempotent) {
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    ASSERT_TRUE(fleet->create_device_class_hubs().has_value());
    auto* hub = fleet->hub("N_1_MT");
    ASSERT_NE(hub, nullptr);

    fleet->unload();
    EXPECT_EQ(fleet->state(), FleetState::Unloaded);
    EXPECT_TRUE(fleet->hubs().empty());
    fleet->unload();
    EXPECT_EQ(fleet->state(), FleetState::Unloaded);

    EXPECT_FALSE(fleet->setup(API_KEY, "org-1").has_value());
    EXPECT_FALSE(fleet->create_device_class_hubs().has_value());
}

TEST_F(FleetHubTest, DiagnosticsSummarizeFleet) {
    auto fleet = make_fleet();
    ASSERT_TRUE(fleet->setup(API_KEY, "org-1").has_value());
    ASSERT_TRUE(fleet->create_device_class_hubs().has_value());

    auto diag = fleet->diagnostics();
    EXPECT_EQ(diag.state, FleetState::Ready);
    EXPECT_EQ(diag.network_count, 2u);
    EXPECT_EQ(diag.hub_count, 4u);
    EXPECT_EQ(diag.device_count, 5u);
    EXPECT_GT(diag.api.total_calls, 0u);
    EXPECT_EQ(diag.api.failed_calls, 0u);
    EXPECT_EQ(diag.queue_depth, 0u);
    ASSERT_EQ(diag.tiers.size(), 3u);
    EXPECT_EQ(diag.tiers[2].tier, RefreshTier::Dynamic);
    EXPECT_EQ(diag.tiers[2].interval.count(), 300);
    EXPECT_GT(diag.cache_hits, 0u);
}
