/**
 * @file test_gateway.cpp
 * @brief Unit tests for the cache → retry → limiter call composition.
 * @author Dimitris Kafetzis
 */

#include "api/gateway.hpp"
#include "api/simulated_dashboard.hpp"
#include "core/clock.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace fleet_mirror;

namespace {

constexpr const char* API_KEY = "0123456789abcdef0123456789abcdef01234567";

/// Fails with the key echoed in the message, as a careless proxy might.
class EchoingTransport : public IDashboardApi {
public:
    Result<Json::Value> execute(const ApiRequest& request) override {
        return Error{ErrorKind::Client, "bad request with key " + request.api_key, 400};
    }
};

class ThrowingTransport : public IDashboardApi {
public:
    Result<Json::Value> execute(const ApiRequest&) override {
        throw std::runtime_error("socket closed");
    }
};

/// Throws something outside the std::exception hierarchy.
class ErrnoThrowingTransport : public IDashboardApi {
public:
    Result<Json::Value> execute(const ApiRequest&) override {
        throw 104;
    }
};

}  // namespace

class GatewayTest : public ::testing::Test {
protected:
    MemorySink sink_;
    Logger logger_{std::make_unique<MemorySink>(sink_), LogLevel::Debug};
    ManualClock clock_;
    SimulatedDashboard dashboard_{"org-1"};
    RateLimiter limiter_{RateLimiterOptions{.max_calls_per_second = 100, .max_concurrent = 2}, logger_};
    std::vector<Duration> sleeps_;
    RetryOrchestrator retry_{logger_, [this](Duration d) { sleeps_.push_back(d); }};
    ResponseCache cache_{clock_};

    ApiGateway make_gateway(IDashboardApi& api) {
        return ApiGateway(api, limiter_, retry_, cache_, logger_, Duration{5000});
    }

    void SetUp() override {
        dashboard_.add_network("N_1", "HQ");
        dashboard_.add_device("N_1", "Q2MT-0001", "MT10");
    }
};

TEST_F(GatewayTest, CacheHitCostsNoTransportCall) {
    ApiGateway gateway(dashboard_, limiter_, retry_, cache_, logger_, Duration{5000});
    gateway.set_api_key(API_KEY);

    CallPolicy policy{
        .priority = priority::DISCOVERY,
        .retry = &retry_strategies::DISCOVERY,
        .cache_key = make_cache_key("N_1", "devices"),
        .cache_ttl = std::chrono::seconds{600},
    };
    auto first = gateway.call(endpoint::GET_NETWORK_DEVICES, {"N_1"}, policy);
    auto second = gateway.call(endpoint::GET_NETWORK_DEVICES, {"N_1"}, policy);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->size(), 1u);
    EXPECT_EQ(dashboard_.call_count(endpoint::GET_NETWORK_DEVICES), 1u);
    EXPECT_EQ(cache_.hits(), 1u);
    EXPECT_EQ(gateway.stats().total_calls, 1u);
}

TEST_F(GatewayTest, UncachedCallsAlwaysReachTransport) {
    ApiGateway gateway(dashboard_, limiter_, retry_, cache_, logger_, Duration{5000});
    gateway.set_api_key(API_KEY);
    CallPolicy policy;
    ASSERT_TRUE(gateway.call(endpoint::GET_ORGANIZATION, {"org-1"}, policy).has_value());
    ASSERT_TRUE(gateway.call(endpoint::GET_ORGANIZATION, {"org-1"}, policy).has_value());
    EXPECT_EQ(dashboard_.call_count(endpoint::GET_ORGANIZATION), 2u);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(GatewayTest, RetriesTransientFailuresThroughLimiter) {
    ApiGateway gateway(dashboard_, limiter_, retry_, cache_, logger_, Duration{5000});
    gateway.set_api_key(API_KEY);
    dashboard_.fail_next(endpoint::GET_ORGANIZATION_NETWORKS,
                         SimulatedDashboard::Failure::server_error(), 2);

    CallPolicy policy{.priority = priority::SETUP, .retry = &retry_strategies::SETUP};
    auto result = gateway.call(endpoint::GET_ORGANIZATION_NETWORKS, {"org-1"}, policy);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(dashboard_.call_count(endpoint::GET_ORGANIZATION_NETWORKS), 3u);
    EXPECT_EQ(sleeps_.size(), 2u);
    auto stats = gateway.stats();
    EXPECT_EQ(stats.total_calls, 3u);
    EXPECT_EQ(stats.failed_calls, 2u);
    ASSERT_TRUE(stats.last_error.has_value());
    EXPECT_NE(stats.last_error->find("server"), std::string::npos);
}

TEST_F(GatewayTest, FailuresAreNotCached) {
    ApiGateway gateway(dashboard_, limiter_, retry_, cache_, logger_, Duration{5000});
    gateway.set_api_key(API_KEY);
    dashboard_.fail_next(endpoint::GET_NETWORK_DEVICES, SimulatedDashboard::Failure::not_found());

    CallPolicy policy{.cache_key = std::string{"N_1:devices"}, .cache_ttl = std::chrono::seconds{60}};
    EXPECT_FALSE(gateway.call(endpoint::GET_NETWORK_DEVICES, {"N_1"}, policy).has_value());
    EXPECT_TRUE(gateway.call(endpoint::GET_NETWORK_DEVICES, {"N_1"}, policy).has_value());
    EXPECT_EQ(dashboard_.call_count(endpoint::GET_NETWORK_DEVICES), 2u);
}

TEST_F(GatewayTest, MissingKeyIsRejectedByTransport) {
    ApiGateway gateway(dashboard_, limiter_, retry_, cache_, logger_, Duration{5000});
    EXPECT_FALSE(gateway.has_api_key());
    auto result = gateway.call(endpoint::GET_ORGANIZATION, {"org-1"}, CallPolicy{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Authentication);
    EXPECT_EQ(dashboard_.call_count(endpoint::GET_ORGANIZATION), 1u);
}

TEST_F(GatewayTest, RedactsKeyFromErrorsAndLogs) {
    EchoingTransport transport;
    auto gateway = make_gateway(transport);
    gateway.set_api_key(API_KEY);

    auto result = gateway.call("organizations.getOrganization", {"org-1"}, CallPolicy{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message.find(API_KEY), std::string::npos);
    EXPECT_NE(result.error().message.find("***REDACTED***"), std::string::npos);
    ASSERT_TRUE(result.error().status_code.has_value());
    EXPECT_EQ(*result.error().status_code, 400);
    EXPECT_FALSE(sink_.contains(API_KEY));
}

TEST_F(GatewayTest, TransportExceptionBecomesUnknownError) {
    ThrowingTransport transport;
    auto gateway = make_gateway(transport);
    gateway.set_api_key(API_KEY);
    auto result = gateway.call("organizations.getOrganization", {"org-1"}, CallPolicy{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Unknown);
    EXPECT_NE(result.error().message.find("socket closed"), std::string::npos);
}

TEST_F(GatewayTest, NonStandardTransportExceptionBecomesUnknownError) {
    ErrnoThrowingTransport transport;
    auto gateway = make_gateway(transport);
    gateway.set_api_key(API_KEY);
    auto result = gateway.call("organizations.getOrganization", {"org-1"}, CallPolicy{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Unknown);
    EXPECT_NE(result.error().message.find("non-standard"), std::string::npos);
    EXPECT_EQ(gateway.stats().failed_calls, 1u);
}

TEST_F(GatewayTest, SlowTransportTimesOut) {
    ApiGateway gateway(dashboard_, limiter_, retry_, cache_, logger_, Duration{20});
    gateway.set_api_key(API_KEY);
    dashboard_.set_latency(Duration{200});

    CallPolicy policy{.retry = &retry_strategies::CONFIG_VALIDATION};
    auto result = gateway.call(endpoint::GET_ORGANIZATION, {"org-1"}, policy);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(dashboard_.call_count(endpoint::GET_ORGANIZATION), 2u);
}
