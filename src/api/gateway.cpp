/**
 * @file gateway.cpp
 * @brief ApiGateway implementation.
 * @author Dimitris Kafetzis
 */

#include "api/gateway.hpp"
#include "core/error.hpp"
#include "telemetry/metrics_collector.hpp"

#include <exception>
#include <numeric>

namespace fleet_mirror {

namespace {

constexpr size_t DURATION_WINDOW = 100;

}  // anonymous namespace

ApiGateway::ApiGateway(IDashboardApi& api,
                       RateLimiter& limiter,
                       RetryOrchestrator& retry,
                       ResponseCache& cache,
                       Logger& logger,
                       Duration request_timeout,
                       MetricsCollector* metrics)
    : api_(api)
    , limiter_(limiter)
    , retry_(retry)
    , cache_(cache)
    , logger_(logger)
    , request_timeout_(request_timeout)
    , metrics_(metrics) {}

void ApiGateway::set_api_key(std::string api_key) {
    logger_.set_secret(api_key);
    std::lock_guard lock(mutex_);
    api_key_ = std::move(api_key);
}

bool ApiGateway::has_api_key() const {
    std::lock_guard lock(mutex_);
    return !api_key_.empty();
}

std::string ApiGateway::api_key() const {
    std::lock_guard lock(mutex_);
    return api_key_;
}

Result<Json::Value> ApiGateway::call(std::string_view endpoint,
                                     std::vector<std::string> args,
                                     const CallPolicy& policy,
                                     Json::Value params) {
    ApiRequest request;
    request.endpoint = std::string{endpoint};
    request.args = std::move(args);
    request.params = std::move(params);
    return call(std::move(request), policy);
}

Result<Json::Value> ApiGateway::call(ApiRequest request, const CallPolicy& policy) {
    const std::string name = request.describe();
    const RetryStrategy& strategy = policy.retry ? *policy.retry : retry_strategies::STANDARD;

    auto transport = [this, request = std::move(request)] { return invoke(request); };
    auto composed = with_cache(
        with_retry(with_rate_limit(std::move(transport), policy.priority), strategy, name),
        policy.cache_key, policy.cache_ttl);
    return composed();
}

Result<Json::Value> ApiGateway::invoke(const ApiRequest& request) {
    ApiRequest stamped = request;
    stamped.api_key = api_key();
    stamped.timeout = request_timeout_;

    const std::string& secret = stamped.api_key;
    auto started = std::chrono::steady_clock::now();
    Result<Json::Value> result = [&]() -> Result<Json::Value> {
        try {
            return api_.execute(stamped);
        } catch (const std::exception& ex) {
            return Error{ErrorKind::Unknown, std::string{"transport raised: "} + ex.what()};
        } catch (...) {
            return Error{ErrorKind::Unknown, "transport raised a non-standard exception"};
        }
    }();
    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);

    if (!result.has_value()) {
        Error& err = result.error();
        err.message = redact(std::move(err.message), secret);
    }
    record(request, elapsed, result);
    return result;
}

void ApiGateway::record(const ApiRequest& request, Duration duration,
                        const Result<Json::Value>& result) {
    std::optional<ErrorKind> failure;
    {
        std::lock_guard lock(mutex_);
        ++total_calls_;
        recent_durations_.push_back(duration);
        if (recent_durations_.size() > DURATION_WINDOW) recent_durations_.pop_front();
        if (!result.has_value()) {
            ++failed_calls_;
            last_error_ = describe(result.error());
            failure = result.error().kind;
        }
    }

    if (failure) {
        logger_.debug("gateway", request.describe() + " failed: " + describe(result.error()));
    }
    if (metrics_) {
        metrics_->record_api_call(request.endpoint, duration, failure);
    }
}

ApiCallStats ApiGateway::stats() const {
    std::lock_guard lock(mutex_);
    ApiCallStats out;
    out.total_calls = total_calls_;
    out.failed_calls = failed_calls_;
    out.last_error = last_error_;
    if (!recent_durations_.empty()) {
        auto sum = std::accumulate(recent_durations_.begin(), recent_durations_.end(), Duration{0});
        out.average_duration = sum / static_cast<Duration::rep>(recent_durations_.size());
    }
    return out;
}

}  // namespace fleet_mirror
