/**
 * @file gateway.hpp
 * @brief The composition point for outbound calls.
 * @author Dimitris Kafetzis
 *
 * A call site builds with_cache(with_retry(with_rate_limit(call))): the cache
 * is consulted first so a hit costs no token, each retry attempt re-enters the
 * limiter queue, and only the innermost layer touches the transport. The
 * gateway also keeps the API call diagnostics.
 */

#pragma once

#include "api/dashboard_api.hpp"
#include "cache/response_cache.hpp"
#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "executor/rate_limiter.hpp"
#include "executor/retry.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace fleet_mirror {

class MetricsCollector;

/**
 * @brief How one call site wants its request handled.
 */
struct CallPolicy {
    int priority{priority::TELEMETRY};
    const RetryStrategy* retry{&retry_strategies::STANDARD};
    std::optional<std::string> cache_key;       ///< Unset = never cached
    std::chrono::seconds cache_ttl{0};
};

struct ApiCallStats {
    uint64_t total_calls{0};
    uint64_t failed_calls{0};
    Duration average_duration{0};
    std::optional<std::string> last_error;
};

class ApiGateway {
public:
    ApiGateway(IDashboardApi& api,
               RateLimiter& limiter,
               RetryOrchestrator& retry,
               ResponseCache& cache,
               Logger& logger,
               Duration request_timeout,
               MetricsCollector* metrics = nullptr);

    ApiGateway(const ApiGateway&) = delete;
    ApiGateway& operator=(const ApiGateway&) = delete;

    /// Key stamped on every request and redacted from every error.
    void set_api_key(std::string api_key);
    [[nodiscard]] bool has_api_key() const;

    /// Build the request and run it through cache, retry and limiter per @p policy.
    [[nodiscard]] Result<Json::Value> call(std::string_view endpoint,
                                           std::vector<std::string> args,
                                           const CallPolicy& policy,
                                           Json::Value params = Json::Value{Json::objectValue});

    [[nodiscard]] Result<Json::Value> call(ApiRequest request, const CallPolicy& policy);

    // ── Composition layers ────────────────────

    template <ResultProducer F>
    auto with_rate_limit(F call, int call_priority) {
        return [this, call = std::move(call), call_priority]() mutable {
            return limiter_.execute(call, call_priority);
        };
    }

    template <ResultProducer F>
    auto with_retry(F call, const RetryStrategy& strategy, std::string name) {
        return [this, call = std::move(call), &strategy, name = std::move(name)]() mutable {
            return retry_.run_with_retry(call, strategy, name);
        };
    }

    template <ResultProducer F>
    auto with_cache(F call, std::optional<std::string> key, std::chrono::seconds ttl) {
        return [this, call = std::move(call), key = std::move(key), ttl]() mutable -> Result<Json::Value> {
            if (!key) return call();
            return cache_.get_or_fetch(*key, ttl, call);
        };
    }

    /// One transport attempt: stamps key and timeout, converts exceptions, counts.
    [[nodiscard]] Result<Json::Value> invoke(const ApiRequest& request);

    // ── Diagnostics ──────────────────────────

    [[nodiscard]] ApiCallStats stats() const;
    [[nodiscard]] Duration request_timeout() const noexcept { return request_timeout_; }
    [[nodiscard]] ResponseCache& cache() noexcept { return cache_; }
    [[nodiscard]] RateLimiter& limiter() noexcept { return limiter_; }
    [[nodiscard]] RetryOrchestrator& retry() noexcept { return retry_; }

private:
    void record(const ApiRequest& request, Duration duration, const Result<Json::Value>& result);
    [[nodiscard]] std::string api_key() const;

    IDashboardApi& api_;
    RateLimiter& limiter_;
    RetryOrchestrator& retry_;
    ResponseCache& cache_;
    Logger& logger_;
    Duration request_timeout_;
    MetricsCollector* metrics_;

    mutable std::mutex mutex_;
    std::string api_key_;
    uint64_t total_calls_{0};
    uint64_t failed_calls_{0};
    std::deque<Duration> recent_durations_;
    std::optional<std::string> last_error_;
};

}  // namespace fleet_mirror
