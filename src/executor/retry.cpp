/**
 * @file retry.cpp
 * @brief Retry strategy table and RetryOrchestrator logging.
 * @author Dimitris Kafetzis
 */

#include "executor/retry.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace fleet_mirror {

namespace {

constexpr std::array<const RetryStrategy*, 6> STRATEGIES{
    &retry_strategies::SETUP,
    &retry_strategies::DISCOVERY,
    &retry_strategies::REALTIME,
    &retry_strategies::STATIC_DATA,
    &retry_strategies::CONFIG_VALIDATION,
    &retry_strategies::STANDARD,
};

std::string seconds_text(Duration d) {
    auto tenths = d.count() / 100;
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + "s";
}

}  // anonymous namespace

Duration RetryStrategy::delay_for(uint32_t attempt, const Error& error) const {
    if (error.retry_after) {
        auto hinted = std::chrono::duration_cast<Duration>(*error.retry_after);
        return std::min(hinted, max_delay);
    }
    double scaled = static_cast<double>(base_delay.count()) *
                    std::pow(backoff_factor, static_cast<double>(attempt));
    double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return Duration{static_cast<Duration::rep>(std::llround(capped))};
}

const RetryStrategy& strategy_by_name(std::string_view name) noexcept {
    for (const auto* strategy : STRATEGIES) {
        if (strategy->name == name) return *strategy;
    }
    return retry_strategies::STANDARD;
}

RetryOrchestrator::RetryOrchestrator(Logger& logger, Sleeper sleeper, MetricsCollector* metrics)
    : logger_(logger), sleeper_(std::move(sleeper)), metrics_(metrics) {}

void RetryOrchestrator::cancel() {
    {
        std::lock_guard lock(cancel_mutex_);
        cancelled_ = true;
    }
    cancel_cv_.notify_all();
}

bool RetryOrchestrator::cancelled() const noexcept {
    std::lock_guard lock(cancel_mutex_);
    return cancelled_;
}

void RetryOrchestrator::sleep(Duration delay) {
    if (sleeper_) {
        sleeper_(delay);
        return;
    }
    std::unique_lock lock(cancel_mutex_);
    cancel_cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

void RetryOrchestrator::log_retry(const RetryContext& ctx, const RetryStrategy& strategy,
                                  Duration delay, const Error& error) {
    logger_.warn("retry", ctx.operation + " attempt " + std::to_string(ctx.attempts) + "/" +
                          std::to_string(strategy.max_attempts) + " failed (" + describe(error) +
                          "), retrying in " + seconds_text(delay));
    if (metrics_) {
        metrics_->record_retry(ctx.operation, ctx.attempts, delay, error.kind);
    }
}

void RetryOrchestrator::log_recovered(const RetryContext& ctx) {
    logger_.info("retry", "Operation '" + ctx.operation + "' succeeded after " +
                          std::to_string(ctx.attempts) + " attempts (total delay: " +
                          seconds_text(ctx.total_delay) + ")");
}

void RetryOrchestrator::log_gave_up(const RetryContext& ctx, const Error& error, bool retryable) {
    if (!retryable) {
        logger_.debug("retry", ctx.operation + " failed with non-retryable error: " + describe(error));
        return;
    }
    logger_.error("retry", ctx.operation + " failed after " + std::to_string(ctx.attempts) +
                           " attempts: " + describe(error));
}

}  // namespace fleet_mirror
