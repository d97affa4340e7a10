/**
 * @file retry.hpp
 * @brief Classification-driven retry with exponential backoff.
 * @author Dimitris Kafetzis
 *
 * Authentication and authorization failures are terminal. Connection,
 * timeout, rate-limit and server failures are retried up to the strategy's
 * attempt budget; everything else is returned on the first failure.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fleet_mirror {

class MetricsCollector;

// ─────────────────────────────────────────────
// Strategies
// ─────────────────────────────────────────────

struct RetryStrategy {
    std::string_view name;
    uint32_t max_attempts;      ///< Total attempts, first call included
    double backoff_factor;
    Duration base_delay;
    Duration max_delay;

    /**
     * @brief Delay before the retry following failed attempt @p attempt (0-based).
     *
     * min(base * factor^attempt, max); a retry-after hint on @p error
     * replaces the computed value, still capped at max.
     */
    [[nodiscard]] Duration delay_for(uint32_t attempt, const Error& error) const;
};

namespace retry_strategies {
inline constexpr RetryStrategy SETUP{"setup", 5, 2.0, Duration{2000}, Duration{120000}};
inline constexpr RetryStrategy DISCOVERY{"discovery", 3, 1.5, Duration{1000}, Duration{30000}};
inline constexpr RetryStrategy REALTIME{"realtime", 2, 1.2, Duration{500}, Duration{5000}};
inline constexpr RetryStrategy STATIC_DATA{"static_data", 3, 1.5, Duration{1000}, Duration{60000}};
inline constexpr RetryStrategy CONFIG_VALIDATION{"config_validation", 2, 1.0, Duration{500}, Duration{2000}};
inline constexpr RetryStrategy STANDARD{"standard", 3, 1.5, Duration{1000}, Duration{60000}};
}  // namespace retry_strategies

/// Look a strategy up by name; unknown names get the standard strategy.
[[nodiscard]] const RetryStrategy& strategy_by_name(std::string_view name) noexcept;

/**
 * @brief Per-invocation retry bookkeeping.
 */
struct RetryContext {
    std::string operation;
    uint32_t attempts{0};
    Duration total_delay{0};
    std::optional<ErrorKind> last_error;
};

// ─────────────────────────────────────────────
// RetryOrchestrator
// ─────────────────────────────────────────────

class RetryOrchestrator {
public:
    using Sleeper = std::function<void(Duration)>;

    /// With no sleeper, delays are interruptible waits ended early by cancel().
    explicit RetryOrchestrator(Logger& logger, Sleeper sleeper = {},
                               MetricsCollector* metrics = nullptr);

    /**
     * @brief Run @p operation until it succeeds or the strategy gives up.
     *
     * On exhaustion the last error is returned unchanged. @p context, when
     * given, receives the attempt count and accumulated delay.
     */
    template <ResultProducer F>
    std::invoke_result_t<F> run_with_retry(F&& operation,
                                           const RetryStrategy& strategy,
                                           std::string_view name,
                                           RetryContext* context = nullptr);

    /// Wake pending delays and refuse further retries. Used at shutdown.
    void cancel();
    [[nodiscard]] bool cancelled() const noexcept;

private:
    void sleep(Duration delay);
    void log_retry(const RetryContext& ctx, const RetryStrategy& strategy,
                   Duration delay, const Error& error);
    void log_recovered(const RetryContext& ctx);
    void log_gave_up(const RetryContext& ctx, const Error& error, bool retryable);

    Logger& logger_;
    Sleeper sleeper_;
    MetricsCollector* metrics_;

    mutable std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
    bool cancelled_{false};
};

// ── Template implementations ─────────────────

template <ResultProducer F>
std::invoke_result_t<F> RetryOrchestrator::run_with_retry(F&& operation,
                                                          const RetryStrategy& strategy,
                                                          std::string_view name,
                                                          RetryContext* context) {
    RetryContext local;
    RetryContext& ctx = context ? *context : local;
    ctx.operation = std::string{name};

    const uint32_t budget = strategy.max_attempts == 0 ? 1 : strategy.max_attempts;
    for (uint32_t attempt = 0;; ++attempt) {
        ++ctx.attempts;
        auto result = operation();
        if (result.has_value()) {
            if (ctx.attempts > 1) log_recovered(ctx);
            return result;
        }

        const Error& error = result.error();
        ctx.last_error = error.kind;

        const bool retryable = is_retryable(error.kind);
        if (!retryable || attempt + 1 >= budget || cancelled()) {
            log_gave_up(ctx, error, retryable);
            return result;
        }

        Duration delay = strategy.delay_for(attempt, error);
        log_retry(ctx, strategy, delay, error);
        ctx.total_delay += delay;
        sleep(delay);
    }
}

}  // namespace fleet_mirror
