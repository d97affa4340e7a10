/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace fleet_mirror {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * One line per event: outbound API calls, limiter waits, retries, tier
 * refreshes, discovery passes and telemetry scans.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_api_call(std::string_view endpoint, Duration duration,
                         std::optional<ErrorKind> failure);
    void record_throttle_wait(Duration wait, size_t queue_depth);
    void record_retry(std::string_view operation, uint32_t attempt, Duration delay, ErrorKind kind);
    void record_tier_refresh(RefreshTier tier, Duration duration, uint32_t failed_fetches);
    void record_discovery(const HubId& hub, size_t device_count, Duration duration);
    void record_telemetry_refresh(const HubId& hub, size_t refreshed, size_t skipped,
                                  size_t failed_metrics);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace fleet_mirror
