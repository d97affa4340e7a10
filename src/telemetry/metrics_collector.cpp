/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace fleet_mirror {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_api_call(std::string_view endpoint, Duration duration,
                                       std::optional<ErrorKind> failure) {
    std::ostringstream oss;
    oss << R"({"event":"api_call")"
        << R"(,"endpoint":")" << json_escape(endpoint) << "\""
        << R"(,"duration_ms":)" << duration.count()
        << R"(,"ok":)" << (failure ? "false" : "true");
    if (failure) {
        oss << R"(,"error":")" << to_string(*failure) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_throttle_wait(Duration wait, size_t queue_depth) {
    std::ostringstream oss;
    oss << R"({"event":"throttle_wait")"
        << R"(,"wait_ms":)" << wait.count()
        << R"(,"queue_depth":)" << queue_depth
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_retry(std::string_view operation, uint32_t attempt,
                                    Duration delay, ErrorKind kind) {
    std::ostringstream oss;
    oss << R"({"event":"retry")"
        << R"(,"operation":")" << json_escape(operation) << "\""
        << R"(,"attempt":)" << attempt
        << R"(,"delay_ms":)" << delay.count()
        << R"(,"error":")" << to_string(kind) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_tier_refresh(RefreshTier tier, Duration duration,
                                           uint32_t failed_fetches) {
    std::ostringstream oss;
    oss << R"({"event":"tier_refresh")"
        << R"(,"tier":")" << to_string(tier) << "\""
        << R"(,"duration_ms":)" << duration.count()
        << R"(,"failed_fetches":)" << failed_fetches
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_discovery(const HubId& hub, size_t device_count, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"discovery")"
        << R"(,"hub":")" << json_escape(hub) << "\""
        << R"(,"devices":)" << device_count
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_telemetry_refresh(const HubId& hub, size_t refreshed,
                                                size_t skipped, size_t failed_metrics) {
    std::ostringstream oss;
    oss << R"({"event":"telemetry_refresh")"
        << R"(,"hub":")" << json_escape(hub) << "\""
        << R"(,"refreshed":)" << refreshed
        << R"(,"skipped":)" << skipped
        << R"(,"failed_metrics":)" << failed_metrics
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace fleet_mirror
