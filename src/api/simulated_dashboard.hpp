/**
 * @file simulated_dashboard.hpp
 * @brief In-process dashboard with a scripted fleet.
 * @author Dimitris Kafetzis
 *
 * Serves every endpoint the orchestration layer uses from an in-memory
 * organization. Supports per-endpoint and per-argument failure injection,
 * artificial latency (honoring request timeouts) and call recording. Used by
 * the tests and by the daemon's simulation mode.
 */

#pragma once

#include "api/dashboard_api.hpp"
#include "core/config.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleet_mirror {

class SimulatedDashboard : public IDashboardApi {
public:
    /**
     * @brief A scripted failure returned instead of a payload.
     */
    struct Failure {
        ErrorKind kind{ErrorKind::Server};
        int status_code{500};
        std::optional<std::chrono::seconds> retry_after;
        std::string message{"simulated failure"};

        static Failure server_error();
        static Failure unauthorized();
        static Failure forbidden();
        static Failure not_found();
        static Failure rate_limited(std::chrono::seconds retry_after);
        static Failure connection_lost();
    };

    explicit SimulatedDashboard(OrganizationId organization_id = "org-1",
                                std::string organization_name = "Simulated Organization");

    /// Build a fleet of networks × classes × devices from configuration.
    [[nodiscard]] static std::unique_ptr<SimulatedDashboard> from_config(
        const SimulationConfig& config, const OrganizationId& organization_id);

    // ── Fleet scripting ───────────────────────

    /// Only this key is accepted. Empty (the default) accepts any non-empty key.
    void accept_api_key(std::string key);

    void add_network(const NetworkId& id, const std::string& name);
    void add_device(const NetworkId& network_id, const Serial& serial, const std::string& model,
                    const std::string& name = {}, DeviceStatus status = DeviceStatus::Online);
    void remove_device(const Serial& serial);
    void set_device_status(const Serial& serial, DeviceStatus status);
    void set_sensor_reading(const Serial& serial, Metric metric, Json::Value value);

    /// Serve @p payload for @p endpoint instead of the generated one.
    void set_response(std::string_view endpoint, Json::Value payload);

    // ── Failure injection ─────────────────────

    void fail_next(std::string_view endpoint, Failure failure, uint32_t times = 1);
    void fail_always(std::string_view endpoint, Failure failure);
    /// Fail @p endpoint whenever its first positional argument equals @p arg.
    void fail_for(std::string_view endpoint, const std::string& arg, Failure failure);
    void clear_failures();
    void set_latency(Duration latency);

    // ── IDashboardApi ─────────────────────────

    [[nodiscard]] Result<Json::Value> execute(const ApiRequest& request) override;

    // ── Recording ─────────────────────────────

    [[nodiscard]] size_t call_count(std::string_view endpoint) const;
    [[nodiscard]] size_t total_calls() const;
    [[nodiscard]] std::vector<ApiRequest> recorded_calls() const;
    [[nodiscard]] size_t max_in_flight() const noexcept { return max_in_flight_.load(); }
    void reset_recording();

private:
    struct SimDevice {
        Serial serial;
        std::string model;
        std::string name;
        NetworkId network_id;
        DeviceStatus status;
        std::map<Metric, Json::Value> readings;
    };

    struct SimNetwork {
        NetworkId id;
        std::string name;
    };

    [[nodiscard]] std::optional<Failure> pending_failure(const ApiRequest& request);
    [[nodiscard]] Result<Json::Value> respond(const ApiRequest& request) const;

    [[nodiscard]] Json::Value organization_payload() const;
    [[nodiscard]] Json::Value networks_payload() const;
    [[nodiscard]] Json::Value network_devices_payload(const NetworkId& network_id) const;
    [[nodiscard]] Json::Value statuses_payload() const;
    [[nodiscard]] Json::Value sensor_readings_payload(const Json::Value& serials) const;
    [[nodiscard]] Json::Value connection_stats_payload(const Serial& serial) const;
    [[nodiscard]] Json::Value wireless_status_payload(const Serial& serial) const;
    [[nodiscard]] static Json::Value ssids_payload();
    [[nodiscard]] Json::Value port_statuses_payload(const Serial& serial) const;
    [[nodiscard]] const SimDevice* find_device(const Serial& serial) const;

    static std::map<Metric, Json::Value> default_readings(const std::string& model);

    OrganizationId organization_id_;
    std::string organization_name_;
    std::string accepted_key_;
    std::vector<SimNetwork> networks_;
    std::vector<SimDevice> devices_;
    std::map<std::string, Json::Value, std::less<>> overrides_;

    std::map<std::string, std::deque<Failure>, std::less<>> next_failures_;
    std::map<std::string, Failure, std::less<>> persistent_failures_;
    std::map<std::pair<std::string, std::string>, Failure> arg_failures_;
    Duration latency_{0};

    std::vector<ApiRequest> recorded_;
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> max_in_flight_{0};

    mutable std::mutex mutex_;
};

}  // namespace fleet_mirror
