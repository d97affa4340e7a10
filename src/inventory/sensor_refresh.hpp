/**
 * @file sensor_refresh.hpp
 * @brief Periodic refreshData commands for sensors that support them.
 * @author Dimitris Kafetzis
 *
 * MT15 and MT40 sensors upload readings on demand. The service asks every
 * such sensor of a network to upload on a short fixed interval so the next
 * readings fetch sees fresh values. Commands go through the gateway and so
 * share the organization's rate limit.
 */

#pragma once

#include "api/gateway.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/batch_executor.hpp"
#include "executor/periodic_task.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_mirror {

struct SensorRefreshStats {
    uint64_t attempts{0};
    uint64_t successful{0};
    uint64_t failed{0};
    double success_rate{100.0};     ///< Percent; 100 before the first attempt
    bool running{false};
};

class SensorRefreshService {
public:
    /// Consecutive failures for one sensor before they are logged as warnings.
    static constexpr uint32_t FAILURE_WARN_THRESHOLD = 3;

    using DeviceSource = std::function<std::vector<Device>()>;

    SensorRefreshService(std::string name, ApiGateway& gateway, BatchExecutor& batch, Logger& logger,
                         Duration interval, DeviceSource devices, size_t max_concurrent);
    ~SensorRefreshService();

    SensorRefreshService(const SensorRefreshService&) = delete;
    SensorRefreshService& operator=(const SensorRefreshService&) = delete;

    /// Whether sensors of @p model accept the refreshData command.
    [[nodiscard]] static bool supports_refresh(std::string_view model) noexcept;

    /// Send one round of commands, then keep sending every interval. Idempotent.
    void start();

    /// Stop the timer and log the totals. Idempotent.
    void stop();

    /**
     * @brief Send a command to every supported sensor from the device source.
     *
     * Does nothing unless the service is running. Returns the number of
     * commands attempted.
     */
    size_t refresh_now();

    [[nodiscard]] SensorRefreshStats stats() const;
    [[nodiscard]] uint32_t consecutive_failures(const Serial& serial) const;
    [[nodiscard]] bool running() const;

private:
    void record_success(const Serial& serial);
    void record_failure(const Device& device, const std::string& message);

    std::string name_;
    ApiGateway& gateway_;
    BatchExecutor& batch_;
    Logger& logger_;
    Duration interval_;
    DeviceSource devices_;
    size_t max_concurrent_;

    mutable std::mutex mutex_;
    bool running_{false};
    uint64_t attempts_{0};
    uint64_t successful_{0};
    uint64_t failed_{0};
    std::map<Serial, uint32_t> failure_counts_;
    std::map<Serial, std::string> last_failure_messages_;

    std::unique_ptr<PeriodicTask> timer_;
};

}  // namespace fleet_mirror
