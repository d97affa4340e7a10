/**
 * @file sensor_refresh.cpp
 * @brief SensorRefreshService implementation.
 * @author Dimitris Kafetzis
 */

#include "inventory/sensor_refresh.hpp"

#include "api/dashboard_api.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <cctype>

namespace fleet_mirror {

namespace {

constexpr const char* REFRESH_OPERATION = "refreshData";

}  // anonymous namespace

SensorRefreshService::SensorRefreshService(std::string name, ApiGateway& gateway, BatchExecutor& batch,
                                           Logger& logger, Duration interval, DeviceSource devices,
                                           size_t max_concurrent)
    : name_(std::move(name))
    , gateway_(gateway)
    , batch_(batch)
    , logger_(logger)
    , interval_(interval)
    , devices_(std::move(devices))
    , max_concurrent_(std::max<size_t>(max_concurrent, 1)) {}

SensorRefreshService::~SensorRefreshService() {
    stop();
}

bool SensorRefreshService::supports_refresh(std::string_view model) noexcept {
    std::string upper;
    upper.reserve(model.size());
    for (char c : model) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return upper == "MT15" || upper == "MT40";
}

void SensorRefreshService::start() {
    {
        std::lock_guard lock(mutex_);
        if (running_) {
            logger_.debug("sensor_refresh", name_ + " already running");
            return;
        }
        running_ = true;
    }
    logger_.info("sensor_refresh", name_ + " started with " +
                                   std::to_string(std::chrono::duration_cast<std::chrono::seconds>(interval_).count()) +
                                   " s interval");

    (void)refresh_now();

    timer_ = std::make_unique<PeriodicTask>(name_, interval_, [this] { (void)refresh_now(); }, logger_);
    timer_->start();
}

void SensorRefreshService::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    if (timer_) timer_->stop();

    auto s = stats();
    logger_.info("sensor_refresh", name_ + " stopped (" + std::to_string(s.attempts) + " attempts, " +
                                   std::to_string(s.successful) + " successful, " +
                                   std::to_string(s.failed) + " failed)");
}

size_t SensorRefreshService::refresh_now() {
    if (!running()) return 0;

    std::vector<Device> targets;
    for (auto& device : devices_()) {
        if (supports_refresh(device.model) && !device.serial.empty()) {
            targets.push_back(std::move(device));
        }
    }
    if (targets.empty()) {
        logger_.debug("sensor_refresh", name_ + ": no sensors to refresh");
        return 0;
    }

    std::vector<BatchExecutor::Call<Json::Value>> calls;
    calls.reserve(targets.size());
    for (const auto& device : targets) {
        calls.emplace_back([this, serial = device.serial] {
            Json::Value params{Json::objectValue};
            params["operation"] = REFRESH_OPERATION;
            CallPolicy policy{
                .priority = priority::TELEMETRY,
                .retry = &retry_strategies::REALTIME,
            };
            return gateway_.call(endpoint::CREATE_DEVICE_SENSOR_COMMAND, {serial}, policy, params);
        });
    }

    {
        std::lock_guard lock(mutex_);
        attempts_ += targets.size();
    }

    auto results = batch_.run_batched(calls, max_concurrent_, Duration{0});
    for (size_t i = 0; i < results.size(); ++i) {
        const Device& device = targets[i];
        if (!results[i].has_value()) {
            record_failure(device, describe(results[i].error()));
            continue;
        }
        const std::string command_id = string_field(results[i].value(), "commandId");
        if (command_id.empty()) {
            record_failure(device, "response carried no commandId");
            continue;
        }
        record_success(device.serial);
        logger_.debug("sensor_refresh", "refresh command for " + device.serial + " accepted: " + command_id);
    }
    return targets.size();
}

void SensorRefreshService::record_success(const Serial& serial) {
    std::lock_guard lock(mutex_);
    ++successful_;
    if (auto it = failure_counts_.find(serial); it != failure_counts_.end()) {
        it->second = 0;
    }
}

void SensorRefreshService::record_failure(const Device& device, const std::string& message) {
    uint32_t count = 0;
    bool warn = false;
    {
        std::lock_guard lock(mutex_);
        ++failed_;
        count = ++failure_counts_[device.serial];
        if (count >= FAILURE_WARN_THRESHOLD) {
            auto& last = last_failure_messages_[device.serial];
            // Repeats of the same failure are logged once
            if (last != message) {
                last = message;
                warn = true;
            }
        }
    }

    const std::string text = "refresh failed " + std::to_string(count) + " times for " + device.serial +
                             " (" + device.model + "): " + message;
    if (warn) {
        logger_.warn("sensor_refresh", text);
    } else {
        logger_.debug("sensor_refresh", text);
    }
}

SensorRefreshStats SensorRefreshService::stats() const {
    std::lock_guard lock(mutex_);
    SensorRefreshStats out;
    out.attempts = attempts_;
    out.successful = successful_;
    out.failed = failed_;
    out.running = running_;
    if (attempts_ > 0) {
        out.success_rate = 100.0 * static_cast<double>(successful_) / static_cast<double>(attempts_);
    }
    return out;
}

uint32_t SensorRefreshService::consecutive_failures(const Serial& serial) const {
    std::lock_guard lock(mutex_);
    auto it = failure_counts_.find(serial);
    return it == failure_counts_.end() ? 0 : it->second;
}

bool SensorRefreshService::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

}  // namespace fleet_mirror
