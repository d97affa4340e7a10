/**
 * @file device_hub.cpp
 * @brief DeviceInventoryHub implementation.
 * @author Dimitris Kafetzis
 */

#include "inventory/device_hub.hpp"

#include "api/dashboard_api.hpp"
#include "inventory/capabilities.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <numeric>
#include <set>

namespace fleet_mirror {

namespace {

constexpr size_t DISCOVERY_HISTORY = 50;
constexpr int CLIENT_TIMESPAN_S = 3600;

std::string_view endpoint_for(Metric metric) {
    switch (metric) {
        case Metric::ConnectionStats: return endpoint::GET_DEVICE_WIRELESS_CONNECTION_STATS;
        case Metric::ClientCount:     return endpoint::GET_DEVICE_CLIENTS;
        case Metric::WirelessStatus:  return endpoint::GET_DEVICE_WIRELESS_STATUS;
        case Metric::RadioSettings:   return endpoint::GET_DEVICE_WIRELESS_RADIO_SETTINGS;
        case Metric::PortStatus:      return endpoint::GET_DEVICE_SWITCH_PORT_STATUSES;
        case Metric::PortConfig:      return endpoint::GET_DEVICE_SWITCH_PORTS;
        case Metric::PowerModules:    return endpoint::GET_DEVICE_SWITCH_POWER_MODULES;
        default:                      return {};
    }
}

/**
 * @brief Clears a hub's in-flight flag on scope exit unless dismissed.
 *
 * The normal path clears the flag together with the state it publishes and
 * dismisses the guard; any early return or exception clears it here.
 */
class InFlightGuard {
public:
    InFlightGuard(std::mutex& mutex, bool& flag) : mutex_(mutex), flag_(flag) {}
    ~InFlightGuard() {
        if (dismissed_) return;
        std::lock_guard lock(mutex_);
        flag_ = false;
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    void dismiss() noexcept { dismissed_ = true; }

private:
    std::mutex& mutex_;
    bool& flag_;
    bool dismissed_{false};
};

std::vector<std::string> parse_tags(const Json::Value& tags) {
    std::vector<std::string> out;
    if (tags.isArray()) {
        for (const auto& tag : tags) {
            if (tag.isString()) out.push_back(tag.asString());
        }
    } else if (tags.isString()) {
        // older payloads carry a space-separated string
        std::string text = tags.asString();
        size_t pos = 0;
        while (pos < text.size()) {
            size_t end = text.find(' ', pos);
            if (end == std::string::npos) end = text.size();
            if (end > pos) out.push_back(text.substr(pos, end - pos));
            pos = end + 1;
        }
    }
    return out;
}

}  // anonymous namespace

// ── Free helpers ─────────────────────────────

Result<Json::Value> fetch_network_devices(ApiGateway& gateway, const NetworkId& network_id,
                                          std::chrono::seconds ttl) {
    CallPolicy policy{
        .priority = priority::DISCOVERY,
        .retry = &retry_strategies::DISCOVERY,
        .cache_key = make_cache_key(network_id, "devices"),
        .cache_ttl = ttl,
    };
    return gateway.call(endpoint::GET_NETWORK_DEVICES, {network_id}, policy);
}

std::vector<Device> parse_devices(const Json::Value& payload, const NetworkId& network_id) {
    std::vector<Device> devices;
    if (!payload.isArray()) return devices;

    for (const auto& entry : payload) {
        if (!entry.isObject() || !entry["serial"].isString()) continue;
        Device device;
        device.serial = entry["serial"].asString();
        device.model = string_field(entry, "model");
        device.name = string_field(entry, "name");
        device.network_id = string_field(entry, "networkId", network_id);
        device.mac = string_field(entry, "mac");
        device.firmware = string_field(entry, "firmware");
        device.tags = parse_tags(entry["tags"]);
        devices.push_back(std::move(device));
    }
    return devices;
}

// ── Construction ─────────────────────────────

DeviceInventoryHub::DeviceInventoryHub(HubContext& context, Network network, DeviceClass device_class)
    : ctx_(context)
    , network_(std::move(network))
    , device_class_(device_class)
    , id_(make_hub_id(network_.id, device_class)) {}

DeviceInventoryHub::~DeviceInventoryHub() {
    unload();
}

Result<void> DeviceInventoryHub::setup() {
    auto outcome = discover();
    if (!outcome.has_value()) {
        if (outcome.error().is_auth_failure()) {
            return outcome.error();
        }
        ctx_.logger.warn("hub", id_ + ": initial discovery failed, retrying on next timer tick");
    }
    start_timers();
    return {};
}

void DeviceInventoryHub::start_timers() {
    const auto& refresh = ctx_.config.refresh;

    if (auto_discovery_enabled(refresh, id_)) {
        discovery_timer_ = std::make_unique<PeriodicTask>(
            id_ + ".discovery", std::chrono::seconds{refresh.discovery_interval_s},
            [this] {
                auto outcome = discover();
                if (!outcome.has_value()) {
                    ctx_.logger.warn("hub", id_ + ": scheduled discovery failed: " +
                                            describe(outcome.error()));
                }
            },
            ctx_.logger);
        discovery_timer_->start();
    }

    if (!infrastructure_metrics(device_class_).empty() || device_class_ == DeviceClass::Sensor) {
        scan_timer_ = std::make_unique<PeriodicTask>(
            id_ + ".scan", scan_interval(refresh, device_class_),
            [this] { (void)refresh_telemetry(); }, ctx_.logger);
        scan_timer_->start();
    }

    if (device_class_ == DeviceClass::Sensor && ctx_.config.features.sensor_refresh_enabled) {
        sensor_refresh_ = std::make_unique<SensorRefreshService>(
            id_ + ".refresh", ctx_.gateway, ctx_.batch, ctx_.logger,
            std::chrono::seconds{refresh.sensor_refresh_interval_s}, [this] { return devices(); },
            ctx_.config.batch.max_concurrent);
        sensor_refresh_->start();
    }
}

void DeviceInventoryHub::unload() {
    {
        std::lock_guard lock(mutex_);
        if (unloaded_) return;
        unloaded_ = true;
    }
    if (discovery_timer_) discovery_timer_->stop();
    if (scan_timer_) scan_timer_->stop();
    if (sensor_refresh_) sensor_refresh_->stop();
    ctx_.logger.debug("hub", id_ + " unloaded");
}

// ── Discovery ────────────────────────────────

Result<DiscoveryOutcome> DeviceInventoryHub::discover() {
    const auto min_interval = std::chrono::seconds{ctx_.config.refresh.min_discovery_interval_s};
    {
        std::lock_guard lock(mutex_);
        if (unloaded_) return DiscoveryOutcome::Skipped;
        if (discovering_) {
            ctx_.logger.debug("hub", id_ + ": discovery already in progress");
            return DiscoveryOutcome::Skipped;
        }
        if (last_discovery_completed_ && ctx_.clock.now() - *last_discovery_completed_ < min_interval) {
            ctx_.logger.debug("hub", id_ + ": discovery throttled");
            return DiscoveryOutcome::Skipped;
        }
        discovering_ = true;
    }
    InFlightGuard in_flight(mutex_, discovering_);

    const auto started = std::chrono::steady_clock::now();
    auto payload = fetch_network_devices(ctx_.gateway, network_.id, ctx_.ttl.device_list);
    if (!payload.has_value()) {
        ctx_.logger.warn("hub", id_ + ": device discovery failed: " + describe(payload.error()));
        return payload.error();
    }

    const auto& selected = ctx_.config.features.selected_devices;
    std::vector<Device> discovered;
    std::set<Serial> seen;
    for (auto& device : parse_devices(payload.value(), network_.id)) {
        if (classify_model(device.model) != device_class_) continue;
        if (!selected.empty() &&
            std::find(selected.begin(), selected.end(), device.serial) == selected.end()) {
            continue;
        }
        if (!seen.insert(device.serial).second) continue;

        if (auto status = ctx_.statuses.status_of(device.serial)) {
            device.status = status->status;
            device.last_seen = status->last_reported;
        }
        discovered.push_back(std::move(device));
    }

    const auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    size_t previous_count = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto& device : discovered) {
            device.capabilities = capabilities_for(device);
        }
        previous_count = devices_.size();
        devices_ = std::move(discovered);

        std::erase_if(telemetry_, [&seen](const auto& item) { return !seen.contains(item.first); });
        std::erase_if(live_capabilities_, [&seen](const auto& item) { return !seen.contains(item.first); });

        last_discovery_completed_ = ctx_.clock.now();
        last_discovery_ = ctx_.clock.wall_now();
        discovery_durations_.push_back(elapsed);
        if (discovery_durations_.size() > DISCOVERY_HISTORY) discovery_durations_.pop_front();
        ++discovery_count_;
        const bool first = !initialized_;
        initialized_ = true;
        discovering_ = false;
        in_flight.dismiss();

        if (first || previous_count != devices_.size()) {
            ctx_.logger.info("hub", id_ + ": " + std::to_string(devices_.size()) + " " +
                                    std::string{to_string(device_class_)} + " devices (was " +
                                    std::to_string(previous_count) + ")");
        }
    }

    if (ctx_.metrics) {
        ctx_.metrics->record_discovery(id_, seen.size(), elapsed);
    }
    return DiscoveryOutcome::Completed;
}

CapabilitySet DeviceInventoryHub::capabilities_for(const Device& device) const {
    if (auto it = live_capabilities_.find(device.serial);
        it != live_capabilities_.end() && !it->second.empty()) {
        return it->second;
    }
    return static_capabilities(device.model);
}

// ── Telemetry ────────────────────────────────

bool DeviceInventoryHub::eligible(const Serial& serial, std::string& reason) const {
    if (!ctx_.statuses.status_feed_loaded()) return true;

    auto entry = ctx_.statuses.status_of(serial);
    if (!entry) {
        if (ctx_.config.features.treat_unknown_status_as_online) return true;
        reason = "status unknown";
        return false;
    }
    switch (entry->status) {
        case DeviceStatus::Online:
        case DeviceStatus::Alerting:
            return true;
        case DeviceStatus::Unknown:
            if (ctx_.config.features.treat_unknown_status_as_online) return true;
            reason = "status unknown";
            return false;
        case DeviceStatus::Offline:
        case DeviceStatus::Dormant:
            reason = std::string{to_string(entry->status)};
            return false;
    }
    return false;
}

RefreshReport DeviceInventoryHub::refresh_telemetry() {
    RefreshReport report;
    std::vector<Device> devices;
    {
        std::lock_guard lock(mutex_);
        if (unloaded_ || refreshing_) {
            report.skipped_in_flight = true;
            return report;
        }
        refreshing_ = true;
        devices = devices_;
    }
    InFlightGuard in_flight(mutex_, refreshing_);

    std::vector<Device> online;
    for (auto& device : devices) {
        std::string reason;
        if (eligible(device.serial, reason)) {
            online.push_back(std::move(device));
        } else {
            report.skipped.push_back(SkippedDevice{device.serial, std::move(reason)});
        }
    }

    std::map<Serial, TelemetryRecord> records;
    FetchTally tally;
    if (!online.empty()) {
        if (device_class_ == DeviceClass::Sensor) {
            refresh_sensors(online, records, report, tally);
        } else if (!infrastructure_metrics(device_class_).empty()) {
            refresh_infrastructure(online, records, report, tally);
        }
    }
    if (device_class_ == DeviceClass::Wireless && !devices.empty()) {
        refresh_ssids(report);
    }

    const bool class_wide_failure =
        tally.calls > 0 && tally.failures == tally.calls && tally.cache_hits == 0;
    {
        std::lock_guard lock(mutex_);
        const Timestamp now = ctx_.clock.wall_now();
        for (auto& [serial, record] : records) {
            if (metric_count(record) > 0) report.refreshed.push_back(serial);
            telemetry_.insert_or_assign(serial, DeviceTelemetry{serial, std::move(record), now});
        }
        if (tally.calls > 0 || tally.cache_hits > 0) {
            telemetry_available_ = !class_wide_failure;
        }
        last_refresh_ = now;
        refreshing_ = false;
        in_flight.dismiss();
    }

    if (class_wide_failure) {
        ctx_.logger.warn("hub", id_ + ": every telemetry call failed, telemetry unavailable this cycle");
    } else {
        ctx_.logger.debug("hub", id_ + ": refreshed " + std::to_string(report.refreshed.size()) +
                                 ", skipped " + std::to_string(report.skipped.size()) +
                                 ", failed metrics " + std::to_string(report.failed_metrics));
    }
    if (ctx_.metrics) {
        ctx_.metrics->record_telemetry_refresh(id_, report.refreshed.size(), report.skipped.size(),
                                               report.failed_metrics);
    }
    return report;
}

void DeviceInventoryHub::refresh_sensors(const std::vector<Device>& devices,
                                         std::map<Serial, TelemetryRecord>& records,
                                         RefreshReport& report, FetchTally& tally) {
    const size_t per_call = std::max<size_t>(ctx_.config.batch.sensor_serials_per_call, 1);
    const std::string organization_id = ctx_.organization_id;

    std::vector<std::vector<Serial>> chunks;
    for (size_t start = 0; start < devices.size(); start += per_call) {
        std::vector<Serial> chunk;
        for (size_t i = start; i < std::min(start + per_call, devices.size()); ++i) {
            chunk.push_back(devices[i].serial);
        }
        chunks.push_back(std::move(chunk));
    }

    // Readings are always fetched fresh
    std::vector<BatchExecutor::Call<Json::Value>> calls;
    for (const auto& chunk : chunks) {
        Json::Value params{Json::objectValue};
        params["serials"] = Json::Value{Json::arrayValue};
        for (const auto& serial : chunk) params["serials"].append(serial);

        calls.emplace_back([this, organization_id, params] {
            CallPolicy policy{
                .priority = priority::TELEMETRY,
                .retry = &retry_strategies::REALTIME,
            };
            return ctx_.gateway.call(endpoint::GET_ORGANIZATION_SENSOR_READINGS,
                                     {organization_id}, policy, params);
        });
    }

    tally.calls = calls.size();
    auto results = ctx_.batch.run_batched(calls, ctx_.config.batch.max_concurrent,
                                          Duration{ctx_.config.batch.inter_batch_delay_ms});

    std::map<Serial, const Device*> by_serial;
    for (const auto& device : devices) by_serial[device.serial] = &device;

    for (size_t i = 0; i < results.size(); ++i) {
        if (!results[i].has_value()) {
            ++tally.failures;
            report.failed_metrics += chunks[i].size();
            ctx_.logger.warn("hub", id_ + ": sensor readings for " + std::to_string(chunks[i].size()) +
                                    " devices failed: " + describe(results[i].error()));
            continue;
        }

        std::set<Serial> answered;
        const Json::Value& payload = results[i].value();
        if (payload.isArray()) {
            for (const auto& entry : payload) {
                if (!entry.isObject()) continue;
                const Serial serial = string_field(entry, "serial");
                auto device = by_serial.find(serial);
                if (device == by_serial.end()) continue;

                TelemetryRecord record = empty_record(DeviceClass::Sensor);
                for (const auto& reading : entry["readings"]) {
                    if (!reading.isObject()) continue;
                    if (auto metric = parse_metric(string_field(reading, "metric"))) {
                        set_metric(record, *metric, reading);
                    }
                }
                CapabilitySet live = resolve_capabilities(device->second->model, entry);
                {
                    std::lock_guard lock(mutex_);
                    live_capabilities_[serial] = live;
                    for (auto& known : devices_) {
                        if (known.serial == serial) known.capabilities = live;
                    }
                }
                records[serial] = std::move(record);
                answered.insert(serial);
            }
        }
        for (const auto& serial : chunks[i]) {
            if (!answered.contains(serial)) {
                report.skipped.push_back(SkippedDevice{serial, "no readings"});
            }
        }
    }
}

void DeviceInventoryHub::refresh_infrastructure(const std::vector<Device>& devices,
                                                std::map<Serial, TelemetryRecord>& records,
                                                RefreshReport& report, FetchTally& tally) {
    const auto metrics = infrastructure_metrics(device_class_);
    ResponseCache& cache = ctx_.gateway.cache();

    struct Slot {
        Serial serial;
        Metric metric;
        std::string cache_key;
    };
    std::vector<Slot> slots;
    std::vector<BatchExecutor::Call<Json::Value>> calls;

    for (const auto& device : devices) {
        records[device.serial] = empty_record(device_class_);
        for (Metric metric : metrics) {
            std::string key = make_cache_key(device.serial, to_string(metric));
            if (auto cached = cache.get(key)) {
                set_metric(records[device.serial], metric, std::move(*cached));
                ++tally.cache_hits;
                continue;
            }

            Json::Value params{Json::objectValue};
            if (metric == Metric::ConnectionStats || metric == Metric::ClientCount) {
                params["timespan"] = CLIENT_TIMESPAN_S;
            }
            calls.emplace_back([this, serial = device.serial, metric, params] {
                CallPolicy policy{
                    .priority = priority::TELEMETRY,
                    .retry = &retry_strategies::REALTIME,
                };
                return ctx_.gateway.call(endpoint_for(metric), {serial}, policy, params);
            });
            slots.push_back(Slot{device.serial, metric, std::move(key)});
        }
    }

    tally.calls = calls.size();
    auto results = ctx_.batch.run_batched(calls, ctx_.config.batch.max_concurrent,
                                          Duration{ctx_.config.batch.inter_batch_delay_ms});

    for (size_t i = 0; i < results.size(); ++i) {
        const Slot& slot = slots[i];
        if (!results[i].has_value()) {
            ++tally.failures;
            ++report.failed_metrics;
            ctx_.logger.debug("hub", id_ + ": " + std::string{to_string(slot.metric)} + " for " +
                                     slot.serial + " failed: " + describe(results[i].error()));
            continue;
        }
        cache.put(slot.cache_key, results[i].value(), ttl_for(slot.metric));
        set_metric(records[slot.serial], slot.metric, std::move(results[i].value()));
    }
}

void DeviceInventoryHub::refresh_ssids(RefreshReport& report) {
    auto payload = fetch_network_ssids(ctx_.gateway, network_.id, ctx_.ttl.long_lived);
    if (!payload.has_value()) {
        ++report.failed_metrics;
        ctx_.logger.debug("hub", id_ + ": SSID list failed: " + describe(payload.error()));
        return;
    }
    SsidSummary summary = summarize_ssids(payload.value());
    std::lock_guard lock(mutex_);
    ssids_ = summary;
}

std::chrono::seconds DeviceInventoryHub::ttl_for(Metric metric) const noexcept {
    switch (metric) {
        case Metric::ConnectionStats: return ctx_.ttl.extended;
        case Metric::PortConfig:
        case Metric::RadioSettings:   return ctx_.ttl.long_lived;
        default:                      return ctx_.ttl.standard;
    }
}

// ── Accessors ────────────────────────────────

HubState DeviceInventoryHub::state() const {
    std::lock_guard lock(mutex_);
    if (unloaded_) return HubState::Unloaded;
    if (discovering_) return HubState::Discovering;
    if (refreshing_) return HubState::Refreshing;
    return initialized_ ? HubState::Ready : HubState::Uninitialized;
}

std::vector<Device> DeviceInventoryHub::devices() const {
    std::lock_guard lock(mutex_);
    return devices_;
}

size_t DeviceInventoryHub::device_count() const {
    std::lock_guard lock(mutex_);
    return devices_.size();
}

std::optional<DeviceTelemetry> DeviceInventoryHub::telemetry(const Serial& serial) const {
    std::lock_guard lock(mutex_);
    auto it = telemetry_.find(serial);
    if (it == telemetry_.end()) return std::nullopt;
    return it->second;
}

bool DeviceInventoryHub::telemetry_available() const {
    std::lock_guard lock(mutex_);
    return telemetry_available_;
}

std::optional<SsidSummary> DeviceInventoryHub::ssids() const {
    std::lock_guard lock(mutex_);
    return ssids_;
}

HubSnapshot DeviceInventoryHub::snapshot() const {
    HubSnapshot out;
    out.id = id_;
    out.network_id = network_.id;
    out.device_class = device_class_;
    out.state = state();

    std::lock_guard lock(mutex_);
    out.devices = devices_;
    out.telemetry = telemetry_;
    out.telemetry_available = telemetry_available_;
    out.ssids = ssids_;
    out.last_discovery = last_discovery_;
    out.last_refresh = last_refresh_;
    return out;
}

Duration DeviceInventoryHub::average_discovery_duration() const {
    std::lock_guard lock(mutex_);
    if (discovery_durations_.empty()) return Duration{0};
    auto sum = std::accumulate(discovery_durations_.begin(), discovery_durations_.end(), Duration{0});
    return sum / static_cast<Duration::rep>(discovery_durations_.size());
}

uint64_t DeviceInventoryHub::discovery_count() const {
    std::lock_guard lock(mutex_);
    return discovery_count_;
}

}  // namespace fleet_mirror
