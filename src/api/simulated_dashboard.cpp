/**
 * @file simulated_dashboard.cpp
 * @brief SimulatedDashboard implementation.
 * @author Dimitris Kafetzis
 */

#include "api/simulated_dashboard.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <thread>

namespace fleet_mirror {

namespace {

Error not_found(const ApiRequest& request) {
    return error_from_status(404, "Not found: " + request.describe());
}

std::string synthetic_mac(size_t index) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string mac = "e0:55:3d:00:";
    mac += HEX[(index >> 4) & 0xF];
    mac += HEX[index & 0xF];
    mac += ":";
    mac += HEX[(index >> 12) & 0xF];
    mac += HEX[(index >> 8) & 0xF];
    return mac;
}

Json::Value metric_reading(Metric metric, const Json::Value& value, const std::string& ts) {
    Json::Value reading;
    reading["ts"] = ts;
    reading["metric"] = std::string{to_string(metric)};
    reading[std::string{to_string(metric)}] = value;
    return reading;
}

}  // anonymous namespace

// ── Failure presets ──────────────────────────

SimulatedDashboard::Failure SimulatedDashboard::Failure::server_error() {
    return Failure{ErrorKind::Server, 500, std::nullopt, "Internal server error"};
}

SimulatedDashboard::Failure SimulatedDashboard::Failure::unauthorized() {
    return Failure{ErrorKind::Authentication, 401, std::nullopt, "Invalid API key"};
}

SimulatedDashboard::Failure SimulatedDashboard::Failure::forbidden() {
    return Failure{ErrorKind::Authorization, 403, std::nullopt, "Forbidden"};
}

SimulatedDashboard::Failure SimulatedDashboard::Failure::not_found() {
    return Failure{ErrorKind::Client, 404, std::nullopt, "Not found"};
}

SimulatedDashboard::Failure SimulatedDashboard::Failure::rate_limited(std::chrono::seconds retry_after) {
    return Failure{ErrorKind::RateLimited, 429, retry_after, "Too many requests"};
}

SimulatedDashboard::Failure SimulatedDashboard::Failure::connection_lost() {
    return Failure{ErrorKind::Connection, 0, std::nullopt, "Connection reset by peer"};
}

// ── Construction ─────────────────────────────

SimulatedDashboard::SimulatedDashboard(OrganizationId organization_id, std::string organization_name)
    : organization_id_(std::move(organization_id))
    , organization_name_(std::move(organization_name)) {}

std::unique_ptr<SimulatedDashboard> SimulatedDashboard::from_config(
    const SimulationConfig& config, const OrganizationId& organization_id) {
    auto sim = std::make_unique<SimulatedDashboard>(organization_id);
    static constexpr const char* MODELS[] = {"MT10", "MR46", "MS220-8P", "MV12"};

    for (uint32_t n = 0; n < config.networks; ++n) {
        NetworkId network_id = "N_" + std::to_string(1000 + n);
        sim->add_network(network_id, "Site " + std::to_string(n + 1));
        for (size_t c = 0; c < std::size(MODELS); ++c) {
            for (uint32_t d = 0; d < config.devices_per_class; ++d) {
                std::string model = MODELS[c];
                // every other sensor accepts refresh commands
                if (classify_model(model) == DeviceClass::Sensor && d % 2 == 1) model = "MT40";
                Serial serial = "Q2" + model.substr(0, 2) + "-" + std::to_string(n) +
                                std::to_string(c) + std::to_string(d) + "-SIM";
                sim->add_device(network_id, serial, model);
            }
        }
    }
    sim->set_latency(Duration{config.latency_ms});
    return sim;
}

// ── Fleet scripting ──────────────────────────

void SimulatedDashboard::accept_api_key(std::string key) {
    std::lock_guard lock(mutex_);
    accepted_key_ = std::move(key);
}

void SimulatedDashboard::add_network(const NetworkId& id, const std::string& name) {
    std::lock_guard lock(mutex_);
    networks_.push_back(SimNetwork{id, name});
}

void SimulatedDashboard::add_device(const NetworkId& network_id, const Serial& serial,
                                    const std::string& model, const std::string& name,
                                    DeviceStatus status) {
    std::lock_guard lock(mutex_);
    devices_.push_back(SimDevice{serial, model, name, network_id, status, default_readings(model)});
}

void SimulatedDashboard::remove_device(const Serial& serial) {
    std::lock_guard lock(mutex_);
    std::erase_if(devices_, [&serial](const SimDevice& d) { return d.serial == serial; });
}

void SimulatedDashboard::set_device_status(const Serial& serial, DeviceStatus status) {
    std::lock_guard lock(mutex_);
    for (auto& device : devices_) {
        if (device.serial == serial) device.status = status;
    }
}

void SimulatedDashboard::set_sensor_reading(const Serial& serial, Metric metric, Json::Value value) {
    std::lock_guard lock(mutex_);
    for (auto& device : devices_) {
        if (device.serial == serial) device.readings[metric] = value;
    }
}

void SimulatedDashboard::set_response(std::string_view endpoint, Json::Value payload) {
    std::lock_guard lock(mutex_);
    overrides_.insert_or_assign(std::string{endpoint}, std::move(payload));
}

// ── Failure injection ────────────────────────

void SimulatedDashboard::fail_next(std::string_view endpoint, Failure failure, uint32_t times) {
    std::lock_guard lock(mutex_);
    auto& queue = next_failures_[std::string{endpoint}];
    for (uint32_t i = 0; i < times; ++i) queue.push_back(failure);
}

void SimulatedDashboard::fail_always(std::string_view endpoint, Failure failure) {
    std::lock_guard lock(mutex_);
    persistent_failures_.insert_or_assign(std::string{endpoint}, std::move(failure));
}

void SimulatedDashboard::fail_for(std::string_view endpoint, const std::string& arg, Failure failure) {
    std::lock_guard lock(mutex_);
    arg_failures_.insert_or_assign({std::string{endpoint}, arg}, std::move(failure));
}

void SimulatedDashboard::clear_failures() {
    std::lock_guard lock(mutex_);
    next_failures_.clear();
    persistent_failures_.clear();
    arg_failures_.clear();
}

void SimulatedDashboard::set_latency(Duration latency) {
    std::lock_guard lock(mutex_);
    latency_ = latency;
}

std::optional<SimulatedDashboard::Failure> SimulatedDashboard::pending_failure(const ApiRequest& request) {
    if (request.api_key.empty() || (!accepted_key_.empty() && request.api_key != accepted_key_)) {
        return Failure::unauthorized();
    }
    if (auto it = arg_failures_.find({request.endpoint, request.primary_arg()}); it != arg_failures_.end()) {
        return it->second;
    }
    if (auto it = next_failures_.find(request.endpoint); it != next_failures_.end() && !it->second.empty()) {
        Failure failure = it->second.front();
        it->second.pop_front();
        return failure;
    }
    if (auto it = persistent_failures_.find(request.endpoint); it != persistent_failures_.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ── IDashboardApi ────────────────────────────

Result<Json::Value> SimulatedDashboard::execute(const ApiRequest& request) {
    Duration latency{0};
    std::optional<Failure> failure;
    {
        std::lock_guard lock(mutex_);
        recorded_.push_back(request);
        latency = latency_;
        failure = pending_failure(request);
    }

    size_t current = ++in_flight_;
    size_t seen = max_in_flight_.load();
    while (current > seen && !max_in_flight_.compare_exchange_weak(seen, current)) {
    }

    if (latency.count() > 0) {
        if (latency > request.timeout) {
            std::this_thread::sleep_for(request.timeout);
            --in_flight_;
            return Error{ErrorKind::Timeout, request.describe() + " timed out after " +
                                             std::to_string(request.timeout.count()) + " ms"};
        }
        std::this_thread::sleep_for(latency);
    }
    --in_flight_;

    if (failure) {
        Error err{failure->kind, failure->message + ": " + request.describe()};
        if (failure->status_code != 0) err.status_code = failure->status_code;
        err.retry_after = failure->retry_after;
        return err;
    }

    std::lock_guard lock(mutex_);
    return respond(request);
}

Result<Json::Value> SimulatedDashboard::respond(const ApiRequest& request) const {
    if (auto it = overrides_.find(request.endpoint); it != overrides_.end()) {
        return it->second;
    }

    const std::string& arg = request.primary_arg();
    const std::string_view ep = request.endpoint;

    if (ep == endpoint::GET_ORGANIZATION) {
        if (arg != organization_id_) return not_found(request);
        return organization_payload();
    }
    if (ep == endpoint::GET_ORGANIZATION_NETWORKS) {
        if (arg != organization_id_) return not_found(request);
        return networks_payload();
    }
    if (ep == endpoint::GET_NETWORK_DEVICES) {
        auto known = std::any_of(networks_.begin(), networks_.end(),
                                 [&arg](const SimNetwork& n) { return n.id == arg; });
        if (!known) return not_found(request);
        return network_devices_payload(arg);
    }
    if (ep == endpoint::GET_ORGANIZATION_DEVICES_STATUSES) {
        return statuses_payload();
    }
    if (ep == endpoint::GET_ORGANIZATION_SENSOR_READINGS) {
        return sensor_readings_payload(request.params["serials"]);
    }
    if (ep == endpoint::GET_DEVICE_WIRELESS_CONNECTION_STATS) {
        if (!find_device(arg)) return not_found(request);
        return connection_stats_payload(arg);
    }
    if (ep == endpoint::GET_DEVICE_CLIENTS) {
        if (!find_device(arg)) return not_found(request);
        Json::Value clients{Json::arrayValue};
        for (int i = 0; i < 2; ++i) {
            Json::Value client;
            client["id"] = "k" + std::to_string(i);
            client["mac"] = synthetic_mac(static_cast<size_t>(200 + i));
            client["usage"]["sent"] = 1024 * (i + 1);
            client["usage"]["recv"] = 4096 * (i + 1);
            clients.append(client);
        }
        return clients;
    }
    if (ep == endpoint::GET_DEVICE_WIRELESS_STATUS) {
        if (!find_device(arg)) return not_found(request);
        return wireless_status_payload(arg);
    }
    if (ep == endpoint::GET_DEVICE_WIRELESS_RADIO_SETTINGS) {
        if (!find_device(arg)) return not_found(request);
        Json::Value radio;
        radio["serial"] = arg;
        radio["rfProfileId"] = "1234";
        radio["twoFourGhzSettings"]["channel"] = 11;
        radio["twoFourGhzSettings"]["targetPower"] = 21;
        radio["fiveGhzSettings"]["channel"] = 149;
        radio["fiveGhzSettings"]["channelWidth"] = 40;
        radio["fiveGhzSettings"]["targetPower"] = 15;
        return radio;
    }
    if (ep == endpoint::GET_NETWORK_WIRELESS_SSIDS) {
        auto known = std::any_of(networks_.begin(), networks_.end(),
                                 [&arg](const SimNetwork& n) { return n.id == arg; });
        if (!known) return not_found(request);
        return ssids_payload();
    }
    if (ep == endpoint::CREATE_DEVICE_SENSOR_COMMAND) {
        const auto* device = find_device(arg);
        if (!device || classify_model(device->model) != DeviceClass::Sensor) return not_found(request);
        Json::Value command;
        command["commandId"] = "cmd-" + arg + "-" + std::to_string(recorded_.size());
        command["operation"] = string_field(request.params, "operation");
        command["status"] = "pending";
        return command;
    }
    if (ep == endpoint::GET_DEVICE_SWITCH_PORT_STATUSES) {
        if (!find_device(arg)) return not_found(request);
        return port_statuses_payload(arg);
    }
    if (ep == endpoint::GET_DEVICE_SWITCH_PORTS) {
        if (!find_device(arg)) return not_found(request);
        Json::Value ports{Json::arrayValue};
        for (int p = 1; p <= 8; ++p) {
            Json::Value port;
            port["portId"] = std::to_string(p);
            port["enabled"] = true;
            port["poeEnabled"] = (p <= 4);
            port["type"] = "access";
            port["vlan"] = 1;
            ports.append(port);
        }
        return ports;
    }
    if (ep == endpoint::GET_DEVICE_SWITCH_POWER_MODULES) {
        if (!find_device(arg)) return not_found(request);
        Json::Value modules{Json::arrayValue};
        Json::Value module;
        module["slot"] = 1;
        module["status"] = "powering";
        module["model"] = "PWR-MS320-250WAC";
        modules.append(module);
        return modules;
    }
    if (ep == endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW) {
        Json::Value overview;
        overview["status"] = "OK";
        overview["expirationDate"] =
            format_iso8601(std::chrono::system_clock::now() + std::chrono::hours{24 * 365});
        Json::Value counts{Json::objectValue};
        for (const auto& device : devices_) {
            auto prefix = device.model.substr(0, 2);
            counts[prefix] = counts.get(prefix, 0).asInt() + 1;
        }
        overview["licensedDeviceCounts"] = counts;
        return overview;
    }
    if (ep == endpoint::GET_ORGANIZATION_LICENSES ||
        ep == endpoint::GET_ORGANIZATION_EVENTS ||
        ep == endpoint::GET_ORGANIZATION_ETHERNET_STATUSES ||
        ep == endpoint::GET_NETWORK_BLUETOOTH_CLIENTS) {
        return Json::Value{Json::arrayValue};
    }
    if (ep == endpoint::GET_ORGANIZATION_MEMORY_USAGE) {
        Json::Value usage;
        usage["items"] = Json::Value{Json::arrayValue};
        return usage;
    }
    if (ep == endpoint::GET_ORGANIZATION_CLIENTS_OVERVIEW) {
        Json::Value overview;
        overview["counts"]["total"] = static_cast<Json::UInt64>(devices_.size() * 2);
        overview["usage"]["overall"]["total"] = 0;
        return overview;
    }
    return not_found(request);
}

// ── Payload builders ─────────────────────────

const SimulatedDashboard::SimDevice* SimulatedDashboard::find_device(const Serial& serial) const {
    for (const auto& device : devices_) {
        if (device.serial == serial) return &device;
    }
    return nullptr;
}

Json::Value SimulatedDashboard::organization_payload() const {
    Json::Value org;
    org["id"] = organization_id_;
    org["name"] = organization_name_;
    org["url"] = "https://dashboard.meraki.com/o/" + organization_id_ + "/manage/organization/overview";
    return org;
}

Json::Value SimulatedDashboard::networks_payload() const {
    Json::Value networks{Json::arrayValue};
    for (const auto& network : networks_) {
        Json::Value n;
        n["id"] = network.id;
        n["name"] = network.name;
        n["organizationId"] = organization_id_;
        n["productTypes"] = Json::Value{Json::arrayValue};
        for (auto cls : kAllDeviceClasses) {
            auto has_class = std::any_of(devices_.begin(), devices_.end(), [&](const SimDevice& d) {
                return d.network_id == network.id && classify_model(d.model) == cls;
            });
            if (has_class) n["productTypes"].append(std::string{to_string(cls)});
        }
        networks.append(n);
    }
    return networks;
}

Json::Value SimulatedDashboard::network_devices_payload(const NetworkId& network_id) const {
    Json::Value devices{Json::arrayValue};
    size_t index = 0;
    for (const auto& device : devices_) {
        ++index;
        if (device.network_id != network_id) continue;
        Json::Value d;
        d["serial"] = device.serial;
        d["model"] = device.model;
        d["name"] = device.name;
        d["networkId"] = device.network_id;
        d["mac"] = synthetic_mac(index);
        d["firmware"] = device.model.substr(0, 2) == "MT" ? "sensor-1-42" : "wireless-30-7";
        d["tags"] = Json::Value{Json::arrayValue};
        devices.append(d);
    }
    return devices;
}

Json::Value SimulatedDashboard::statuses_payload() const {
    Json::Value statuses{Json::arrayValue};
    auto now = format_iso8601(std::chrono::system_clock::now());
    for (const auto& device : devices_) {
        Json::Value s;
        s["serial"] = device.serial;
        s["name"] = device.name;
        s["model"] = device.model;
        s["networkId"] = device.network_id;
        s["status"] = std::string{to_string(device.status)};
        s["lastReportedAt"] = now;
        statuses.append(s);
    }
    return statuses;
}

Json::Value SimulatedDashboard::sensor_readings_payload(const Json::Value& serials) const {
    Json::Value result{Json::arrayValue};
    auto ts = format_iso8601(std::chrono::system_clock::now());
    if (!serials.isArray()) return result;
    for (const auto& serial_value : serials) {
        if (!serial_value.isString()) continue;
        const auto* device = find_device(serial_value.asString());
        if (!device || device->readings.empty()) continue;
        Json::Value entry;
        entry["serial"] = device->serial;
        entry["network"]["id"] = device->network_id;
        entry["readings"] = Json::Value{Json::arrayValue};
        for (const auto& [metric, value] : device->readings) {
            entry["readings"].append(metric_reading(metric, value, ts));
        }
        result.append(entry);
    }
    return result;
}

Json::Value SimulatedDashboard::connection_stats_payload(const Serial& serial) const {
    Json::Value stats;
    stats["serial"] = serial;
    stats["connectionStats"]["assoc"] = 0;
    stats["connectionStats"]["auth"] = 1;
    stats["connectionStats"]["dhcp"] = 0;
    stats["connectionStats"]["dns"] = 0;
    stats["connectionStats"]["success"] = 42;
    return stats;
}

Json::Value SimulatedDashboard::wireless_status_payload(const Serial& serial) const {
    Json::Value status;
    status["serial"] = serial;
    status["basicServiceSets"] = Json::Value{Json::arrayValue};
    struct Band {
        const char* name;
        int channel;
        double utilization;
        double rate;
    };
    static constexpr Band BANDS[] = {{"2.4", 11, 37.5, 54.0}, {"5", 149, 12.0, 433.3}};
    for (const auto& band : BANDS) {
        Json::Value bss;
        bss["ssidName"] = "Corp";
        bss["band"] = band.name;
        bss["channel"] = band.channel;
        bss["broadcasting"] = true;
        bss["channelUtilization"]["total"] = band.utilization;
        bss["performance"]["avgDataRateMbps"] = band.rate;
        status["basicServiceSets"].append(bss);
    }
    return status;
}

Json::Value SimulatedDashboard::ssids_payload() {
    struct Ssid {
        int number;
        const char* name;
        bool enabled;
        const char* auth_mode;
    };
    static constexpr Ssid SSIDS[] = {
        {0, "Corp", true, "psk"},
        {1, "Guest", true, "open"},
        {2, "Lab", false, "8021x-radius"},
    };
    Json::Value ssids{Json::arrayValue};
    for (const auto& ssid : SSIDS) {
        Json::Value s;
        s["number"] = ssid.number;
        s["name"] = ssid.name;
        s["enabled"] = ssid.enabled;
        s["authMode"] = ssid.auth_mode;
        ssids.append(s);
    }
    return ssids;
}

Json::Value SimulatedDashboard::port_statuses_payload(const Serial& serial) const {
    Json::Value ports{Json::arrayValue};
    const auto* device = find_device(serial);
    const bool online = device && device->status == DeviceStatus::Online;
    for (int p = 1; p <= 8; ++p) {
        Json::Value port;
        port["portId"] = std::to_string(p);
        port["enabled"] = true;
        port["status"] = (online && p <= 3) ? "Connected" : "Disconnected";
        port["speed"] = (online && p <= 3) ? "1 Gbps" : "";
        port["trafficInKbps"]["total"] = online ? 12.5 * p : 0.0;
        port["powerUsageInWh"] = (p <= 4) ? 3.2 : 0.0;
        ports.append(port);
    }
    return ports;
}

std::map<Metric, Json::Value> SimulatedDashboard::default_readings(const std::string& model) {
    std::map<Metric, Json::Value> readings;
    if (classify_model(model) != DeviceClass::Sensor) return readings;

    auto value = [](std::string_view key, double v) {
        Json::Value out;
        out[std::string{key}] = v;
        return out;
    };

    if (model == "MT12") {
        Json::Value water;
        water["present"] = false;
        readings[Metric::Water] = water;
    } else if (model == "MT30") {
        Json::Value button;
        button["pressType"] = "short";
        readings[Metric::Button] = button;
    } else if (model == "MT40") {
        readings[Metric::RealPower] = value("draw", 12.5);
        readings[Metric::Voltage] = value("level", 230.1);
        readings[Metric::Current] = value("draw", 0.05);
    } else {
        readings[Metric::Temperature] = value("celsius", 21.5);
        readings[Metric::Humidity] = value("relativePercentage", 45.0);
        if (model == "MT20" || model == "MT21") {
            readings[Metric::Battery] = value("percentage", 90.0);
        }
    }
    return readings;
}

// ── Recording ────────────────────────────────

size_t SimulatedDashboard::call_count(std::string_view endpoint) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(recorded_.begin(), recorded_.end(),
        [endpoint](const ApiRequest& r) { return r.endpoint == endpoint; }));
}

size_t SimulatedDashboard::total_calls() const {
    std::lock_guard lock(mutex_);
    return recorded_.size();
}

std::vector<ApiRequest> SimulatedDashboard::recorded_calls() const {
    std::lock_guard lock(mutex_);
    return recorded_;
}

void SimulatedDashboard::reset_recording() {
    std::lock_guard lock(mutex_);
    recorded_.clear();
    max_in_flight_.store(0);
}

}  // namespace fleet_mirror
