/**
 * @file fleet_hub.cpp
 * @brief FleetHub implementation.
 * @author Dimitris Kafetzis
 */

#include "fleet/fleet_hub.hpp"

#include "api/dashboard_api.hpp"
#include "telemetry/metrics_collector.hpp"

#include <exception>
#include <set>

namespace fleet_mirror {

namespace {

constexpr int EVENTS_PER_PAGE = 100;
constexpr int MEMORY_INTERVAL_S = 300;
constexpr int USAGE_TIMESPAN_S = 3600;
constexpr int BLUETOOTH_PER_PAGE = 1000;

std::vector<Network> parse_networks(const Json::Value& payload, const OrganizationId& organization_id) {
    std::vector<Network> networks;
    if (!payload.isArray()) return networks;
    for (const auto& entry : payload) {
        if (!entry.isObject() || !entry["id"].isString()) continue;
        Network network;
        network.id = entry["id"].asString();
        network.name = string_field(entry, "name", network.id);
        network.organization_id = organization_id;
        for (const auto& type : entry["productTypes"]) {
            if (type.isString()) network.product_types.push_back(type.asString());
        }
        networks.push_back(std::move(network));
    }
    return networks;
}

}  // anonymous namespace

FleetHub::FleetHub(ApiGateway& gateway,
                   BatchExecutor& batch,
                   const Config& config,
                   Logger& logger,
                   const IClock& clock,
                   MetricsCollector* metrics)
    : gateway_(gateway)
    , batch_(batch)
    , config_(config)
    , logger_(logger)
    , clock_(clock)
    , metrics_(metrics)
    , hub_context_{
          .organization_id = {},
          .gateway = gateway,
          .batch = batch,
          .statuses = *this,
          .config = config,
          .logger = logger,
          .clock = clock,
          .metrics = metrics,
          .ttl = CacheTtl::from_config(config.cache),
      }
    , tiers_(config.refresh, clock) {}

FleetHub::~FleetHub() {
    unload();
}

// ── Setup ────────────────────────────────────

Result<void> FleetHub::setup(const std::string& api_key, const OrganizationId& organization_id) {
    if (state_ == FleetState::Unloaded) {
        return Error{ErrorKind::Configuration, "Fleet hub is unloaded"};
    }
    if (api_key.empty()) {
        return Error{ErrorKind::Authentication, "No API key configured"};
    }
    if (organization_id.empty()) {
        return Error{ErrorKind::Configuration, "No organization id configured"};
    }
    gateway_.set_api_key(api_key);
    hub_context_.organization_id = organization_id;

    auto org = fetch(endpoint::GET_ORGANIZATION, organization_id,
                     retry_strategies::SETUP, priority::SETUP);
    if (!org.has_value()) {
        logger_.error("fleet_hub", "Failed to fetch organization " + organization_id + ": " +
                                   describe(org.error()));
        return org.error();
    }

    auto networks = fetch(endpoint::GET_ORGANIZATION_NETWORKS, organization_id,
                          retry_strategies::SETUP, priority::SETUP);
    if (!networks.has_value()) {
        logger_.error("fleet_hub", "Failed to fetch networks: " + describe(networks.error()));
        return networks.error();
    }

    size_t network_count = 0;
    {
        std::unique_lock lock(data_mutex_);
        organization_ = Organization{
            organization_id,
            string_field(org.value(), "name", organization_id),
            config_.organization.base_url,
        };
        networks_ = parse_networks(networks.value(), organization_id);
        network_count = networks_.size();
    }
    logger_.info("fleet_hub", "Connected to organization " + organization_id + " with " +
                              std::to_string(network_count) + " networks");

    force_refresh_all_tiers();
    start_tier_loops();
    state_ = FleetState::Ready;
    return {};
}

void FleetHub::start_tier_loops() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!tier_loops_.empty()) return;
    for (auto tier : kAllTiers) {
        auto loop = std::make_unique<PeriodicTask>(
            "tier." + std::string{to_string(tier)}, tiers_.interval(tier),
            [this, tier] { refresh_tier(tier); }, logger_);
        loop->start();
        tier_loops_.push_back(std::move(loop));
    }
}

Result<size_t> FleetHub::create_device_class_hubs() {
    if (state_ == FleetState::Unloaded) {
        return Error{ErrorKind::Configuration, "Fleet hub is unloaded"};
    }

    size_t created = 0;
    for (const auto& network : networks()) {
        auto payload = fetch_network_devices(gateway_, network.id, hub_context_.ttl.device_list);
        if (!payload.has_value()) {
            if (payload.error().is_auth_failure()) return payload.error();
            logger_.warn("fleet_hub", "Skipping network " + network.id + ": " +
                                      describe(payload.error()));
            continue;
        }

        std::set<DeviceClass> present;
        for (const auto& device : parse_devices(payload.value(), network.id)) {
            if (auto cls = classify_model(device.model)) present.insert(*cls);
        }

        for (auto cls : kAllDeviceClasses) {
            if (!present.contains(cls) || !class_enabled(config_.features, cls)) continue;
            const HubId id = make_hub_id(network.id, cls);
            {
                std::lock_guard lock(hubs_mutex_);
                if (hubs_.contains(id)) continue;
            }

            auto hub = std::make_unique<DeviceInventoryHub>(hub_context_, network, cls);
            auto ready = hub->setup();
            if (!ready.has_value()) {
                return ready.error();
            }
            {
                std::lock_guard lock(hubs_mutex_);
                hubs_.emplace(id, std::move(hub));
            }
            ++created;
            logger_.info("fleet_hub", "Created hub " + id + " for " + network.name);
        }
    }
    return created;
}

// ── Tiers ────────────────────────────────────

void FleetHub::run_due_tiers() {
    for (auto tier : tiers_.due_tiers()) {
        refresh_tier(tier);
    }
}

void FleetHub::force_refresh_all_tiers() {
    for (auto tier : kAllTiers) {
        refresh_tier(tier);
    }
}

void FleetHub::refresh_tier(RefreshTier tier) {
    std::lock_guard tier_lock(tier_mutexes_[static_cast<size_t>(tier)]);
    const auto started = std::chrono::steady_clock::now();

    uint32_t failed = 0;
    try {
        switch (tier) {
            case RefreshTier::Static:     failed = update_static_data(); break;
            case RefreshTier::SemiStatic: failed = update_semi_static_data(); break;
            case RefreshTier::Dynamic:    failed = update_dynamic_data(); break;
        }
    } catch (const std::exception& e) {
        // A malformed payload aborts the tier; the loop keeps its cadence
        logger_.error("fleet_hub", std::string{to_string(tier)} + " tier refresh aborted: " + e.what());
        ++failed;
    }
    tiers_.mark_updated(tier);
    failed_tier_fetches_ += failed;

    const auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    logger_.debug("fleet_hub", std::string{to_string(tier)} + " tier refreshed in " +
                               std::to_string(elapsed.count()) + " ms, " +
                               std::to_string(failed) + " failed fetches");
    if (metrics_) {
        metrics_->record_tier_refresh(tier, elapsed, failed);
    }
}

Result<Json::Value> FleetHub::fetch(std::string_view endpoint, const std::string& arg,
                                    const RetryStrategy& strategy, int call_priority,
                                    Json::Value params) {
    CallPolicy policy{
        .priority = call_priority,
        .retry = &strategy,
    };
    return gateway_.call(endpoint, {arg}, policy, std::move(params));
}

uint32_t FleetHub::update_static_data() {
    const OrganizationId& org = hub_context_.organization_id;
    const Timestamp now = clock_.wall_now();

    LicenseSummary summary;
    uint32_t failed = 0;
    auto overview = fetch(endpoint::GET_ORGANIZATION_LICENSES_OVERVIEW, org,
                          retry_strategies::STATIC_DATA, priority::BACKGROUND);
    if (overview.has_value()) {
        summary = parse_coterm_overview(overview.value(), now);
    } else {
        auto licenses = fetch(endpoint::GET_ORGANIZATION_LICENSES, org,
                              retry_strategies::STATIC_DATA, priority::BACKGROUND);
        if (licenses.has_value()) {
            summary = parse_per_device_licenses(licenses.value(), now);
        } else {
            logger_.debug("fleet_hub", "License data unavailable (co-term: " +
                                       describe(overview.error()) + "; per-device: " +
                                       describe(licenses.error()) + ")");
            summary.licensing_model = "unavailable";
            summary.status = "Unable to determine licensing model";
            ++failed;
        }
    }

    if (summary.expiring_count > 0) {
        logger_.warn("fleet_hub", std::to_string(summary.expiring_count) +
                                  " licenses expire within " +
                                  std::to_string(LICENSE_EXPIRY_WARNING_DAYS) + " days");
    }
    std::unique_lock lock(data_mutex_);
    licenses_ = std::move(summary);
    return failed;
}

uint32_t FleetHub::update_semi_static_data() {
    const OrganizationId& org = hub_context_.organization_id;
    uint32_t failed = 0;

    auto statuses = fetch(endpoint::GET_ORGANIZATION_DEVICES_STATUSES, org,
                          retry_strategies::STANDARD, priority::BACKGROUND);
    if (statuses.has_value()) {
        StatusOverview overview = parse_device_statuses(statuses.value());
        logger_.debug("fleet_hub", "Device statuses: " + std::to_string(overview.online) + " online, " +
                                   std::to_string(overview.offline) + " offline, " +
                                   std::to_string(overview.alerting) + " alerting, " +
                                   std::to_string(overview.dormant) + " dormant");
        std::unique_lock lock(data_mutex_);
        statuses_ = std::move(overview);
        statuses_loaded_ = true;
    } else {
        logger_.warn("fleet_hub", "Could not fetch device statuses: " + describe(statuses.error()));
        ++failed;
    }

    Json::Value memory_params{Json::objectValue};
    memory_params["interval"] = MEMORY_INTERVAL_S;
    memory_params["timespan"] = USAGE_TIMESPAN_S;
    auto memory = fetch(endpoint::GET_ORGANIZATION_MEMORY_USAGE, org,
                        retry_strategies::STANDARD, priority::BACKGROUND, memory_params);
    if (memory.has_value()) {
        std::unique_lock lock(data_mutex_);
        memory_usage_ = std::move(memory.value());
    } else {
        logger_.warn("fleet_hub", "Could not fetch memory usage: " + describe(memory.error()));
        ++failed;
    }

    auto ethernet = fetch(endpoint::GET_ORGANIZATION_ETHERNET_STATUSES, org,
                          retry_strategies::STANDARD, priority::BACKGROUND);
    if (ethernet.has_value()) {
        std::unique_lock lock(data_mutex_);
        ethernet_statuses_ = std::move(ethernet.value());
    } else {
        logger_.warn("fleet_hub", "Could not fetch ethernet statuses: " + describe(ethernet.error()));
        ++failed;
    }
    return failed;
}

uint32_t FleetHub::update_dynamic_data() {
    const OrganizationId& org = hub_context_.organization_id;
    const Timestamp now = clock_.wall_now();
    uint32_t failed = 0;

    Json::Value event_params{Json::objectValue};
    event_params["startingAfter"] = format_iso8601(now - std::chrono::hours{24});
    event_params["endingBefore"] = format_iso8601(now);
    event_params["perPage"] = EVENTS_PER_PAGE;
    auto events = fetch(endpoint::GET_ORGANIZATION_EVENTS, org,
                        retry_strategies::REALTIME, priority::TELEMETRY, event_params);
    if (events.has_value()) {
        AlertSummary summary = count_alerts(events.value(), now);
        std::unique_lock lock(data_mutex_);
        alerts_ = std::move(summary);
    } else {
        logger_.debug("fleet_hub", "Could not fetch events: " + describe(events.error()));
        ++failed;
    }

    Json::Value client_params{Json::objectValue};
    client_params["timespan"] = USAGE_TIMESPAN_S;
    auto clients = fetch(endpoint::GET_ORGANIZATION_CLIENTS_OVERVIEW, org,
                         retry_strategies::REALTIME, priority::TELEMETRY, client_params);
    if (clients.has_value()) {
        std::unique_lock lock(data_mutex_);
        client_total_ = total_clients(clients.value());
    } else {
        logger_.warn("fleet_hub", "Could not fetch clients overview: " + describe(clients.error()));
        ++failed;
    }

    const auto networks = this->networks();
    std::vector<BatchExecutor::Call<Json::Value>> calls;
    calls.reserve(networks.size());
    for (const auto& network : networks) {
        calls.emplace_back([this, id = network.id] {
            Json::Value params{Json::objectValue};
            params["timespan"] = USAGE_TIMESPAN_S;
            params["perPage"] = BLUETOOTH_PER_PAGE;
            return fetch(endpoint::GET_NETWORK_BLUETOOTH_CLIENTS, id,
                         retry_strategies::REALTIME, priority::TELEMETRY, params);
        });
    }
    auto results = batch_.run_batched(calls, config_.batch.max_concurrent,
                                      Duration{config_.batch.inter_batch_delay_ms});

    std::map<NetworkId, size_t> bluetooth;
    for (size_t i = 0; i < results.size(); ++i) {
        if (!results[i].has_value()) {
            logger_.debug("fleet_hub", "Bluetooth clients for " + networks[i].id + " failed: " +
                                       describe(results[i].error()));
            ++failed;
            continue;
        }
        const Json::Value& payload = results[i].value();
        bluetooth[networks[i].id] = payload.isArray() ? payload.size() : 0;
    }
    {
        std::unique_lock lock(data_mutex_);
        for (auto& [id, count] : bluetooth) bluetooth_clients_[id] = count;
    }
    return failed;
}

// ── Lifecycle ────────────────────────────────

void FleetHub::unload() {
    if (state_.exchange(FleetState::Unloaded) == FleetState::Unloaded) return;

    {
        std::lock_guard lock(lifecycle_mutex_);
        for (auto& loop : tier_loops_) loop->stop();
        tier_loops_.clear();
    }

    std::map<HubId, std::unique_ptr<DeviceInventoryHub>> hubs;
    {
        std::lock_guard lock(hubs_mutex_);
        hubs.swap(hubs_);
    }
    for (auto& [id, hub] : hubs) hub->unload();
    logger_.info("fleet_hub", "Unloaded " + std::to_string(hubs.size()) + " hubs");
}

// ── IDeviceStatusSource ──────────────────────

std::optional<DeviceStatusEntry> FleetHub::status_of(const Serial& serial) const {
    std::shared_lock lock(data_mutex_);
    auto it = statuses_.by_serial.find(serial);
    if (it == statuses_.by_serial.end()) return std::nullopt;
    return it->second;
}

bool FleetHub::status_feed_loaded() const {
    std::shared_lock lock(data_mutex_);
    return statuses_loaded_;
}

// ── Accessors ────────────────────────────────

std::optional<Organization> FleetHub::organization() const {
    std::shared_lock lock(data_mutex_);
    return organization_;
}

std::vector<Network> FleetHub::networks() const {
    std::shared_lock lock(data_mutex_);
    return networks_;
}

std::vector<DeviceInventoryHub*> FleetHub::hubs() const {
    std::lock_guard lock(hubs_mutex_);
    std::vector<DeviceInventoryHub*> out;
    out.reserve(hubs_.size());
    for (const auto& [id, hub] : hubs_) out.push_back(hub.get());
    return out;
}

DeviceInventoryHub* FleetHub::hub(const HubId& id) const {
    std::lock_guard lock(hubs_mutex_);
    auto it = hubs_.find(id);
    return it == hubs_.end() ? nullptr : it->second.get();
}

LicenseSummary FleetHub::license_summary() const {
    std::shared_lock lock(data_mutex_);
    return licenses_;
}

StatusOverview FleetHub::status_overview() const {
    std::shared_lock lock(data_mutex_);
    return statuses_;
}

AlertSummary FleetHub::alert_summary() const {
    std::shared_lock lock(data_mutex_);
    return alerts_;
}

Json::Value FleetHub::memory_usage() const {
    std::shared_lock lock(data_mutex_);
    return memory_usage_;
}

Json::Value FleetHub::ethernet_statuses() const {
    std::shared_lock lock(data_mutex_);
    return ethernet_statuses_;
}

uint64_t FleetHub::client_total() const {
    std::shared_lock lock(data_mutex_);
    return client_total_;
}

std::map<NetworkId, size_t> FleetHub::bluetooth_clients() const {
    std::shared_lock lock(data_mutex_);
    return bluetooth_clients_;
}

FleetDiagnostics FleetHub::diagnostics() const {
    FleetDiagnostics out;
    out.state = state_.load();
    out.api = gateway_.stats();

    RateLimiter& limiter = gateway_.limiter();
    out.queue_depth = limiter.queue_depth();
    out.calls_last_minute = limiter.calls_last_minute();
    out.throttle_events_last_window = limiter.throttle_events_last_window();
    out.total_throttle_events = limiter.total_throttle_events();
    out.throttle_wait_total = limiter.throttle_wait_total();
    out.last_throttle_wait = limiter.last_throttle_wait();

    ResponseCache& cache = gateway_.cache();
    out.cache_entries = cache.size();
    out.cache_hits = cache.hits();
    out.cache_misses = cache.misses();

    for (auto tier : kAllTiers) {
        out.tiers.push_back(TierStatus{tier, tiers_.freshness(tier), tiers_.last_updated(tier),
                                       tiers_.interval(tier)});
    }
    out.failed_tier_fetches = failed_tier_fetches_.load();
    out.network_count = networks().size();

    for (auto* hub : hubs()) {
        ++out.hub_count;
        out.device_count += hub->device_count();
    }
    return out;
}

}  // namespace fleet_mirror
