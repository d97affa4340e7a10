/**
 * @file main.cpp
 * @brief FleetMirror daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into the mirroring pipeline:
 *   Config → Logger → Transport → RateLimiter → Retry → Cache → Gateway → FleetHub → Hubs
 */

#include "api/gateway.hpp"
#include "api/simulated_dashboard.hpp"
#include "cache/response_cache.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/batch_executor.hpp"
#include "executor/periodic_task.hpp"
#include "executor/rate_limiter.hpp"
#include "executor/retry.hpp"
#include "fleet/fleet_hub.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace fleet_mirror;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr const char* SIMULATED_API_KEY = "0123456789abcdef0123456789abcdef01234567";
constexpr const char* SIMULATED_ORGANIZATION = "org-sim";
constexpr std::chrono::seconds STATUS_INTERVAL{60};

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            FleetMirror v1.0.0             ║
  ║   Rate-limited mirror of a managed        ║
  ║   network device fleet                    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/fleet_mirror.toml";
    bool config_given = false;
    std::string log_dir;
    std::string log_level;
    bool once = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: fleet_mirrord [OPTIONS]\n"
                      << "  --config <path>     Configuration file (default: config/fleet_mirror.toml)\n"
                      << "  --log-dir <path>    Log output directory\n"
                      << "  --log-level <lvl>   debug, info, warn or error\n"
                      << "  --once              Set up, run one telemetry scan, print a summary and exit\n"
                      << "  --help, -h          Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

void log_diagnostics(const FleetHub& fleet, Logger& logger) {
    auto diag = fleet.diagnostics();
    std::string tiers;
    for (const auto& tier : diag.tiers) {
        if (!tiers.empty()) tiers += ", ";
        tiers += std::string{to_string(tier.tier)} + "=" + std::string{to_string(tier.freshness)};
    }
    logger.info("Status: " + std::to_string(diag.hub_count) + " hubs, " +
                std::to_string(diag.device_count) + " devices, " +
                std::to_string(diag.api.total_calls) + " API calls (" +
                std::to_string(diag.api.failed_calls) + " failed), " +
                std::to_string(diag.calls_last_minute) + " calls/min, " +
                std::to_string(diag.total_throttle_events) + " throttles, cache " +
                std::to_string(diag.cache_hits) + "/" + std::to_string(diag.cache_misses) +
                " hit/miss, tiers " + tiers);
}

/**
 * @brief Run one scan on every hub and print what each one holds.
 */
void run_once(FleetHub& fleet, Logger& logger) {
    for (auto* hub : fleet.hubs()) {
        auto report = hub->refresh_telemetry();
        std::cout << hub->id() << ": " << hub->device_count() << " devices, "
                  << report.refreshed.size() << " refreshed, "
                  << report.skipped.size() << " skipped, "
                  << report.failed_metrics << " failed metrics\n";
        if (auto ssids = hub->ssids()) {
            std::cout << "  ssids: " << ssids->total << " total, " << ssids->enabled << " enabled, "
                      << ssids->open << " open\n";
        }
        if (const auto* refresher = hub->sensor_refresh()) {
            auto stats = refresher->stats();
            std::cout << "  refresh commands: " << stats.successful << "/" << stats.attempts
                      << " accepted\n";
        }
    }
    auto licenses = fleet.license_summary();
    auto statuses = fleet.status_overview();
    std::cout << "licensing: " << licenses.licensing_model
              << ", expiring soon: " << licenses.expiring_count << "\n"
              << "devices online/offline: " << statuses.online << "/" << statuses.offline << "\n"
              << "alerts (24h): " << fleet.alert_summary().active_alerts << "\n";
    log_diagnostics(fleet, logger);
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config_or_default(args.config_path, args.config_given);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return 2;
    }
    auto config = *config_result;

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (config.telemetry.log_to_stdout || config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<StdoutSink>();
    } else {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "fleet_mirror",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    logger.info("FleetMirror starting...");
    logger.info("Base URL: " + config.organization.base_url);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> metrics_sink;
    if (config.telemetry.log_dir.empty()) {
        metrics_sink = std::make_unique<NullSink>();
    } else {
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "fleet_mirror_metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    }
    MetricsCollector metrics(std::move(metrics_sink));

    // ── Initialize Transport ─────────────────
    std::string api_key = config.organization.api_key;
    OrganizationId organization_id = config.organization.organization_id;
    if (!config.simulation.enabled) {
        logger.error("No live transport is built into this daemon; enable [simulation]");
        return 2;
    }
    if (api_key.empty()) api_key = SIMULATED_API_KEY;
    if (organization_id.empty()) organization_id = SIMULATED_ORGANIZATION;
    auto dashboard = SimulatedDashboard::from_config(config.simulation, organization_id);
    logger.info("Simulated dashboard: " + std::to_string(config.simulation.networks) + " networks, " +
                std::to_string(config.simulation.devices_per_class) + " devices per class");

    // ── Initialize Call Pipeline ─────────────
    SystemClock clock;
    RateLimiter limiter(RateLimiterOptions{
                            .max_calls_per_second = config.rate_limit.max_calls_per_second,
                            .max_concurrent = config.rate_limit.max_concurrent,
                            .throttle_window = std::chrono::minutes{config.rate_limit.throttle_window_minutes},
                        },
                        logger, &metrics);
    limiter.start();
    RetryOrchestrator retry(logger, {}, &metrics);
    ResponseCache cache(clock);
    BatchExecutor batch(config.batch.max_concurrent, logger);
    ApiGateway gateway(*dashboard, limiter, retry, cache, logger,
                       std::chrono::seconds{config.api.timeout_seconds}, &metrics);
    logger.info("Rate limiter: " + std::to_string(config.rate_limit.max_calls_per_second) +
                " calls/s, " + std::to_string(config.rate_limit.max_concurrent) + " workers");

    // ── Initialize Fleet ─────────────────────
    FleetHub fleet(gateway, batch, config, logger, clock, &metrics);
    if (auto ready = fleet.setup(api_key, organization_id); !ready) {
        logger.error("Fleet setup failed: " + describe(ready.error()));
        retry.cancel();
        limiter.stop();
        return ready.error().is_auth_failure() ? 3 : 1;
    }
    auto hubs = fleet.create_device_class_hubs();
    if (!hubs) {
        logger.error("Hub creation failed: " + describe(hubs.error()));
    } else {
        logger.info("Created " + std::to_string(*hubs) + " device class hubs");
    }

    if (args.once) {
        run_once(fleet, logger);
    } else {
        PeriodicTask status_task("status", STATUS_INTERVAL, [&] {
            log_diagnostics(fleet, logger);
            auto swept = cache.sweep_expired();
            if (swept > 0) logger.debug("Swept " + std::to_string(swept) + " expired cache entries");
            metrics.flush();
        }, logger);
        status_task.start();

        // ── Main Loop ────────────────────────
        logger.info("Entering main loop. Press Ctrl+C to shutdown.");
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        status_task.stop();
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    retry.cancel();
    fleet.unload();
    limiter.stop();
    metrics.flush();

    logger.info("FleetMirror stopped.");
    logger.flush();
    return 0;
}
