/**
 * @file org_data.hpp
 * @brief Organization-level summaries built from tier payloads.
 * @author Dimitris Kafetzis
 *
 * Pure functions over decoded payloads; FleetHub owns the fetching.
 */

#pragma once

#include "core/types.hpp"
#include "inventory/device_hub.hpp"

#include <json/json.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fleet_mirror {

// ── Licensing ────────────────────────────────

struct ExpiringLicense {
    std::string label;          ///< License type or device serial
    std::string expiration_date;
    int days_remaining{0};
};

struct LicenseSummary {
    std::string licensing_model{"unavailable"};     ///< "co-term", "per-device", "unavailable"
    std::string status;
    std::optional<std::string> expiration_date;
    std::map<std::string, int> licensed_device_counts;
    std::map<std::string, int> licenses_by_type;
    size_t total_licenses{0};
    std::vector<ExpiringLicense> expiring_soon;     ///< At most five kept
    size_t expiring_count{0};
};

/// Licenses expiring within this many days are reported.
inline constexpr int LICENSE_EXPIRY_WARNING_DAYS = 90;

[[nodiscard]] LicenseSummary parse_coterm_overview(const Json::Value& overview, Timestamp now);
[[nodiscard]] LicenseSummary parse_per_device_licenses(const Json::Value& licenses, Timestamp now);

/// Whole days from @p now until @p expiry, rounded toward negative infinity.
[[nodiscard]] int days_until(Timestamp expiry, Timestamp now);

// ── Device statuses ──────────────────────────

struct StatusOverview {
    std::map<Serial, DeviceStatusEntry> by_serial;
    size_t online{0};
    size_t offline{0};
    size_t alerting{0};
    size_t dormant{0};
};

[[nodiscard]] StatusOverview parse_device_statuses(const Json::Value& statuses);

// ── Alerts ───────────────────────────────────

struct AlertSummary {
    size_t active_alerts{0};
    std::map<std::string, size_t> by_type;
    std::vector<Json::Value> recent;                ///< At most five kept
};

/// Event types counted as alerts, lowercase.
[[nodiscard]] bool is_alert_event_type(std::string_view event_type);

/**
 * @brief Count alert-type events no older than @p window.
 *
 * Accepts a bare event array or an {"events": [...]} page. Events without a
 * parseable timestamp are trusted to be inside the requested window.
 */
[[nodiscard]] AlertSummary count_alerts(const Json::Value& events, Timestamp now,
                                        std::chrono::hours window = std::chrono::hours{24});

// ── Clients ──────────────────────────────────

/// counts.total from a clients overview, 0 when absent.
[[nodiscard]] uint64_t total_clients(const Json::Value& overview);

}  // namespace fleet_mirror
