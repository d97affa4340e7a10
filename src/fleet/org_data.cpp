/**
 * @file org_data.cpp
 * @brief Organization payload summaries.
 * @author Dimitris Kafetzis
 */

#include "fleet/org_data.hpp"

#include "api/dashboard_api.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace fleet_mirror {

namespace {

constexpr size_t RECENT_KEEP = 5;

constexpr std::array<std::string_view, 5> ALERT_EVENT_TYPES{
    "device_went_offline",
    "device_came_online",
    "device_alert",
    "sensor_alert",
    "gateway_alert",
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void note_expiry(LicenseSummary& summary, const std::string& label,
                 const std::string& date, Timestamp now) {
    auto expiry = parse_timestamp(date);
    if (!expiry) return;
    int days = days_until(*expiry, now);
    if (days < 0 || days > LICENSE_EXPIRY_WARNING_DAYS) return;
    ++summary.expiring_count;
    if (summary.expiring_soon.size() < RECENT_KEEP) {
        summary.expiring_soon.push_back(ExpiringLicense{label, date, days});
    }
}

}  // anonymous namespace

int days_until(Timestamp expiry, Timestamp now) {
    auto days = std::chrono::floor<std::chrono::days>(expiry - now);
    return static_cast<int>(days.count());
}

LicenseSummary parse_coterm_overview(const Json::Value& overview, Timestamp now) {
    LicenseSummary summary;
    summary.licensing_model = "co-term";
    if (!overview.isObject()) return summary;
    summary.status = string_field(overview, "status");

    const Json::Value& counts = overview["licensedDeviceCounts"];
    if (counts.isObject()) {
        for (const auto& name : counts.getMemberNames()) {
            if (auto count = integer_field(counts, name.c_str())) {
                summary.licensed_device_counts[name] = static_cast<int>(*count);
            }
        }
    }

    if (overview["expirationDate"].isString()) {
        std::string date = overview["expirationDate"].asString();
        summary.expiration_date = date;
        note_expiry(summary, "co-term", date, now);
    }
    return summary;
}

LicenseSummary parse_per_device_licenses(const Json::Value& licenses, Timestamp now) {
    LicenseSummary summary;
    summary.licensing_model = "per-device";
    if (!licenses.isArray()) return summary;

    summary.total_licenses = licenses.size();
    for (const auto& license : licenses) {
        if (!license.isObject()) continue;
        ++summary.licenses_by_type[string_field(license, "licenseType", "Unknown")];
        if (license["expirationDate"].isString()) {
            note_expiry(summary, string_field(license, "deviceSerial", "Unknown"),
                        license["expirationDate"].asString(), now);
        }
    }
    return summary;
}

StatusOverview parse_device_statuses(const Json::Value& statuses) {
    StatusOverview overview;
    if (!statuses.isArray()) return overview;

    for (const auto& entry : statuses) {
        if (!entry.isObject() || !entry["serial"].isString()) continue;
        DeviceStatusEntry status;
        status.status = parse_device_status(string_field(entry, "status"));
        if (entry["lastReportedAt"].isString()) {
            status.last_reported = parse_timestamp(entry["lastReportedAt"].asString());
        }
        switch (status.status) {
            case DeviceStatus::Online:   ++overview.online; break;
            case DeviceStatus::Offline:  ++overview.offline; break;
            case DeviceStatus::Alerting: ++overview.alerting; break;
            case DeviceStatus::Dormant:  ++overview.dormant; break;
            case DeviceStatus::Unknown:  break;
        }
        overview.by_serial.insert_or_assign(entry["serial"].asString(), status);
    }
    return overview;
}

bool is_alert_event_type(std::string_view event_type) {
    return std::find(ALERT_EVENT_TYPES.begin(), ALERT_EVENT_TYPES.end(), event_type) !=
           ALERT_EVENT_TYPES.end();
}

AlertSummary count_alerts(const Json::Value& events, Timestamp now, std::chrono::hours window) {
    AlertSummary summary;
    const Json::Value& list = events.isObject() ? events["events"] : events;
    if (!list.isArray()) return summary;

    const Timestamp horizon = now - window;
    for (const auto& event : list) {
        if (!event.isObject()) continue;
        std::string type = lowercase(string_field(event, "eventType"));
        if (!is_alert_event_type(type)) continue;
        if (event["timestamp"].isString()) {
            auto when = parse_timestamp(event["timestamp"].asString());
            if (when && *when < horizon) continue;
        }
        ++summary.active_alerts;
        ++summary.by_type[type];
        if (summary.recent.size() < RECENT_KEEP) summary.recent.push_back(event);
    }
    return summary;
}

uint64_t total_clients(const Json::Value& overview) {
    if (!overview.isObject() || !overview["counts"].isObject()) return 0;
    const Json::Value& total = overview["counts"]["total"];
    return total.isNumeric() ? total.asUInt64() : 0;
}

}  // namespace fleet_mirror
