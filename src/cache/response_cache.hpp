/**
 * @file response_cache.hpp
 * @brief Keyed TTL store for recently fetched API payloads.
 * @author Dimitris Kafetzis
 *
 * Entries are logically absent once their TTL has elapsed on the injected
 * clock. An expired entry found by get() is removed; sweep_expired() removes
 * the rest. Readers share the lock, writers hold it exclusively.
 */

#pragma once

#include "core/clock.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/result.hpp"

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fleet_mirror {

/// "scope:kind" or "scope:kind:sub_id".
[[nodiscard]] std::string make_cache_key(std::string_view scope,
                                         std::string_view kind,
                                         std::string_view sub_id = {});

/**
 * @brief TTL tiers for cached payload families.
 */
struct CacheTtl {
    std::chrono::seconds standard{120};     ///< Port status
    std::chrono::seconds extended{900};     ///< Connection stats
    std::chrono::seconds long_lived{1800};  ///< SSID / port configuration
    std::chrono::seconds device_list{600};

    [[nodiscard]] static CacheTtl from_config(const CacheConfig& config) noexcept;
};

class ResponseCache {
public:
    explicit ResponseCache(const IClock& clock);

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /// The payload if present and unexpired; an expired entry is dropped.
    [[nodiscard]] std::optional<Json::Value> get(const std::string& key);

    void put(const std::string& key, Json::Value value, std::chrono::seconds ttl);
    void invalidate(const std::string& key);
    void invalidate_all();

    /// Remove expired entries; returns how many were removed.
    size_t sweep_expired();

    /**
     * @brief Serve @p key from the cache or run @p fetch and store its success.
     *
     * Failures are returned as-is and never cached.
     */
    template <ResultProducer F>
    Result<Json::Value> get_or_fetch(const std::string& key, std::chrono::seconds ttl, F&& fetch);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t hits() const noexcept { return hits_.load(); }
    [[nodiscard]] uint64_t misses() const noexcept { return misses_.load(); }

private:
    struct Entry {
        Json::Value value;
        SteadyTime stored_at;
        std::chrono::seconds ttl;

        [[nodiscard]] bool expired(SteadyTime now) const noexcept { return now > stored_at + ttl; }
    };

    const IClock& clock_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

// ── Template implementations ─────────────────

template <ResultProducer F>
Result<Json::Value> ResponseCache::get_or_fetch(const std::string& key,
                                                std::chrono::seconds ttl,
                                                F&& fetch) {
    if (auto cached = get(key)) {
        return std::move(*cached);
    }
    Result<Json::Value> fresh = fetch();
    if (fresh.has_value()) {
        put(key, fresh.value(), ttl);
    }
    return fresh;
}

}  // namespace fleet_mirror
