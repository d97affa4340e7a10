/**
 * @file response_cache.cpp
 * @brief ResponseCache implementation.
 * @author Dimitris Kafetzis
 */

#include "cache/response_cache.hpp"

#include <mutex>

namespace fleet_mirror {

std::string make_cache_key(std::string_view scope, std::string_view kind, std::string_view sub_id) {
    std::string key;
    key.reserve(scope.size() + kind.size() + sub_id.size() + 2);
    key.append(scope).append(":").append(kind);
    if (!sub_id.empty()) {
        key.append(":").append(sub_id);
    }
    return key;
}

CacheTtl CacheTtl::from_config(const CacheConfig& config) noexcept {
    return CacheTtl{
        .standard = std::chrono::seconds{config.standard_ttl_s},
        .extended = std::chrono::seconds{config.extended_ttl_s},
        .long_lived = std::chrono::seconds{config.long_ttl_s},
        .device_list = std::chrono::seconds{config.device_list_ttl_s},
    };
}

ResponseCache::ResponseCache(const IClock& clock) : clock_(clock) {}

std::optional<Json::Value> ResponseCache::get(const std::string& key) {
    auto now = clock_.now();
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }
        if (!it->second.expired(now)) {
            ++hits_;
            return it->second.value;
        }
    }

    // Expired: re-check under the exclusive lock, a writer may have refreshed it
    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (!it->second.expired(now)) {
            ++hits_;
            return it->second.value;
        }
        entries_.erase(it);
    }
    ++misses_;
    return std::nullopt;
}

void ResponseCache::put(const std::string& key, Json::Value value, std::chrono::seconds ttl) {
    Entry entry{std::move(value), clock_.now(), ttl};
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(key, std::move(entry));
}

void ResponseCache::invalidate(const std::string& key) {
    std::unique_lock lock(mutex_);
    entries_.erase(key);
}

void ResponseCache::invalidate_all() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t ResponseCache::sweep_expired() {
    auto now = clock_.now();
    std::unique_lock lock(mutex_);
    return std::erase_if(entries_, [now](const auto& item) { return item.second.expired(now); });
}

size_t ResponseCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace fleet_mirror
