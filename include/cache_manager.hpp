#pragma once

#include <unordered_map>
#include <mutex>
#include <optional>
#include <chrono>
#include <functional>
#include <string>
#include "affinity_types.hpp"

namespace planner_injector {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

inline SteadyClock system_steady_clock() {
    return [] { return std::chrono::steady_clock::now(); };
}

// Thread-safe key/value map with lazy per-entry expiration.
// An entry is readable while (now - recorded_at) <= ttl.
template<typename Key, typename Value>
class TtlCache {
public:
    explicit TtlCache(std::chrono::seconds ttl, SteadyClock clock = system_steady_clock())
        : ttl_(ttl), clock_(std::move(clock)) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            return std::nullopt;
        }

        // Stale: drop it so the next reader sees a clean miss
        if (clock_() - it->second.recorded_at > ttl_) {
            cache_map_.erase(it);
            return std::nullopt;
        }

        return it->second.value;
    }

    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.insert_or_assign(key, CacheEntry{std::move(value), clock_()});
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct CacheEntry {
        Value value;
        std::chrono::steady_clock::time_point recorded_at;
    };

    const std::chrono::seconds ttl_;
    SteadyClock clock_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    mutable std::mutex mutex_;
};

// Per-user affinity cache shared by the enrichment handler (writer),
// the planner prompt wrapper and the debug command (readers).
class AffinityStore {
public:
    explicit AffinityStore(std::chrono::seconds ttl = kDefaultCacheTtl,
                           SteadyClock clock = system_steady_clock())
        : records_(ttl, std::move(clock)) {}

    std::optional<AffinityRecord> get(const std::string& user_id) {
        return records_.get(user_id);
    }

    void set(const std::string& user_id, int impression, const std::string& attitude) {
        records_.set(user_id, AffinityRecord{user_id, impression, attitude});
    }

    void clear() { records_.clear(); }

    size_t size() const { return records_.size(); }

    std::chrono::seconds ttl() const { return records_.ttl(); }

private:
    TtlCache<std::string, AffinityRecord> records_;
};

} // namespace planner_injector
