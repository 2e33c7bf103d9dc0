#pragma once

#include "stats/CacheStats.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace fdx::cache {

// In-process read-through cache. Values are kept as JSON documents so any type with
// to_json/from_json can be cached. Keys are ordered, which lets invalidatePrefix drop a
// whole key family in one range erase.
class Cache {
public:
    explicit Cache(std::size_t maxKeys = 10000);

    // Returns the cached value for key, or runs loader, caches its result for ttl and returns
    // it. Nothing is cached when the loader throws.
    template <typename T, typename Loader>
    T cachedRead(const std::string& key, Loader&& loader, const std::chrono::seconds ttl) {
        if (auto hit = lookup(key)) return hit->template get<T>();

        const auto start = std::chrono::steady_clock::now();
        T value = loader();
        stats_->record_load_us(static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count()));

        store(key, nlohmann::json(value), ttl);
        return value;
    }

    template <typename T>
    void writeThrough(const std::string& key, const T& value, const std::chrono::seconds ttl) {
        store(key, nlohmann::json(value), ttl);
    }

    // Cached value without touching hit/miss counters.
    template <typename T>
    [[nodiscard]] std::optional<T> peek(const std::string& key) const {
        std::shared_lock lock(mutex_);
        const auto it = slots_.find(key);
        if (it == slots_.end() || isExpired(it->second, Clock::now())) return std::nullopt;
        return it->second.value.template get<T>();
    }

    template <typename... Keys>
    void invalidate(const Keys&... keys) {
        (erase(keys), ...);
    }

    // Drops every key starting with prefix. Returns how many were dropped.
    std::size_t invalidatePrefix(const std::string& prefix);

    void clear();

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] stats::CacheStatsSnapshot stats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        nlohmann::json value;
        Clock::time_point expires_at;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Slot> slots_;
    std::size_t max_keys_;
    std::shared_ptr<stats::CacheStats> stats_;

    [[nodiscard]] std::optional<nlohmann::json> lookup(const std::string& key);
    void store(const std::string& key, nlohmann::json value, std::chrono::seconds ttl);
    void erase(const std::string& key);

    // caller holds the unique lock
    void makeRoom();

    static bool isExpired(const Slot& slot, const Clock::time_point now) { return slot.expires_at <= now; }
};

}
