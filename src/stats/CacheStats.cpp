#include "stats/CacheStats.hpp"

#include <nlohmann/json.hpp>

using namespace fdx::stats;

void LatencyStats::observe_us(uint64_t us) noexcept {
    count.v.fetch_add(1, std::memory_order_relaxed);
    total_us.v.fetch_add(us, std::memory_order_relaxed);

    uint64_t cur = max_us.v.load(std::memory_order_relaxed);
    while (us > cur && !max_us.v.compare_exchange_weak(cur, us, std::memory_order_relaxed)) {
        // cur refreshed by compare_exchange_weak
    }
}

void CacheStats::record_hit() noexcept { hits.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::record_miss() noexcept { misses.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::record_insert() noexcept { inserts.v.fetch_add(1, std::memory_order_relaxed); }

void CacheStats::record_eviction(uint64_t n) noexcept { evictions.v.fetch_add(n, std::memory_order_relaxed); }

void CacheStats::record_invalidation(uint64_t n) noexcept { invalidations.v.fetch_add(n, std::memory_order_relaxed); }

void CacheStats::set_used(uint64_t used) noexcept { used_keys.v.store(used, std::memory_order_relaxed); }

void CacheStats::set_capacity(uint64_t cap) noexcept { capacity_keys.v.store(cap, std::memory_order_relaxed); }

void CacheStats::record_load_us(uint64_t us) noexcept { load_latency.observe_us(us); }

CacheStatsSnapshot CacheStats::snapshot() const noexcept {
    CacheStatsSnapshot s;
    s.hits = hits.v.load(std::memory_order_relaxed);
    s.misses = misses.v.load(std::memory_order_relaxed);

    s.evictions = evictions.v.load(std::memory_order_relaxed);
    s.inserts = inserts.v.load(std::memory_order_relaxed);
    s.invalidations = invalidations.v.load(std::memory_order_relaxed);

    s.used_keys = used_keys.v.load(std::memory_order_relaxed);
    s.capacity_keys = capacity_keys.v.load(std::memory_order_relaxed);

    s.load_count = load_latency.count.v.load(std::memory_order_relaxed);
    s.load_total_us = load_latency.total_us.v.load(std::memory_order_relaxed);
    s.load_max_us = load_latency.max_us.v.load(std::memory_order_relaxed);

    return s;
}

double CacheStats::hit_rate(const CacheStatsSnapshot& s) noexcept {
    const auto denom = s.hits + s.misses;
    return denom ? static_cast<double>(s.hits) / static_cast<double>(denom) : 0.0;
}

double CacheStats::avg_load_ms(const CacheStatsSnapshot& s) noexcept {
    return s.load_count ? (static_cast<double>(s.load_total_us) / 1000.0) / static_cast<double>(s.load_count) : 0.0;
}

void fdx::stats::to_json(nlohmann::json& j, const CacheStatsSnapshot& s) {
    j = nlohmann::json{
        {"hits", s.hits},
        {"misses", s.misses},
        {"evictions", s.evictions},
        {"inserts", s.inserts},
        {"invalidations", s.invalidations},

        {"used_keys", s.used_keys},
        {"capacity_keys", s.capacity_keys},

        {"hit_rate", CacheStats::hit_rate(s)},

        {"load", {
            {"count", s.load_count},
            {"total_us", s.load_total_us},
            {"max_us", s.load_max_us},
            {"avg_ms", CacheStats::avg_load_ms(s)},
        }},
    };
}
