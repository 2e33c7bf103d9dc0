#pragma once

#include <atomic>
#include <cstdint>

#include <nlohmann/json_fwd.hpp>

namespace fdx::stats {

// 64-byte cache line padding to keep hot counters off each other's lines.
constexpr std::size_t kCacheLine = 64;

template <typename T>
struct alignas(kCacheLine) PaddedAtomic {
    std::atomic<T> v{0};
    char pad[kCacheLine - (sizeof(std::atomic<T>) % kCacheLine ? (sizeof(std::atomic<T>) % kCacheLine) : kCacheLine)]{};
};

struct LatencyStats {
    PaddedAtomic<uint64_t> count;
    PaddedAtomic<uint64_t> total_us;
    PaddedAtomic<uint64_t> max_us;

    void observe_us(uint64_t us) noexcept;
};

struct CacheStatsSnapshot {
    uint64_t hits{};
    uint64_t misses{};

    uint64_t evictions{};
    uint64_t inserts{};
    uint64_t invalidations{};

    uint64_t used_keys{};
    uint64_t capacity_keys{};

    // time spent in loaders behind misses
    uint64_t load_count{};
    uint64_t load_total_us{};
    uint64_t load_max_us{};
};

struct CacheStats {
    PaddedAtomic<uint64_t> hits;
    PaddedAtomic<uint64_t> misses;

    PaddedAtomic<uint64_t> evictions;
    PaddedAtomic<uint64_t> inserts;
    PaddedAtomic<uint64_t> invalidations;

    PaddedAtomic<uint64_t> used_keys;
    PaddedAtomic<uint64_t> capacity_keys;

    LatencyStats load_latency;

    void record_hit() noexcept;
    void record_miss() noexcept;
    void record_insert() noexcept;
    void record_eviction(uint64_t n = 1) noexcept;
    void record_invalidation(uint64_t n = 1) noexcept;

    void set_used(uint64_t used) noexcept;
    void set_capacity(uint64_t cap) noexcept;

    void record_load_us(uint64_t us) noexcept;

    [[nodiscard]] CacheStatsSnapshot snapshot() const noexcept;

    static double hit_rate(const CacheStatsSnapshot& s) noexcept;
    static double avg_load_ms(const CacheStatsSnapshot& s) noexcept;
};

void to_json(nlohmann::json& j, const CacheStatsSnapshot& s);

}
