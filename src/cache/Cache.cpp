#include "cache/Cache.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

using namespace fdx::cache;
using namespace fdx::stats;

Cache::Cache(const std::size_t maxKeys)
    : max_keys_(std::max<std::size_t>(maxKeys, 1)),
      stats_(std::make_shared<CacheStats>()) {
    stats_->set_capacity(max_keys_);
}

std::optional<nlohmann::json> Cache::lookup(const std::string& key) {
    {
        std::shared_lock lock(mutex_);
        const auto it = slots_.find(key);
        if (it != slots_.end() && !isExpired(it->second, Clock::now())) {
            stats_->record_hit();
            return it->second.value;
        }
    }

    stats_->record_miss();
    log::Registry::cache()->trace("[Cache::lookup] Miss: {}", key);
    return std::nullopt;
}

void Cache::store(const std::string& key, nlohmann::json value, const std::chrono::seconds ttl) {
    std::unique_lock lock(mutex_);
    if (!slots_.contains(key)) makeRoom();
    slots_[key] = Slot{std::move(value), Clock::now() + ttl};
    stats_->record_insert();
    stats_->set_used(slots_.size());
}

void Cache::erase(const std::string& key) {
    std::unique_lock lock(mutex_);
    if (slots_.erase(key)) {
        stats_->record_invalidation();
        stats_->set_used(slots_.size());
        log::Registry::cache()->trace("[Cache::invalidate] {}", key);
    }
}

std::size_t Cache::invalidatePrefix(const std::string& prefix) {
    std::unique_lock lock(mutex_);
    auto first = slots_.lower_bound(prefix);
    auto last = first;
    std::size_t n = 0;
    while (last != slots_.end() && last->first.starts_with(prefix)) {
        ++last;
        ++n;
    }
    slots_.erase(first, last);

    if (n) {
        stats_->record_invalidation(n);
        stats_->set_used(slots_.size());
        log::Registry::cache()->trace("[Cache::invalidatePrefix] Dropped {} key(s) under '{}'", n, prefix);
    }
    return n;
}

void Cache::makeRoom() {
    if (slots_.size() < max_keys_) return;

    const auto now = Clock::now();
    const auto swept = std::erase_if(slots_, [&](const auto& kv) { return isExpired(kv.second, now); });
    if (swept) stats_->record_eviction(swept);
    if (slots_.size() < max_keys_) return;

    // still full: drop the slots closest to expiry, a tenth of capacity at a time
    std::vector<std::map<std::string, Slot>::iterator> order;
    order.reserve(slots_.size());
    for (auto it = slots_.begin(); it != slots_.end(); ++it) order.push_back(it);

    const auto drop = std::max<std::size_t>(1, max_keys_ / 10);
    std::ranges::nth_element(order, order.begin() + static_cast<std::ptrdiff_t>(drop - 1),
                             [](const auto& a, const auto& b) { return a->second.expires_at < b->second.expires_at; });
    for (std::size_t i = 0; i < drop; ++i) slots_.erase(order[i]);

    stats_->record_eviction(drop);
    log::Registry::cache()->debug("[Cache::makeRoom] Evicted {} expired and {} live key(s)", swept, drop);
}

void Cache::clear() {
    std::unique_lock lock(mutex_);
    slots_.clear();
    stats_->set_used(0);
}

bool Cache::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = slots_.find(key);
    return it != slots_.end() && !isExpired(it->second, Clock::now());
}

std::size_t Cache::size() const {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

CacheStatsSnapshot Cache::stats() const {
    return stats_->snapshot();
}
