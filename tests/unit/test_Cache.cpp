#include <gtest/gtest.h>

#include "cache/Cache.hpp"
#include "cache/Keys.hpp"
#include "fs/model/Entry.hpp"

#include <stdexcept>

using namespace fdx::cache;
using namespace std::chrono_literals;

class CacheTest : public ::testing::Test {
protected:
    Cache cache{100};
    int loads = 0;

    int load(const int value) {
        ++loads;
        return value;
    }
};

TEST_F(CacheTest, CachedRead_LoadsOnceWhileFresh) {
    EXPECT_EQ(cache.cachedRead<int>("k", [&] { return load(1); }, 60s), 1);
    EXPECT_EQ(cache.cachedRead<int>("k", [&] { return load(2); }, 60s), 1);
    EXPECT_EQ(loads, 1);

    const auto s = cache.stats();
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.inserts, 1u);
    EXPECT_EQ(s.load_count, 1u);
}

TEST_F(CacheTest, CachedRead_ReloadsAfterTtl) {
    EXPECT_EQ(cache.cachedRead<int>("k", [&] { return load(1); }, 0s), 1);
    EXPECT_EQ(cache.cachedRead<int>("k", [&] { return load(2); }, 0s), 2);
    EXPECT_EQ(loads, 2);
}

TEST_F(CacheTest, CachedRead_LoaderFailureCachesNothing) {
    EXPECT_THROW(cache.cachedRead<int>("k", []() -> int { throw std::runtime_error("boom"); }, 60s), std::runtime_error);
    EXPECT_FALSE(cache.contains("k"));
    EXPECT_EQ(cache.cachedRead<int>("k", [&] { return load(7); }, 60s), 7);
}

TEST_F(CacheTest, WriteThrough_ReplacesValue) {
    (void) cache.cachedRead<int>("k", [&] { return load(1); }, 60s);
    cache.writeThrough("k", 5, 60s);
    EXPECT_EQ(cache.cachedRead<int>("k", [&] { return load(9); }, 60s), 5);
    EXPECT_EQ(loads, 1);
}

TEST_F(CacheTest, Invalidate_DropsEveryGivenKey) {
    cache.writeThrough("a", 1, 60s);
    cache.writeThrough("b", 2, 60s);
    cache.writeThrough("c", 3, 60s);

    cache.invalidate(std::string("a"), std::string("b"), std::string("absent"));

    EXPECT_FALSE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_EQ(cache.stats().invalidations, 2u);
}

TEST_F(CacheTest, InvalidatePrefix_HitsAllListVariantsOfOneOwnerOnly) {
    using fdx::fs::model::EntryFilter;
    cache.writeThrough(keys::entries(EntryFilter{"u1", false, std::nullopt}), 1, 60s);
    cache.writeThrough(keys::entries(EntryFilter{"u1", true, std::nullopt}), 1, 60s);
    cache.writeThrough(keys::entries(EntryFilter{"u1", false, std::string("dir")}), 1, 60s);
    cache.writeThrough(keys::entries(EntryFilter{"u10", false, std::nullopt}), 1, 60s);
    cache.writeThrough(keys::entry("u1"), 1, 60s);

    EXPECT_EQ(cache.invalidatePrefix(keys::entriesPrefix("u1")), 3u);
    EXPECT_TRUE(cache.contains(keys::entries(EntryFilter{"u10", false, std::nullopt})));
    EXPECT_TRUE(cache.contains(keys::entry("u1")));
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(CacheTest, Eviction_KeepsSizeWithinBound) {
    Cache small(10);
    for (int i = 0; i < 50; ++i) small.writeThrough("k" + std::to_string(i), i, std::chrono::seconds(60 + i));

    EXPECT_LE(small.size(), 10u);
    EXPECT_TRUE(small.contains("k49"));
    EXPECT_GT(small.stats().evictions, 0u);
}

TEST_F(CacheTest, Eviction_PrefersExpiredSlots) {
    Cache small(3);
    small.writeThrough("stale", 0, 0s);
    small.writeThrough("a", 1, 60s);
    small.writeThrough("b", 2, 60s);
    small.writeThrough("c", 3, 60s);

    EXPECT_TRUE(small.contains("a"));
    EXPECT_TRUE(small.contains("b"));
    EXPECT_TRUE(small.contains("c"));
}

TEST_F(CacheTest, StoresStructuredValues) {
    fdx::fs::model::Entry e;
    e.id = "id-1";
    e.name = "report.pdf";
    e.author_id = "u1";
    e.permission_inclusive = {"u2"};
    e.is_deleted = true;
    e.is_deleted_since = 1700000000;
    e.created_at = e.updated_at = 1690000000;

    cache.writeThrough(keys::entry(e.id), e, 60s);
    const auto back = cache.peek<fdx::fs::model::Entry>(keys::entry(e.id));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, e);
}
