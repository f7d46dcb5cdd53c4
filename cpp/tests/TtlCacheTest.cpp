#include "proxykeeper/proxy/ValidationCache.hpp"
#include "proxykeeper/util/TtlCache.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace std::chrono_literals;
using proxykeeper::util::TtlCache;

namespace {
using Cache = TtlCache<std::string, bool>;
}

TEST(TtlCacheTest, FreshnessBoundaryIsExclusive) {
    const auto t0 = Cache::Clock::now();
    EXPECT_TRUE(Cache::isFresh(t0, 1000ms, t0));
    EXPECT_TRUE(Cache::isFresh(t0, 1000ms, t0 + 999ms));
    EXPECT_FALSE(Cache::isFresh(t0, 1000ms, t0 + 1000ms));
    EXPECT_FALSE(Cache::isFresh(t0, 1000ms, t0 + 5s));
}

TEST(TtlCacheTest, FindFreshHidesStaleEntries) {
    Cache cache{1000ms};
    const auto t0 = Cache::Clock::now();
    cache.put("a", true, t0);

    EXPECT_EQ(cache.findFresh("a", t0 + 500ms), std::optional<bool>{true});
    EXPECT_FALSE(cache.findFresh("a", t0 + 1500ms).has_value());
    EXPECT_FALSE(cache.findFresh("missing", t0).has_value());

    // Stale but still stored until swept.
    EXPECT_TRUE(cache.find("a").has_value());
    EXPECT_EQ(cache.size(), 1u);
}

TEST(TtlCacheTest, PutOverwritesValueAndTimestamp) {
    Cache cache{1000ms};
    const auto t0 = Cache::Clock::now();
    cache.put("a", true, t0);
    cache.put("a", false, t0 + 800ms);

    auto entry = cache.find("a");
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(entry->value);
    EXPECT_EQ(cache.findFresh("a", t0 + 1500ms), std::optional<bool>{false});
}

TEST(TtlCacheTest, SweepRemovesOnlyExpiredEntries) {
    Cache cache{1000ms};
    const auto t0 = Cache::Clock::now();
    cache.put("old", true, t0);
    cache.put("new", true, t0 + 900ms);

    EXPECT_EQ(cache.sweepExpired(t0 + 1200ms), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.find("old").has_value());
    EXPECT_TRUE(cache.find("new").has_value());
    EXPECT_EQ(cache.sweepExpired(t0 + 1200ms), 0u);
}

TEST(TtlCacheTest, FreshKeysFiltersAndLimits) {
    Cache cache{1000ms};
    const auto t0 = Cache::Clock::now();
    cache.put("stale", true, t0 - 2s);
    cache.put("bad", false, t0);
    cache.put("good1", true, t0);
    cache.put("good2", true, t0);
    cache.put("good3", true, t0);

    auto valid = [](const std::string&, bool value) { return value; };
    auto keys = cache.freshKeys(valid, 10, t0);
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"good1", "good2", "good3"}));

    EXPECT_EQ(cache.freshKeys(valid, 2, t0).size(), 2u);
    EXPECT_TRUE(cache.freshKeys(valid, 0, t0).empty());
}

TEST(TtlCacheTest, ValidationCacheKeysOnFullIdentity) {
    proxykeeper::proxy::ValidationCache cache{1h};
    cache.put({"1.1.1.1", 80, "", ""}, true);
    cache.put({"1.1.1.1", 80, "u", "p"}, false);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.findFresh({"1.1.1.1", 80, "", ""}), std::optional<bool>{true});
    EXPECT_EQ(cache.findFresh({"1.1.1.1", 80, "u", "p"}), std::optional<bool>{false});
}
