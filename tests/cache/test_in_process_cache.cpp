#include <gtest/gtest.h>
#include "umb/cache.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace umb::cache;
using namespace std::chrono_literals;

// ─── Basic operations ────────────────────────────────────────────────────────

TEST(InProcessCache_Basic, SetThenGet) {
    InProcessCache cache(10, Millis{0});
    EXPECT_EQ(cache.set("k", "v", std::nullopt, false), CacheStatus::Ok);
    const auto r = cache.get("k");
    EXPECT_TRUE(r.hit());
    EXPECT_EQ(r.value, "v");
}

TEST(InProcessCache_Basic, MissingKey_Miss) {
    InProcessCache cache(10, Millis{0});
    EXPECT_EQ(cache.get("absent").status, CacheStatus::Miss);
}

TEST(InProcessCache_Basic, OverwriteKeepsSingleSlot) {
    InProcessCache cache(10, Millis{0});
    cache.set("k", "1", std::nullopt, false);
    cache.set("k", "2", std::nullopt, true);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("k").value, "2");
}

TEST(InProcessCache_Basic, RemoveIsIdempotent) {
    InProcessCache cache(10, Millis{0});
    cache.set("k", "v", std::nullopt, false);
    EXPECT_EQ(cache.remove("k"), CacheStatus::Ok);
    EXPECT_EQ(cache.remove("k"), CacheStatus::Ok);
    EXPECT_EQ(cache.get("k").status, CacheStatus::Miss);
}

TEST(InProcessCache_Basic, ZeroCapacityClampedToOne) {
    InProcessCache cache(0, Millis{0});
    EXPECT_EQ(cache.capacity(), 1u);
    cache.set("a", "1", std::nullopt, false);
    EXPECT_TRUE(cache.get("a").hit());
}

// ─── Expiry ──────────────────────────────────────────────────────────────────

TEST(InProcessCache_Expiry, LazyExpiryOnGet) {
    InProcessCache cache(10, Millis{0});
    cache.set("k", "v", Millis{20}, false);
    EXPECT_TRUE(cache.get("k").hit());
    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(cache.get("k").status, CacheStatus::Miss);
    EXPECT_EQ(cache.stats().expirations, 1u);
}

TEST(InProcessCache_Expiry, ExpireNowRemovesOnlyExpired) {
    InProcessCache cache(10, Millis{0});
    cache.set("short", "v", Millis{10}, false);
    cache.set("long", "v", Millis{60'000}, false);
    cache.set("forever", "v", std::nullopt, false);
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(cache.expire_now(), 1u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(InProcessCache_Expiry, BackgroundSweeperRemovesExpired) {
    InProcessCache cache(10, Millis{10});
    cache.set("k", "v", Millis{5}, false);
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (cache.size() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(cache.size(), 0u);
}

TEST(InProcessCache_Expiry, SnapshotReportsRemainingLifetime) {
    InProcessCache cache(10, Millis{0});
    cache.set("ttl", "v", Millis{60'000}, true);
    cache.set("none", "v", std::nullopt, false);
    const auto items = cache.snapshot();
    ASSERT_EQ(items.size(), 2u);
    for (const auto& item : items) {
        if (item.key == "ttl") {
            ASSERT_TRUE(item.remaining.has_value());
            EXPECT_GT(*item.remaining, Millis{59'000});
            EXPECT_LE(*item.remaining, Millis{60'000});
            EXPECT_TRUE(item.durable_backed);
        } else {
            EXPECT_FALSE(item.remaining.has_value());
        }
    }
}

// ─── Capacity & eviction order ───────────────────────────────────────────────

TEST(InProcessCache_Capacity, NeverExceedsBound) {
    InProcessCache cache(5, Millis{0});
    for (int i = 0; i < 50; ++i) {
        cache.set("k" + std::to_string(i), "v", std::nullopt, i % 2 == 0);
        EXPECT_LE(cache.size(), 5u);
    }
    EXPECT_EQ(cache.stats().evictions, 45u);
}

TEST(InProcessCache_Capacity, DurableBackedEvictedBeforeCacheOnly) {
    InProcessCache cache(3, Millis{0});
    cache.set("volatile", "v", std::nullopt, false);
    cache.set("durable_1", "v", std::nullopt, true);
    cache.set("durable_2", "v", std::nullopt, true);
    cache.set("new", "v", std::nullopt, false);

    EXPECT_TRUE(cache.get("volatile").hit());
    EXPECT_EQ(cache.get("durable_1").status, CacheStatus::Miss);
    EXPECT_TRUE(cache.get("durable_2").hit());
    const auto s = cache.stats();
    EXPECT_EQ(s.evictions, 1u);
    EXPECT_EQ(s.drops, 0u);
}

TEST(InProcessCache_Capacity, CacheOnlyEvictionCountsAsDrop) {
    InProcessCache cache(2, Millis{0});
    cache.set("a", "v", std::nullopt, false);
    cache.set("b", "v", std::nullopt, false);
    cache.set("c", "v", std::nullopt, false);
    EXPECT_EQ(cache.get("a").status, CacheStatus::Miss);
    EXPECT_EQ(cache.stats().drops, 1u);
}

TEST(InProcessCache_Capacity, GetRefreshesRecency) {
    InProcessCache cache(2, Millis{0});
    cache.set("a", "v", std::nullopt, true);
    cache.set("b", "v", std::nullopt, true);
    EXPECT_TRUE(cache.get("a").hit());
    cache.set("c", "v", std::nullopt, true);
    EXPECT_TRUE(cache.get("a").hit());
    EXPECT_EQ(cache.get("b").status, CacheStatus::Miss);
}

TEST(InProcessCache_Capacity, ExpiredTailPreferredOverLiveEntry) {
    InProcessCache cache(2, Millis{0});
    cache.set("dying", "v", Millis{5}, false);
    cache.set("live", "v", std::nullopt, true);
    std::this_thread::sleep_for(20ms);
    cache.set("new", "v", std::nullopt, false);
    EXPECT_TRUE(cache.get("live").hit());
    const auto s = cache.stats();
    EXPECT_EQ(s.evictions, 0u);
    EXPECT_EQ(s.expirations, 1u);
}

// ─── Concurrency ─────────────────────────────────────────────────────────────

TEST(InProcessCache_Concurrency, ParallelWritersRespectBound) {
    InProcessCache cache(64, Millis{1});
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                const std::string key = std::to_string(t) + ":" + std::to_string(i);
                cache.set(key, "v", Millis{50}, i % 3 == 0);
                (void)cache.get(key);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_LE(cache.size(), 64u);
}
