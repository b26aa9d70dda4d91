#include <catch2/catch_test_macros.hpp>

#include "prune/cache/lru_cache.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using prune::cache::LruCacheShard;
using prune::cache::ShardedLruCache;

TEST_CASE("LruCacheShard get/put", "[cache][lru]") {
    LruCacheShard<int, std::string> shard(10);

    REQUIRE_FALSE(shard.get(1).has_value());
    shard.put(1, "one", 3);
    auto v = shard.get(1);
    REQUIRE(v.has_value());
    REQUIRE(*v == "one");
    REQUIRE(shard.size() == 1);
    REQUIRE(shard.cost_used() == 3);

    shard.put(1, "uno", 5);
    REQUIRE(*shard.get(1) == "uno");
    REQUIRE(shard.cost_used() == 5);
    REQUIRE(shard.stats().updates.load() == 1);
    REQUIRE(shard.stats().hits.load() == 2);
    REQUIRE(shard.stats().misses.load() == 1);
}

TEST_CASE("LruCacheShard evicts by cost in LRU order", "[cache][lru]") {
    std::vector<int> evicted;
    LruCacheShard<int, int> shard(6, [&](const int& k, const int&) { evicted.push_back(k); });

    shard.put(1, 10, 2);
    shard.put(2, 20, 2);
    shard.put(3, 30, 2);
    (void)shard.get(1);           // 2 is now least recently used
    shard.put(4, 40, 3);          // needs 3, frees 2 then 3

    REQUIRE(evicted == std::vector<int>{2, 3});
    REQUIRE(shard.get(1).has_value());
    REQUIRE(shard.get(4).has_value());
    REQUIRE(shard.cost_used() == 5);
    REQUIRE(shard.stats().evictions.load() == 2);
}

TEST_CASE("LruCacheShard skips oversized entries", "[cache][lru]") {
    LruCacheShard<int, int> shard(4);
    shard.put(1, 1, 2);
    shard.put(2, 2, 5);
    REQUIRE_FALSE(shard.get(2).has_value());
    REQUIRE(shard.get(1).has_value());
}

TEST_CASE("LruCacheShard remove and clear", "[cache][lru]") {
    LruCacheShard<int, int> shard(100);
    shard.put(1, 1, 1);
    shard.put(2, 2, 1);
    REQUIRE(shard.remove(1));
    REQUIRE_FALSE(shard.remove(1));
    REQUIRE(shard.size() == 1);
    shard.clear();
    REQUIRE(shard.size() == 0);
    REQUIRE(shard.cost_used() == 0);
}

TEST_CASE("ShardedLruCache aggregates shards", "[cache][lru]") {
    ShardedLruCache<int, int> cache(1600, 16);
    REQUIRE(cache.num_shards() == 16);
    for (int i = 0; i < 100; ++i) cache.put(i, i * 2, 1);
    REQUIRE(cache.size() == 100);
    REQUIRE(cache.cost_used() == 100);
    for (int i = 0; i < 100; ++i) {
        auto v = cache.get(i);
        REQUIRE(v.has_value());
        REQUIRE(*v == i * 2);
    }
    auto st = cache.stats();
    REQUIRE(st.hits.load() == 100);
    REQUIRE(st.inserts.load() == 100);
    REQUIRE(st.hit_rate() == 1.0);

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("ShardedLruCache with zero shards uses one", "[cache][lru]") {
    ShardedLruCache<int, int> cache(8, 0);
    REQUIRE(cache.num_shards() == 1);
    cache.put(1, 1, 4);
    REQUIRE(cache.get(1).has_value());
}

TEST_CASE("ShardedLruCache concurrent access", "[cache][lru][concurrency]") {
    ShardedLruCache<int, int> cache(64, 4);
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, &mismatches, t] {
            for (int i = 0; i < 1000; ++i) {
                const int key = (i * 7 + t) % 128;
                cache.put(key, key, 1);
                if (auto v = cache.get(key); v && *v != key) mismatches.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(mismatches.load() == 0);
    REQUIRE(cache.cost_used() <= 64);
}
