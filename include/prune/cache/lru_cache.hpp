/** \file lru_cache.hpp
 *  \brief Thread-safe, cost-bounded LRU cache with sharding for reduced contention
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prune::cache {

/**
 * \brief Statistics for cache performance monitoring
 */
struct CacheStats {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> evictions{0};
    std::atomic<std::uint64_t> inserts{0};
    std::atomic<std::uint64_t> updates{0};
    std::atomic<std::uint64_t> cost_used{0};

    CacheStats() = default;

    CacheStats(const CacheStats& other)
        : hits(other.hits.load())
        , misses(other.misses.load())
        , evictions(other.evictions.load())
        , inserts(other.inserts.load())
        , updates(other.updates.load())
        , cost_used(other.cost_used.load()) {}

    CacheStats& operator=(const CacheStats& other) {
        if (this != &other) {
            hits.store(other.hits.load());
            misses.store(other.misses.load());
            evictions.store(other.evictions.load());
            inserts.store(other.inserts.load());
            updates.store(other.updates.load());
            cost_used.store(other.cost_used.load());
        }
        return *this;
    }

    [[nodiscard]] auto hit_rate() const -> double {
        auto total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / static_cast<double>(total) : 0.0;
    }

    void reset() {
        hits = 0;
        misses = 0;
        evictions = 0;
        inserts = 0;
        updates = 0;
        cost_used = 0;
    }
};

/**
 * \brief Eviction callback, invoked under the shard lock
 */
template<typename K, typename V>
using EvictionCallback = std::function<void(const K&, const V&)>;

/**
 * \brief One LRU shard. Every entry carries a caller-supplied cost; the shard
 * evicts from the least recently used end until the total fits max_cost.
 */
template<typename K, typename V, typename Hash = std::hash<K>>
class LruCacheShard {
public:
    struct Entry {
        K key;
        V value;
        std::size_t cost;
    };

    using ListIterator = typename std::list<Entry>::iterator;

    explicit LruCacheShard(std::size_t max_cost, EvictionCallback<K, V> on_evict = nullptr)
        : max_cost_(max_cost)
        , on_evict_(std::move(on_evict)) {}

    // Non-copyable and non-movable due to mutex
    LruCacheShard(const LruCacheShard&) = delete;
    LruCacheShard& operator=(const LruCacheShard&) = delete;
    LruCacheShard(LruCacheShard&&) = delete;
    LruCacheShard& operator=(LruCacheShard&&) = delete;

    /**
     * \brief Get value from cache and mark it most recently used
     */
    [[nodiscard]] auto get(const K& key) -> std::optional<V> {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            stats_.misses.fetch_add(1);
            return std::nullopt;
        }

        auto list_it = it->second;
        if (list_it != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
        }

        stats_.hits.fetch_add(1);
        return list_it->value;
    }

    /**
     * \brief Insert or update value in cache.
     *
     * An entry whose cost alone exceeds the shard budget is not stored.
     */
    auto put(const K& key, V value, std::size_t cost) -> void {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            auto list_it = it->second;
            cost_used_ -= list_it->cost;
            cost_used_ += cost;
            list_it->value = std::move(value);
            list_it->cost = cost;
            if (list_it != lru_list_.begin()) {
                lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
            }
            stats_.updates.fetch_add(1);
            make_space(0);
        } else {
            if (cost > max_cost_) {
                return;
            }
            make_space(cost);
            lru_list_.emplace_front(Entry{key, std::move(value), cost});
            index_[key] = lru_list_.begin();
            cost_used_ += cost;
            stats_.inserts.fetch_add(1);
        }

        stats_.cost_used.store(cost_used_);
    }

    auto remove(const K& key) -> bool {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        evict_entry(it);
        return true;
    }

    auto clear() -> void {
        std::unique_lock lock(mutex_);
        lru_list_.clear();
        index_.clear();
        cost_used_ = 0;
        stats_.cost_used.store(0);
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] auto cost_used() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return cost_used_;
    }

    [[nodiscard]] auto stats() const -> const CacheStats& {
        return stats_;
    }

private:
    auto make_space(std::size_t required) -> void {
        while (cost_used_ + required > max_cost_ && !lru_list_.empty()) {
            auto it = index_.find(lru_list_.back().key);
            evict_entry(it);
        }
    }

    auto evict_entry(typename std::unordered_map<K, ListIterator, Hash>::iterator it) -> void {
        auto list_it = it->second;
        if (on_evict_) {
            on_evict_(list_it->key, list_it->value);
        }
        cost_used_ -= list_it->cost;
        index_.erase(it);
        lru_list_.erase(list_it);
        stats_.evictions.fetch_add(1);
        stats_.cost_used.store(cost_used_);
    }

    mutable std::shared_mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<K, ListIterator, Hash> index_;

    std::size_t max_cost_;
    std::size_t cost_used_{0};
    EvictionCallback<K, V> on_evict_;

    mutable CacheStats stats_;
};

/**
 * \brief Sharded LRU cache for high concurrency. The cost budget is split
 * evenly across shards; a key always maps to the same shard.
 */
template<typename K, typename V, typename Hash = std::hash<K>>
class ShardedLruCache {
public:
    static constexpr std::size_t DEFAULT_NUM_SHARDS = 16;

    explicit ShardedLruCache(std::size_t max_cost,
                             std::size_t num_shards = DEFAULT_NUM_SHARDS,
                             EvictionCallback<K, V> on_evict = nullptr)
        : num_shards_(num_shards == 0 ? 1 : num_shards)
        , hasher_() {
        auto cost_per_shard = max_cost / num_shards_;
        shards_.reserve(num_shards_);
        for (std::size_t i = 0; i < num_shards_; ++i) {
            shards_.emplace_back(std::make_unique<LruCacheShard<K, V, Hash>>(cost_per_shard, on_evict));
        }
    }

    [[nodiscard]] auto get(const K& key) -> std::optional<V> {
        return shard_for(key).get(key);
    }

    auto put(const K& key, V value, std::size_t cost) -> void {
        shard_for(key).put(key, std::move(value), cost);
    }

    auto remove(const K& key) -> bool {
        return shard_for(key).remove(key);
    }

    auto clear() -> void {
        for (auto& shard : shards_) {
            shard->clear();
        }
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->size();
        }
        return total;
    }

    [[nodiscard]] auto cost_used() const -> std::size_t {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->cost_used();
        }
        return total;
    }

    [[nodiscard]] auto num_shards() const noexcept -> std::size_t {
        return num_shards_;
    }

    [[nodiscard]] auto stats() const -> CacheStats {
        CacheStats total;
        for (const auto& shard : shards_) {
            const auto& s = shard->stats();
            total.hits += s.hits.load();
            total.misses += s.misses.load();
            total.evictions += s.evictions.load();
            total.inserts += s.inserts.load();
            total.updates += s.updates.load();
        }
        total.cost_used = cost_used();
        return total;
    }

private:
    [[nodiscard]] auto shard_for(const K& key) -> LruCacheShard<K, V, Hash>& {
        return *shards_[hasher_(key) % num_shards_];
    }

    std::size_t num_shards_;
    std::vector<std::unique_ptr<LruCacheShard<K, V, Hash>>> shards_;
    Hash hasher_;
};

} // namespace prune::cache
