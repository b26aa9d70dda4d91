#pragma once

/** \file caching_exclude_factory.hpp
 *  \brief Memoizing decorator over another ExcludeFactory.
 *
 * The dependency graph walk merges the same pairs of exclusion specs over and
 * over (every path into a module carries the excludes of its declaring
 * edges). This decorator remembers any_of/all_of results of its delegate,
 * keyed by the operation and the ordered operand list, in a sharded LRU cache.
 *
 * Results are exactly the delegate's; only calls with two or more operands
 * are memoized. Thread-safe: concurrent callers may share one instance.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "prune/cache/lru_cache.hpp"
#include "prune/exclude_factory.hpp"

namespace prune {

enum class merge_op : std::uint8_t { any_of, all_of };

/** \brief Memo key: an operation applied to an ordered operand list. */
struct merge_key {
  merge_op op{merge_op::any_of};
  std::vector<exclude_spec> operands;

  friend bool operator==(const merge_key&, const merge_key&) = default;
};

struct merge_key_hash {
  auto operator()(const merge_key& key) const noexcept -> std::size_t;
};

/** \brief Caching factory configuration */
struct caching_config {
  std::size_t capacity{65536};  /**< cost budget in spec nodes (key + result) */
  std::size_t shards{16};       /**< number of cache shards */
  bool trace_evictions{false};  /**< report evictions on stderr */
};

class CachingExcludeFactory : public ExcludeFactory {
public:
    using Memo = cache::ShardedLruCache<merge_key, exclude_spec, merge_key_hash>;

    explicit CachingExcludeFactory(std::shared_ptr<const ExcludeFactory> delegate,
                                   caching_config config = {});

    using ExcludeFactory::any_of;
    using ExcludeFactory::all_of;

    [[nodiscard]] auto nothing() const -> exclude_spec override;
    [[nodiscard]] auto everything() const -> exclude_spec override;
    [[nodiscard]] auto leaf(std::optional<std::string> group,
                            std::optional<std::string> module,
                            std::optional<artifact_name> artifact) const -> exclude_spec override;
    [[nodiscard]] auto any_of(std::span<const exclude_spec> specs) const -> exclude_spec override;
    [[nodiscard]] auto all_of(std::span<const exclude_spec> specs) const -> exclude_spec override;

    /** \brief Hit/miss/eviction counters of the memo. */
    [[nodiscard]] auto stats() const -> cache::CacheStats;

    /** \brief Number of memoized results. */
    [[nodiscard]] auto size() const -> std::size_t;

    void clear();

private:
    auto memoized(merge_op op, std::span<const exclude_spec> specs) const -> exclude_spec;

    std::shared_ptr<const ExcludeFactory> delegate_;
    mutable Memo memo_;
};

} // namespace prune
