/** \file caching_exclude_factory.cpp
 *  \brief Memoizing exclusion factory.
 */

#include "prune/caching_exclude_factory.hpp"

#include <iostream>
#include <utility>

namespace prune {

namespace {

auto key_cost(const merge_key& key, const exclude_spec& result) noexcept -> std::size_t {
    std::size_t cost = node_count(result);
    for (const auto& s : key.operands) cost += node_count(s);
    return cost;
}

auto make_eviction_trace(bool enabled) -> cache::EvictionCallback<merge_key, exclude_spec> {
    if (!enabled) return nullptr;
    return [](const merge_key& key, const exclude_spec& result) {
        std::cerr << "[PRUNE][cache] evict "
                  << (key.op == merge_op::any_of ? "any_of" : "all_of")
                  << " operands=" << key.operands.size()
                  << " result=" << result << "\n";
    };
}

} // namespace

auto merge_key_hash::operator()(const merge_key& key) const noexcept -> std::size_t {
    std::size_t h = static_cast<std::size_t>(key.op) + 0x9e3779b97f4a7c15ULL;
    for (const auto& s : key.operands) {
        h ^= hash_value(s) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return h;
}

CachingExcludeFactory::CachingExcludeFactory(std::shared_ptr<const ExcludeFactory> delegate,
                                             caching_config config)
    : delegate_(std::move(delegate))
    , memo_(config.capacity, config.shards, make_eviction_trace(config.trace_evictions)) {}

auto CachingExcludeFactory::nothing() const -> exclude_spec {
    return delegate_->nothing();
}

auto CachingExcludeFactory::everything() const -> exclude_spec {
    return delegate_->everything();
}

auto CachingExcludeFactory::leaf(std::optional<std::string> group,
                                 std::optional<std::string> module,
                                 std::optional<artifact_name> artifact) const -> exclude_spec {
    return delegate_->leaf(std::move(group), std::move(module), std::move(artifact));
}

auto CachingExcludeFactory::any_of(std::span<const exclude_spec> specs) const -> exclude_spec {
    if (specs.size() < 2) {
        return delegate_->any_of(specs);
    }
    return memoized(merge_op::any_of, specs);
}

auto CachingExcludeFactory::all_of(std::span<const exclude_spec> specs) const -> exclude_spec {
    if (specs.size() < 2) {
        return delegate_->all_of(specs);
    }
    return memoized(merge_op::all_of, specs);
}

auto CachingExcludeFactory::memoized(merge_op op, std::span<const exclude_spec> specs) const -> exclude_spec {
    merge_key key{op, std::vector<exclude_spec>(specs.begin(), specs.end())};
    if (auto hit = memo_.get(key)) {
        return std::move(*hit);
    }
    exclude_spec result = op == merge_op::any_of ? delegate_->any_of(specs) : delegate_->all_of(specs);
    const auto cost = key_cost(key, result);
    memo_.put(key, result, cost);
    return result;
}

auto CachingExcludeFactory::stats() const -> cache::CacheStats {
    return memo_.stats();
}

auto CachingExcludeFactory::size() const -> std::size_t {
    return memo_.size();
}

void CachingExcludeFactory::clear() {
    memo_.clear();
}

} // namespace prune
