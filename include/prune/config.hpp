#pragma once

/** \file config.hpp
 *  \brief Factory configuration and assembly.
 *
 * Environment overrides (all optional):
 *   PRUNE_NORMALIZE       0/1/true/false/on/off   stack the normalizing factory
 *   PRUNE_CACHE           0/1/true/false/on/off   memoize any_of/all_of
 *   PRUNE_CACHE_CAPACITY  decimal                 memo cost budget (spec nodes)
 *   PRUNE_CACHE_SHARDS    decimal                 memo shard count
 *   PRUNE_DEBUG           0/1/true/false/on/off   trace to stderr
 */

#include <cstddef>
#include <expected>
#include <memory>

#include "prune/error.hpp"
#include "prune/exclude_factory.hpp"

namespace prune {

struct factory_config {
  bool normalize{true};             /**< apply rewrite laws on any_of/all_of */
  bool cache{true};                 /**< memoize any_of/all_of results */
  std::size_t cache_capacity{65536};/**< memo cost budget */
  std::size_t cache_shards{16};     /**< memo shards */
  bool debug{false};                /**< [PRUNE] trace lines on stderr */
};

/** \brief Defaults overlaid with PRUNE_* environment variables.
 *
 * \return config_invalid (component "config.env") for malformed values
 */
auto load_config_from_env() -> std::expected<factory_config, core::error>;

/** \brief Reject zero shards and a capacity smaller than the shard count. */
auto validate(const factory_config& config) -> std::expected<void, core::error>;

/** \brief Assemble raw -> normalizing -> caching factories per \p config. */
auto make_exclude_factory(const factory_config& config)
    -> std::expected<std::shared_ptr<const ExcludeFactory>, core::error>;

} // namespace prune
