/** \file config.cpp
 *  \brief Environment-driven factory configuration.
 */

#include "prune/config.hpp"

#include "prune/caching_exclude_factory.hpp"
#include "prune/core/platform_utils.hpp"
#include "prune/normalizing_exclude_factory.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace prune {

namespace {

auto invalid(const char* name, const std::string& value, const char* expected) -> core::error {
    return core::error{
        core::error_code::config_invalid,
        std::string(name) + "='" + value + "' is not " + expected,
        "config.env"
    };
}

auto parse_flag(const char* name, bool& out) -> std::expected<void, core::error> {
    auto v = core::safe_getenv(name);
    if (!v) return {};
    std::string s = *v;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "on") {
        out = true;
    } else if (s == "0" || s == "false" || s == "off") {
        out = false;
    } else {
        return std::unexpected(invalid(name, *v, "a boolean"));
    }
    return {};
}

auto parse_size(const char* name, std::size_t& out) -> std::expected<void, core::error> {
    auto v = core::safe_getenv(name);
    if (!v) return {};
    std::size_t parsed = 0;
    const char* first = v->data();
    const char* last = first + v->size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last || v->empty()) {
        return std::unexpected(invalid(name, *v, "a decimal number"));
    }
    out = parsed;
    return {};
}

} // namespace

auto load_config_from_env() -> std::expected<factory_config, core::error> {
    factory_config config;
    if (auto r = parse_flag("PRUNE_NORMALIZE", config.normalize); !r) return std::unexpected(r.error());
    if (auto r = parse_flag("PRUNE_CACHE", config.cache); !r) return std::unexpected(r.error());
    if (auto r = parse_size("PRUNE_CACHE_CAPACITY", config.cache_capacity); !r) return std::unexpected(r.error());
    if (auto r = parse_size("PRUNE_CACHE_SHARDS", config.cache_shards); !r) return std::unexpected(r.error());
    if (auto r = parse_flag("PRUNE_DEBUG", config.debug); !r) return std::unexpected(r.error());
    return config;
}

auto validate(const factory_config& config) -> std::expected<void, core::error> {
    if (!config.cache) return {};
    if (config.cache_shards == 0) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "cache_shards must be positive",
            "config.validate"
        });
    }
    if (config.cache_capacity < config.cache_shards) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "cache_capacity must be at least cache_shards",
            "config.validate"
        });
    }
    return {};
}

auto make_exclude_factory(const factory_config& config)
    -> std::expected<std::shared_ptr<const ExcludeFactory>, core::error> {
    if (auto ok = validate(config); !ok) {
        return std::unexpected(ok.error());
    }

    std::shared_ptr<const ExcludeFactory> factory = std::make_shared<DefaultExcludeFactory>();
    if (config.normalize) {
        factory = std::make_shared<NormalizingExcludeFactory>(factory);
    }
    if (config.cache) {
        factory = std::make_shared<CachingExcludeFactory>(factory, caching_config{
            config.cache_capacity,
            config.cache_shards,
            config.debug
        });
    }

    if (config.debug) {
        std::cerr << "[PRUNE][config] factory normalize=" << config.normalize
                  << " cache=" << config.cache;
        if (config.cache) {
            std::cerr << " capacity=" << config.cache_capacity
                      << " shards=" << config.cache_shards;
        }
        std::cerr << "\n";
    }
    return factory;
}

} // namespace prune
