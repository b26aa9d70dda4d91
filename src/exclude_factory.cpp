/** \file exclude_factory.cpp
 *  \brief Raw (non-simplifying) exclusion factory.
 */

#include "prune/exclude_factory.hpp"

#include <vector>

namespace prune {

namespace {

auto unique_components(std::span<const exclude_spec> specs) -> std::vector<exclude_spec> {
    std::vector<exclude_spec> out;
    out.reserve(specs.size());
    for (const auto& s : specs) {
        bool seen = false;
        for (const auto& o : out) {
            if (o == s) { seen = true; break; }
        }
        if (!seen) out.push_back(s);
    }
    return out;
}

} // namespace

auto DefaultExcludeFactory::nothing() const -> exclude_spec {
    return exclude_spec{exclude_nothing{}};
}

auto DefaultExcludeFactory::everything() const -> exclude_spec {
    return exclude_spec{exclude_everything{}};
}

auto DefaultExcludeFactory::leaf(std::optional<std::string> group,
                                 std::optional<std::string> module,
                                 std::optional<artifact_name> artifact) const -> exclude_spec {
    return exclude_spec{module_exclude{std::move(group), std::move(module), std::move(artifact)}};
}

auto DefaultExcludeFactory::any_of(std::span<const exclude_spec> specs) const -> exclude_spec {
    return exclude_spec{exclude_any_of{unique_components(specs)}};
}

auto DefaultExcludeFactory::all_of(std::span<const exclude_spec> specs) const -> exclude_spec {
    return exclude_spec{exclude_all_of{unique_components(specs)}};
}

} // namespace prune
