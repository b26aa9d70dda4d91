#pragma once

/** \file exclude_factory.hpp
 *  \brief Factory interface for exclusion specs and the raw implementation.
 *
 * ExcludeFactory is the seam the dependency graph walk programs against.
 * Implementations differ only in how any_of/all_of combine their operands:
 *
 *   DefaultExcludeFactory      builds composites verbatim (no rewriting)
 *   NormalizingExcludeFactory  applies the algebraic rewrite laws
 *   CachingExcludeFactory      memoizes another factory's results
 *
 * Thread-safety: all factories in this library may be shared between threads.
 */

#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "prune/exclude_spec.hpp"

namespace prune {

class ExcludeFactory {
public:
    virtual ~ExcludeFactory() = default;

    [[nodiscard]] virtual auto nothing() const -> exclude_spec = 0;
    [[nodiscard]] virtual auto everything() const -> exclude_spec = 0;

    /** \brief Leaf rule; a disengaged field matches any value. */
    [[nodiscard]] virtual auto leaf(std::optional<std::string> group,
                                    std::optional<std::string> module,
                                    std::optional<artifact_name> artifact) const -> exclude_spec = 0;

    /** \brief Excluded if any of \p specs excludes. */
    [[nodiscard]] virtual auto any_of(std::span<const exclude_spec> specs) const -> exclude_spec = 0;

    /** \brief Excluded if all of \p specs exclude. */
    [[nodiscard]] virtual auto all_of(std::span<const exclude_spec> specs) const -> exclude_spec = 0;

    [[nodiscard]] auto any_of(std::initializer_list<exclude_spec> specs) const -> exclude_spec {
        return any_of(std::span<const exclude_spec>(specs.begin(), specs.size()));
    }

    [[nodiscard]] auto all_of(std::initializer_list<exclude_spec> specs) const -> exclude_spec {
        return all_of(std::span<const exclude_spec>(specs.begin(), specs.size()));
    }

    [[nodiscard]] auto group(std::string group) const -> exclude_spec {
        return leaf(std::move(group), std::nullopt, std::nullopt);
    }

    [[nodiscard]] auto module(std::string module) const -> exclude_spec {
        return leaf(std::nullopt, std::move(module), std::nullopt);
    }

    [[nodiscard]] auto module_id(std::string group, std::string module) const -> exclude_spec {
        return leaf(std::move(group), std::move(module), std::nullopt);
    }

    [[nodiscard]] auto artifact(std::string group, std::string module, artifact_name artifact) const -> exclude_spec {
        return leaf(std::move(group), std::move(module), std::move(artifact));
    }
};

/** \brief Raw factory.
 *
 * any_of/all_of wrap their operands verbatim, dropping only structurally
 * duplicate operands. Zero or one operand still yields a composite.
 */
class DefaultExcludeFactory : public ExcludeFactory {
public:
    using ExcludeFactory::any_of;
    using ExcludeFactory::all_of;

    [[nodiscard]] auto nothing() const -> exclude_spec override;
    [[nodiscard]] auto everything() const -> exclude_spec override;
    [[nodiscard]] auto leaf(std::optional<std::string> group,
                            std::optional<std::string> module,
                            std::optional<artifact_name> artifact) const -> exclude_spec override;
    [[nodiscard]] auto any_of(std::span<const exclude_spec> specs) const -> exclude_spec override;
    [[nodiscard]] auto all_of(std::span<const exclude_spec> specs) const -> exclude_spec override;
};

} // namespace prune
