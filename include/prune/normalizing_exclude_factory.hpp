#pragma once

/** \file normalizing_exclude_factory.hpp
 *  \brief Exclusion factory that keeps combined specs minimal and canonical.
 *
 * Every any_of/all_of request is folded pairwise through a binary union or
 * intersection that applies, first match wins:
 *
 *   A ∪ A = A                 A ∩ A = A                 (idempotence)
 *   everything ∪ X = everything, nothing ∪ X = X        (union absorbing/identity)
 *   nothing ∩ X = nothing, everything ∩ X = X           (intersection absorbing/identity)
 *   g:* ∪ g:m = g:*                                     (leaf subsumption)
 *   g:* ∩ g:m = g:m, g1:* ∩ g2:* = nothing              (leaf unification)
 *   A ∪ (A ∩ B) = A                                     (absorption)
 *   X ∪ (A ∩ B) = (X ∪ A) ∩ (X ∪ B)                     (distribution)
 *   X ∩ (A ∪ B) = (X ∩ A) ∪ (X ∩ B)                     (distribution)
 *   (A ∪ B) ∪ X, (A ∩ B) ∩ X                            (append, dedup)
 *
 * Operands are reordered so that a leaf or singleton, when present, drives
 * dispatch. The raw factory is used only when no law applies, and only for two
 * leaves.
 *
 * Empty input yields nothing() for both any_of and all_of. For all_of this is
 * not the intersection identity; callers depend on it.
 *
 * Thread-safety: stateless apart from the immutable raw factory; safe to share.
 */

#include <memory>
#include <span>

#include "prune/exclude_factory.hpp"

namespace prune {

class NormalizingExcludeFactory : public ExcludeFactory {
public:
    /** \brief Normalizes on top of a private DefaultExcludeFactory. */
    NormalizingExcludeFactory();

    /** \brief Normalizes on top of \p raw, used for singletons, leaves and fallbacks. */
    explicit NormalizingExcludeFactory(std::shared_ptr<const ExcludeFactory> raw);

    using ExcludeFactory::any_of;
    using ExcludeFactory::all_of;

    [[nodiscard]] auto nothing() const -> exclude_spec override;
    [[nodiscard]] auto everything() const -> exclude_spec override;
    [[nodiscard]] auto leaf(std::optional<std::string> group,
                            std::optional<std::string> module,
                            std::optional<artifact_name> artifact) const -> exclude_spec override;
    [[nodiscard]] auto any_of(std::span<const exclude_spec> specs) const -> exclude_spec override;
    [[nodiscard]] auto all_of(std::span<const exclude_spec> specs) const -> exclude_spec override;

    /** \brief Simplified left ∪ right. */
    [[nodiscard]] auto union_of(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec;

    /** \brief Simplified left ∩ right. */
    [[nodiscard]] auto intersection_of(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec;

private:
    auto union_ordered(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec;
    auto union_leaf(const exclude_spec& left, const module_exclude& leaf, const exclude_spec& right) const -> exclude_spec;
    auto union_leaves(const exclude_spec& left, const module_exclude& l,
                      const exclude_spec& right, const module_exclude& r) const -> exclude_spec;
    auto union_all_of(const exclude_all_of& left, const exclude_spec& right) const -> exclude_spec;
    auto union_any_of(const exclude_any_of& left, const exclude_spec& right) const -> exclude_spec;

    auto intersection_ordered(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec;
    auto intersection_leaf(const module_exclude& leaf, const exclude_spec& left, const exclude_spec& right) const -> exclude_spec;
    auto intersection_leaves(const module_exclude& l, const module_exclude& r) const -> exclude_spec;
    auto intersection_all_of(const exclude_all_of& left, const exclude_spec& right) const -> exclude_spec;
    auto intersection_any_of(const exclude_any_of& left, const exclude_spec& right) const -> exclude_spec;

    std::shared_ptr<const ExcludeFactory> raw_;
};

} // namespace prune
