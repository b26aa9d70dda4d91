/** \file normalizing_exclude_factory.cpp
 *  \brief Rewrite rules of the normalizing exclusion factory.
 */

#include "prune/normalizing_exclude_factory.hpp"

#include "prune/error.hpp"

#include <utility>
#include <variant>
#include <vector>

namespace prune {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

[[noreturn]] void unexpected_spec(const exclude_spec& spec, const char* component) {
    throw core::invariant_violation(core::error{
        core::error_code::unsupported,
        "unexpected spec type: " + to_string(spec),
        component
    });
}

inline void require_value(const exclude_spec& spec, const char* component) {
    if (spec.node.valueless_by_exception()) unexpected_spec(spec, component);
}

// `general` subsumes `specific` in a union: same concrete group, `general`
// has no module, `specific` narrows by module or artifact, and `general`
// either has no artifact or the same artifact as `specific`.
inline auto subsumes(const module_exclude& general, const module_exclude& specific) -> bool {
    return general.group && general.group == specific.group
        && !general.module
        && (specific.module || specific.artifact)
        && (!general.artifact || general.artifact == specific.artifact);
}

template <class T>
struct unified_field {
    std::optional<T> value;
    bool incompatible{false};
};

// Intersection of one field: two different concrete values cannot both hold,
// otherwise the concrete value (if any) wins.
template <class T>
auto unify(const std::optional<T>& a, const std::optional<T>& b) -> unified_field<T> {
    if (a && b) {
        if (*a == *b) return {a, false};
        return {std::nullopt, true};
    }
    return {a ? a : b, false};
}

} // namespace

NormalizingExcludeFactory::NormalizingExcludeFactory()
    : raw_(std::make_shared<DefaultExcludeFactory>()) {}

NormalizingExcludeFactory::NormalizingExcludeFactory(std::shared_ptr<const ExcludeFactory> raw)
    : raw_(std::move(raw)) {}

auto NormalizingExcludeFactory::nothing() const -> exclude_spec {
    return raw_->nothing();
}

auto NormalizingExcludeFactory::everything() const -> exclude_spec {
    return raw_->everything();
}

auto NormalizingExcludeFactory::leaf(std::optional<std::string> group,
                                     std::optional<std::string> module,
                                     std::optional<artifact_name> artifact) const -> exclude_spec {
    return raw_->leaf(std::move(group), std::move(module), std::move(artifact));
}

auto NormalizingExcludeFactory::any_of(std::span<const exclude_spec> specs) const -> exclude_spec {
    if (specs.empty()) {
        return nothing();
    }
    exclude_spec result = specs.front();
    for (const auto& spec : specs.subspan(1)) {
        result = union_of(result, spec);
    }
    return result;
}

auto NormalizingExcludeFactory::all_of(std::span<const exclude_spec> specs) const -> exclude_spec {
    if (specs.empty()) {
        // Same convention as any_of, not everything().
        return nothing();
    }
    exclude_spec result = specs.front();
    for (const auto& spec : specs.subspan(1)) {
        result = intersection_of(result, spec);
    }
    return result;
}

// ── union ───────────────────────────────────────────────────────────────────

auto NormalizingExcludeFactory::union_of(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec {
    require_value(left, "normalizing.union");
    require_value(right, "normalizing.union");
    if (left == right) {
        return left;
    }
    if (left.is_composite()) {
        return union_ordered(right, left);
    }
    return union_ordered(left, right);
}

auto NormalizingExcludeFactory::union_ordered(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec {
    if (right.is_everything()) return right;
    if (right.is_nothing()) return left;
    return std::visit(overloaded{
        [&](const exclude_everything&) { return left; },
        [&](const exclude_nothing&) { return right; },
        [&](const module_exclude& m) { return union_leaf(left, m, right); },
        [&](const exclude_all_of& c) { return union_all_of(c, right); },
        [&](const exclude_any_of& c) { return union_any_of(c, right); },
    }, left.node);
}

auto NormalizingExcludeFactory::union_leaf(const exclude_spec& left, const module_exclude& leaf,
                                           const exclude_spec& right) const -> exclude_spec {
    return std::visit(overloaded{
        [&](const module_exclude& r) { return union_leaves(left, leaf, right, r); },
        [&](const exclude_any_of& c) { return union_any_of(c, left); },
        [&](const exclude_all_of& c) { return union_all_of(c, left); },
        [&](const exclude_everything&) -> exclude_spec { unexpected_spec(right, "normalizing.union"); },
        [&](const exclude_nothing&) -> exclude_spec { unexpected_spec(right, "normalizing.union"); },
    }, right.node);
}

auto NormalizingExcludeFactory::union_leaves(const exclude_spec& left, const module_exclude& l,
                                             const exclude_spec& right, const module_exclude& r) const -> exclude_spec {
    if (subsumes(l, r)) return left;
    if (subsumes(r, l)) return right;
    return raw_->any_of({left, right});
}

auto NormalizingExcludeFactory::union_all_of(const exclude_all_of& left, const exclude_spec& right) const -> exclude_spec {
    // A ∪ (A ∩ B) = A
    if (left.contains(right)) {
        return right;
    }
    std::vector<exclude_spec> distributed;
    distributed.reserve(left.components.size());
    for (const auto& component : left.components) {
        distributed.push_back(union_of(component, right));
    }
    return all_of(distributed);
}

auto NormalizingExcludeFactory::union_any_of(const exclude_any_of& left, const exclude_spec& right) const -> exclude_spec {
    return exclude_spec{left.add(right)};
}

// ── intersection ────────────────────────────────────────────────────────────

auto NormalizingExcludeFactory::intersection_of(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec {
    require_value(left, "normalizing.intersection");
    require_value(right, "normalizing.intersection");
    if (left == right) {
        return left;
    }
    if (left.is_composite()) {
        return intersection_ordered(right, left);
    }
    return intersection_ordered(left, right);
}

auto NormalizingExcludeFactory::intersection_ordered(const exclude_spec& left, const exclude_spec& right) const -> exclude_spec {
    if (right.is_everything()) return left;
    if (right.is_nothing()) return right;
    return std::visit(overloaded{
        [&](const exclude_everything&) { return right; },
        [&](const exclude_nothing&) { return left; },
        [&](const module_exclude& m) { return intersection_leaf(m, left, right); },
        [&](const exclude_all_of& c) { return intersection_all_of(c, right); },
        [&](const exclude_any_of& c) { return intersection_any_of(c, right); },
    }, left.node);
}

auto NormalizingExcludeFactory::intersection_leaf(const module_exclude& leaf, const exclude_spec& left,
                                                  const exclude_spec& right) const -> exclude_spec {
    return std::visit(overloaded{
        [&](const module_exclude& r) { return intersection_leaves(leaf, r); },
        [&](const exclude_any_of& c) { return intersection_any_of(c, left); },
        [&](const exclude_all_of& c) { return intersection_all_of(c, left); },
        [&](const exclude_everything&) -> exclude_spec { unexpected_spec(right, "normalizing.intersection"); },
        [&](const exclude_nothing&) -> exclude_spec { unexpected_spec(right, "normalizing.intersection"); },
    }, right.node);
}

auto NormalizingExcludeFactory::intersection_leaves(const module_exclude& l, const module_exclude& r) const -> exclude_spec {
    auto group = unify(l.group, r.group);
    auto module = unify(l.module, r.module);
    auto artifact = unify(l.artifact, r.artifact);
    if (group.incompatible || module.incompatible || artifact.incompatible) {
        return nothing();
    }
    return raw_->leaf(std::move(group.value), std::move(module.value), std::move(artifact.value));
}

auto NormalizingExcludeFactory::intersection_all_of(const exclude_all_of& left, const exclude_spec& right) const -> exclude_spec {
    return exclude_spec{left.add(right)};
}

auto NormalizingExcludeFactory::intersection_any_of(const exclude_any_of& left, const exclude_spec& right) const -> exclude_spec {
    std::vector<exclude_spec> distributed;
    distributed.reserve(left.components.size());
    for (const auto& component : left.components) {
        distributed.push_back(intersection_of(component, right));
    }
    return any_of(distributed);
}

} // namespace prune
