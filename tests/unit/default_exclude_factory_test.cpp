#include <catch2/catch_test_macros.hpp>

#include "prune/exclude_factory.hpp"

#include <span>
#include <vector>

using namespace prune;

TEST_CASE("raw factory builds composites verbatim", "[default_factory]") {
  DefaultExcludeFactory f;

  SECTION("no simplification") {
    auto u = f.any_of({f.group("g"), f.module_id("g", "m")});
    REQUIRE(u.kind() == exclude_kind::any_of);
    REQUIRE(std::get<exclude_any_of>(u.node).components.size() == 2);

    auto i = f.all_of({f.group("g1"), f.group("g2")});
    REQUIRE(i.kind() == exclude_kind::all_of);
    REQUIRE(std::get<exclude_all_of>(i.node).components.size() == 2);
  }

  SECTION("operand order is preserved") {
    auto u = f.any_of({f.group("b"), f.group("a")});
    const auto& c = std::get<exclude_any_of>(u.node).components;
    REQUIRE(c[0] == f.group("b"));
    REQUIRE(c[1] == f.group("a"));
  }

  SECTION("duplicate operands are dropped") {
    auto u = f.any_of({f.group("a"), f.group("a"), f.group("b")});
    REQUIRE(std::get<exclude_any_of>(u.node).components.size() == 2);
  }

  SECTION("degenerate composites are allowed") {
    auto empty = f.any_of(std::span<const exclude_spec>{});
    REQUIRE(empty.kind() == exclude_kind::any_of);
    REQUIRE(std::get<exclude_any_of>(empty.node).components.empty());

    auto single = f.all_of({f.group("a")});
    REQUIRE(single.kind() == exclude_kind::all_of);
  }

  SECTION("singletons and leaves") {
    REQUIRE(f.everything().is_everything());
    REQUIRE(f.nothing().is_nothing());

    const auto art = f.artifact("g", "m", artifact_name{"lib", "jar", "jar", std::nullopt});
    const auto& leaf = std::get<module_exclude>(art.node);
    REQUIRE(leaf.group == "g");
    REQUIRE(leaf.module == "m");
    REQUIRE(leaf.artifact->name == "lib");

    const auto core = f.module("core");
    const auto& mod = std::get<module_exclude>(core.node);
    REQUIRE_FALSE(mod.group.has_value());
    REQUIRE(mod.module == "core");
  }

  SECTION("spans over vectors") {
    std::vector<exclude_spec> specs{f.group("a"), f.group("b"), f.group("c")};
    REQUIRE(std::get<exclude_all_of>(f.all_of(specs).node).components.size() == 3);
  }
}
