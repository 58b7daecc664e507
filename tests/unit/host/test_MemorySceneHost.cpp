#include <doctest/doctest.h>

#include <displaylist/host/MemorySceneHost.hpp>

using namespace DL;

TEST_SUITE("MemorySceneHost") {
    TEST_CASE("create_child_links_parent_and_applies_options") {
        MemorySceneHost host;
        auto const      root  = host.create_root("root");
        auto            child = host.create_child(root, 5, SpawnOptions{.reset_transform = true, .size = Size2D{}});
        REQUIRE(child.has_value());
        auto const* node = host.node(*child);
        REQUIRE(node != nullptr);
        CHECK(node->parent == root);
        CHECK(node->prefab == 5);
        CHECK(node->active);
        CHECK(node->transform_reset);
        CHECK(node->size == Size2D{});
        CHECK(host.children(root) == std::vector<ElementHandle>{*child});
        CHECK(host.name(*child) == "prefab#5(" + std::to_string(*child) + ")");
        CHECK(host.created_count() == 1);
    }

    TEST_CASE("registered_prefabs_gate_creation") {
        MemorySceneHost host;
        host.register_prefab(1, "Row");
        auto const root = host.create_root("root");
        auto       row  = host.create_child(root, 1, SpawnOptions{});
        REQUIRE(row.has_value());
        CHECK(host.name(*row).starts_with("Row("));
        auto unknown = host.create_child(root, 2, SpawnOptions{});
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::NotFound);
    }

    TEST_CASE("unknown_handles_report_not_found") {
        MemorySceneHost host;
        CHECK(host.create_child(42, 0, SpawnOptions{}).error().code == Error::Code::NotFound);
        CHECK(host.destroy(42).error().code == Error::Code::NotFound);
        CHECK(host.set_active(42, true).error().code == Error::Code::NotFound);
        CHECK(host.set_sibling_order(42, 0).error().code == Error::Code::NotFound);
        CHECK_FALSE(host.is_active(42));
        CHECK(host.node(42) == nullptr);
    }

    TEST_CASE("sibling_order_is_clamped") {
        MemorySceneHost host;
        auto const      root = host.create_root("root");
        auto const      a    = *host.create_child(root, 0, SpawnOptions{});
        auto const      b    = *host.create_child(root, 0, SpawnOptions{});
        auto const      c    = *host.create_child(root, 0, SpawnOptions{});

        REQUIRE(host.set_sibling_order(a, kLastSibling).has_value());
        CHECK(host.children(root) == std::vector<ElementHandle>{b, c, a});
        REQUIRE(host.set_sibling_order(a, 0).has_value());
        CHECK(host.children(root) == std::vector<ElementHandle>{a, b, c});
        REQUIRE(host.set_sibling_order(b, 2).has_value());
        CHECK(host.sibling_index(b) == 2u);
        CHECK(host.set_sibling_order(root, 0).error().code == Error::Code::InvalidState);
    }

    TEST_CASE("destroy_removes_subtree") {
        MemorySceneHost host;
        auto const      root       = host.create_root("root");
        auto const      parent     = *host.create_child(root, 0, SpawnOptions{});
        auto const      grandchild = *host.create_child(parent, 0, SpawnOptions{});

        REQUIRE(host.destroy(parent).has_value());
        CHECK_FALSE(host.contains(parent));
        CHECK_FALSE(host.contains(grandchild));
        CHECK(host.children(root).empty());
        CHECK(host.destroyed_count() == 2);
        CHECK(host.live_count() == 1);
    }

    TEST_CASE("set_active_toggles_flag") {
        MemorySceneHost host;
        auto const      root  = host.create_root("root");
        auto const      child = *host.create_child(root, 0, SpawnOptions{});
        REQUIRE(host.set_active(child, false).has_value());
        CHECK_FALSE(host.is_active(child));
        REQUIRE(host.set_active(child, true).has_value());
        CHECK(host.is_active(child));
    }
}
