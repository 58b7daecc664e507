#pragma once

#include <displaylist/host/SceneHost.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace DL {

struct MemoryNode {
    ElementHandle              handle = kNullElement;
    ElementHandle              parent = kNullElement;
    PrefabHandle               prefab = 0;
    std::string                name;
    bool                       active          = true;
    bool                       transform_reset = false;
    std::optional<Size2D>      size{};
    std::vector<ElementHandle> children{};
};

// Bookkeeping-only SceneHost: keeps the node tree, sibling order and active
// flags the way an engine would, without rendering anything.
class MemorySceneHost final : public SceneHost {
public:
    MemorySceneHost() = default;

    auto create_root(std::string name) -> ElementHandle;

    // Once any prefab is registered, create_child rejects unregistered ones.
    auto register_prefab(PrefabHandle prefab, std::string name) -> void;

    auto create_child(ElementHandle parent, PrefabHandle prefab, SpawnOptions const& options)
        -> Expected<ElementHandle> override;
    auto destroy(ElementHandle element) -> Expected<void> override;
    auto set_active(ElementHandle element, bool active) -> Expected<void> override;
    auto set_sibling_order(ElementHandle element, std::size_t position) -> Expected<void> override;

    [[nodiscard]] auto node(ElementHandle element) const -> MemoryNode const*;
    [[nodiscard]] auto contains(ElementHandle element) const -> bool;
    [[nodiscard]] auto is_active(ElementHandle element) const -> bool;
    [[nodiscard]] auto children(ElementHandle parent) const -> std::vector<ElementHandle>;
    [[nodiscard]] auto sibling_index(ElementHandle element) const -> std::optional<std::size_t>;
    [[nodiscard]] auto name(ElementHandle element) const -> std::string;

    [[nodiscard]] auto created_count() const -> std::size_t {
        return created_count_;
    }
    [[nodiscard]] auto destroyed_count() const -> std::size_t {
        return destroyed_count_;
    }
    [[nodiscard]] auto live_count() const -> std::size_t {
        return nodes_.size();
    }

private:
    [[nodiscard]] auto missing(ElementHandle element) const -> Error;
    auto               destroy_subtree(ElementHandle element) -> void;

    phmap::flat_hash_map<ElementHandle, MemoryNode>  nodes_{};
    phmap::flat_hash_map<PrefabHandle, std::string>  prefabs_{};
    ElementHandle                                    next_handle_     = 1;
    std::size_t                                      created_count_   = 0;
    std::size_t                                      destroyed_count_ = 0;
};

} // namespace DL
