#include <displaylist/host/MemorySceneHost.hpp>

#include <algorithm>

namespace DL {

auto MemorySceneHost::create_root(std::string name) -> ElementHandle {
    auto const handle = next_handle_++;
    MemoryNode root{};
    root.handle = handle;
    root.name   = std::move(name);
    nodes_.emplace(handle, std::move(root));
    return handle;
}

auto MemorySceneHost::register_prefab(PrefabHandle prefab, std::string name) -> void {
    prefabs_[prefab] = std::move(name);
}

auto MemorySceneHost::missing(ElementHandle element) const -> Error {
    return Error{Error::Code::NotFound, "no scene node with handle " + std::to_string(element)};
}

auto MemorySceneHost::create_child(ElementHandle parent, PrefabHandle prefab, SpawnOptions const& options)
    -> Expected<ElementHandle> {
    auto parent_it = nodes_.find(parent);
    if (parent_it == nodes_.end()) {
        return std::unexpected(missing(parent));
    }

    std::string prefab_name = "prefab#" + std::to_string(prefab);
    if (!prefabs_.empty()) {
        auto const found = prefabs_.find(prefab);
        if (found == prefabs_.end()) {
            return std::unexpected(Error{Error::Code::NotFound, "unknown prefab " + std::to_string(prefab)});
        }
        prefab_name = found->second;
    }

    auto const handle = next_handle_++;
    MemoryNode child{};
    child.handle          = handle;
    child.parent          = parent;
    child.prefab          = prefab;
    child.name            = prefab_name + "(" + std::to_string(handle) + ")";
    child.transform_reset = options.reset_transform;
    child.size            = options.size;

    parent_it->second.children.push_back(handle);
    nodes_.emplace(handle, std::move(child));
    ++created_count_;
    return handle;
}

auto MemorySceneHost::destroy_subtree(ElementHandle element) -> void {
    auto it = nodes_.find(element);
    if (it == nodes_.end()) {
        return;
    }
    auto const children = it->second.children;
    for (auto child : children) {
        destroy_subtree(child);
    }
    nodes_.erase(element);
    ++destroyed_count_;
}

auto MemorySceneHost::destroy(ElementHandle element) -> Expected<void> {
    auto it = nodes_.find(element);
    if (it == nodes_.end()) {
        return std::unexpected(missing(element));
    }
    auto const parent = it->second.parent;
    if (auto parent_it = nodes_.find(parent); parent_it != nodes_.end()) {
        auto& siblings = parent_it->second.children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), element), siblings.end());
    }
    destroy_subtree(element);
    return {};
}

auto MemorySceneHost::set_active(ElementHandle element, bool active) -> Expected<void> {
    auto it = nodes_.find(element);
    if (it == nodes_.end()) {
        return std::unexpected(missing(element));
    }
    it->second.active = active;
    return {};
}

auto MemorySceneHost::set_sibling_order(ElementHandle element, std::size_t position) -> Expected<void> {
    auto it = nodes_.find(element);
    if (it == nodes_.end()) {
        return std::unexpected(missing(element));
    }
    auto parent_it = nodes_.find(it->second.parent);
    if (parent_it == nodes_.end()) {
        return std::unexpected(Error{Error::Code::InvalidState, "root nodes have no sibling order"});
    }
    auto& siblings = parent_it->second.children;
    auto  current  = std::find(siblings.begin(), siblings.end(), element);
    if (current == siblings.end()) {
        return std::unexpected(Error{Error::Code::InvalidState, "node missing from its parent's children"});
    }
    siblings.erase(current);
    auto const clamped = std::min(position, siblings.size());
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(clamped), element);
    return {};
}

auto MemorySceneHost::node(ElementHandle element) const -> MemoryNode const* {
    auto it = nodes_.find(element);
    if (it == nodes_.end()) {
        return nullptr;
    }
    return &it->second;
}

auto MemorySceneHost::contains(ElementHandle element) const -> bool {
    return nodes_.find(element) != nodes_.end();
}

auto MemorySceneHost::is_active(ElementHandle element) const -> bool {
    auto const* found = node(element);
    return found != nullptr && found->active;
}

auto MemorySceneHost::children(ElementHandle parent) const -> std::vector<ElementHandle> {
    auto const* found = node(parent);
    if (found == nullptr) {
        return {};
    }
    return found->children;
}

auto MemorySceneHost::sibling_index(ElementHandle element) const -> std::optional<std::size_t> {
    auto const* found = node(element);
    if (found == nullptr) {
        return std::nullopt;
    }
    auto const* parent = node(found->parent);
    if (parent == nullptr) {
        return std::nullopt;
    }
    auto it = std::find(parent->children.begin(), parent->children.end(), element);
    if (it == parent->children.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - parent->children.begin());
}

auto MemorySceneHost::name(ElementHandle element) const -> std::string {
    auto const* found = node(element);
    if (found == nullptr) {
        return {};
    }
    return found->name;
}

} // namespace DL
