#pragma once

#include <displaylist/core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace DL {

using ElementHandle = std::uint64_t;
using PrefabHandle  = std::uint64_t;

inline constexpr ElementHandle kNullElement = 0;

// Passed to set_sibling_order to move an element behind all of its siblings.
inline constexpr std::size_t kLastSibling = std::numeric_limits<std::size_t>::max();

struct Size2D {
    float width  = 0.0f;
    float height = 0.0f;

    auto operator==(Size2D const&) const -> bool = default;
};

struct SpawnOptions {
    bool                  reset_transform = true;
    std::optional<Size2D> size{};
};

/**
 * SceneHost is the boundary to the engine's retained-mode scene graph. Lists
 * only ever instantiate, destroy, toggle and reorder children of their root
 * through these four calls; placement and rendering stay with the engine.
 *
 * set_sibling_order positions are clamped to the last sibling, so kLastSibling
 * always means "move to the end".
 */
class SceneHost {
public:
    virtual ~SceneHost() = default;

    virtual auto create_child(ElementHandle parent, PrefabHandle prefab, SpawnOptions const& options)
        -> Expected<ElementHandle> = 0;
    virtual auto destroy(ElementHandle element) -> Expected<void> = 0;
    virtual auto set_active(ElementHandle element, bool active) -> Expected<void> = 0;
    virtual auto set_sibling_order(ElementHandle element, std::size_t position) -> Expected<void> = 0;
};

} // namespace DL
