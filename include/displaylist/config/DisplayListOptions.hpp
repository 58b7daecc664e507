#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/host/SceneHost.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace DL {

// How a typed list spawns its views. The default size of {0, 0} matches a
// freshly stretched element; set size to nullopt to keep the prefab's own size.
struct DisplayListOptions {
    PrefabHandle          prefab          = 0;
    bool                  reset_transform = true;
    std::optional<Size2D> size            = Size2D{};
    std::string           debug_name;

    [[nodiscard]] auto spawn_options() const -> SpawnOptions {
        return SpawnOptions{.reset_transform = reset_transform, .size = size};
    }
};

auto LoadDisplayListOptions(std::string const& payload) -> Expected<DisplayListOptions>;

auto LoadDisplayListOptionsFile(std::filesystem::path const& path) -> Expected<DisplayListOptions>;

auto SerializeDisplayListOptions(DisplayListOptions const& options, int indent = 2) -> std::string;

} // namespace DL
