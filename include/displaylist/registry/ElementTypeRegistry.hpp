#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/list/ViewElement.hpp>

#include <parallel_hashmap/phmap.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace DL {

// One view type and every record type it can bind, by fully qualified name.
// header is the include that declares the view and its record types.
struct DisplayElementType {
    std::string              display_type;
    std::vector<std::string> data_types;
    std::string              header;
};

/**
 * ElementTypeRegistry lists the view types a project offers to tooling. C++
 * has no runtime type discovery, so view types register themselves at process
 * start (or are loaded from a JSON manifest) instead of being scanned.
 */
class ElementTypeRegistry {
public:
    // Re-registering merges data types; a non-empty header replaces an empty one.
    auto register_type(std::string display_type, std::vector<std::string> data_types, std::string header = {})
        -> Expected<void>;

    // Checks at compile time that V really binds every D it is registered for.
    template <typename V, typename... D>
    auto register_element(std::string display_type,
                          std::array<std::string_view, sizeof...(D)> data_types,
                          std::string header = {}) -> Expected<void> {
        static_assert(sizeof...(D) > 0, "a display element binds at least one data type");
        static_assert((DisplayElement<V, D> && ...), "V must implement populate(D const&) for every D");
        std::vector<std::string> names;
        names.reserve(data_types.size());
        for (auto name : data_types) {
            names.emplace_back(name);
        }
        return register_type(std::move(display_type), std::move(names), std::move(header));
    }

    [[nodiscard]] auto find(std::string_view display_type) const -> DisplayElementType const*;
    [[nodiscard]] auto types() const -> std::vector<DisplayElementType> const& {
        return types_;
    }
    [[nodiscard]] auto size() const -> std::size_t {
        return types_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return types_.empty();
    }

    [[nodiscard]] static auto describe(DisplayElementType const& type) -> std::string;
    [[nodiscard]] auto        summary() const -> std::string;

private:
    std::vector<DisplayElementType>                 types_{};
    phmap::flat_hash_map<std::string, std::size_t>  index_{};
};

// { "types": [ { "display": "Game::ItemView", "data": ["Game::Item"], "header": "game/ItemView.hpp" } ] }
// "header" is optional.
auto LoadRegistryManifest(std::string const& payload) -> Expected<ElementTypeRegistry>;

auto LoadRegistryManifestFile(std::filesystem::path const& path) -> Expected<ElementTypeRegistry>;

} // namespace DL
