#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/registry/ElementTypeRegistry.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace DL::Scaffold {

struct ScaffoldRequest {
    std::string                class_name;
    std::string                display_type;
    // Required when the display type binds more than one data type.
    std::optional<std::size_t> data_index;
    std::string                name_space;
};

struct ScaffoldPlan {
    std::string class_name;
    std::string display_type;
    std::string data_type;
    std::string name_space;
    // Included by the generated header; declares display_type and data_type.
    std::string header;
};

[[nodiscard]] auto IsValidIdentifier(std::string_view text) -> bool;

// Accepts "Name" and "Outer::Inner::Name"; a leading "::" is allowed.
[[nodiscard]] auto IsValidQualifiedName(std::string_view text) -> bool;

// The selected display element must have a header and C++ type names, so the
// generated list compiles on its own.
auto Validate(ScaffoldRequest const& request, ElementTypeRegistry const& registry) -> Expected<ScaffoldPlan>;

[[nodiscard]] auto GenerateListHeader(ScaffoldPlan const& plan) -> std::string;

// Writes <directory>/<class_name>.hpp and returns its path. Never overwrites.
auto WriteListHeader(ScaffoldPlan const& plan, std::filesystem::path const& directory)
    -> Expected<std::filesystem::path>;

} // namespace DL::Scaffold
