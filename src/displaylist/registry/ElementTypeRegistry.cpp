#include <displaylist/registry/ElementTypeRegistry.hpp>

#include <displaylist/log/TaggedLogger.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace DL {

auto ElementTypeRegistry::register_type(std::string display_type,
                                        std::vector<std::string> data_types,
                                        std::string header) -> Expected<void> {
    if (display_type.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "display type name must not be empty"});
    }
    if (data_types.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArgument,
                                     "display type '" + display_type + "' binds no data types"});
    }
    if (std::any_of(data_types.begin(), data_types.end(), [](auto const& name) { return name.empty(); })) {
        return std::unexpected(Error{Error::Code::InvalidArgument,
                                     "display type '" + display_type + "' has an empty data type name"});
    }

    auto found = index_.find(display_type);
    if (found == index_.end()) {
        std::vector<std::string> unique;
        for (auto& name : data_types) {
            if (std::find(unique.begin(), unique.end(), name) == unique.end()) {
                unique.push_back(std::move(name));
            }
        }
        index_.emplace(display_type, types_.size());
        dl_log("Registered display element " + display_type, "Registry");
        types_.push_back(DisplayElementType{.display_type = std::move(display_type),
                                            .data_types   = std::move(unique),
                                            .header       = std::move(header)});
        return {};
    }

    auto& type = types_[found->second];
    if (type.header.empty()) {
        type.header = std::move(header);
    }
    auto& existing = type.data_types;
    for (auto& name : data_types) {
        if (std::find(existing.begin(), existing.end(), name) == existing.end()) {
            existing.push_back(std::move(name));
        }
    }
    return {};
}

auto ElementTypeRegistry::find(std::string_view display_type) const -> DisplayElementType const* {
    auto found = index_.find(std::string{display_type});
    if (found == index_.end()) {
        return nullptr;
    }
    return &types_[found->second];
}

auto ElementTypeRegistry::describe(DisplayElementType const& type) -> std::string {
    std::string text = type.display_type + " (";
    for (std::size_t index = 0; index < type.data_types.size(); ++index) {
        if (index > 0) {
            text += ", ";
        }
        text += type.data_types[index];
    }
    text += ")";
    return text;
}

auto ElementTypeRegistry::summary() const -> std::string {
    std::ostringstream oss;
    oss << "Found " << types_.size() << " display element types:";
    for (auto const& type : types_) {
        oss << '\n' << describe(type);
    }
    return oss.str();
}

auto LoadRegistryManifest(std::string const& payload) -> Expected<ElementTypeRegistry> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid registry manifest JSON"});
    }
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "registry manifest must be an object"});
    }
    auto types = json.find("types");
    if (types == json.end() || !types->is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "registry manifest requires a types array"});
    }

    ElementTypeRegistry registry;
    for (auto const& entry : *types) {
        if (!entry.is_object()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "registry entries must be objects"});
        }
        auto display = entry.find("display");
        auto data    = entry.find("data");
        if (display == entry.end() || !display->is_string()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "registry entry requires a display string"});
        }
        if (data == entry.end() || !data->is_array()) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "registry entry '" + display->get<std::string>()
                                             + "' requires a data array"});
        }
        std::vector<std::string> data_types;
        data_types.reserve(data->size());
        for (auto const& name : *data) {
            if (!name.is_string()) {
                return std::unexpected(Error{Error::Code::MalformedInput, "registry data types must be strings"});
            }
            data_types.push_back(name.get<std::string>());
        }
        std::string header;
        if (auto it = entry.find("header"); it != entry.end()) {
            if (!it->is_string()) {
                return std::unexpected(Error{Error::Code::MalformedInput, "registry header must be a string"});
            }
            header = it->get<std::string>();
        }
        if (auto registered =
                registry.register_type(display->get<std::string>(), std::move(data_types), std::move(header));
            !registered) {
            return std::unexpected(Error{Error::Code::MalformedInput, describeError(registered.error())});
        }
    }
    return registry;
}

auto LoadRegistryManifestFile(std::filesystem::path const& path) -> Expected<ElementTypeRegistry> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to open '" + path.string() + "'"});
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return LoadRegistryManifest(buffer.str());
}

} // namespace DL
