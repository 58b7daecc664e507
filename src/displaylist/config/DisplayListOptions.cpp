#include <displaylist/config/DisplayListOptions.hpp>

#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace DL {
namespace {

[[nodiscard]] auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

[[nodiscard]] auto size_from_json(nlohmann::json const& json) -> Expected<std::optional<Size2D>> {
    if (json.is_null()) {
        return std::optional<Size2D>{};
    }
    if (!json.is_object()) {
        return std::unexpected(malformed("size must be an object or null"));
    }
    Size2D size{};
    for (auto const& [key, target] : {std::pair{"width", &size.width}, std::pair{"height", &size.height}}) {
        auto it = json.find(key);
        if (it == json.end()) {
            continue;
        }
        if (!it->is_number()) {
            return std::unexpected(malformed(std::string{"size."} + key + " must be a number"));
        }
        *target = it->get<float>();
    }
    return std::optional<Size2D>{size};
}

[[nodiscard]] auto options_from_json(nlohmann::json const& json) -> Expected<DisplayListOptions> {
    if (!json.is_object()) {
        return std::unexpected(malformed("display list options must be an object"));
    }

    DisplayListOptions options;
    if (auto it = json.find("prefab"); it != json.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected(malformed("prefab must be an unsigned integer"));
        }
        options.prefab = it->get<PrefabHandle>();
    }
    if (auto it = json.find("reset_transform"); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(malformed("reset_transform must be a boolean"));
        }
        options.reset_transform = it->get<bool>();
    }
    if (auto it = json.find("size"); it != json.end()) {
        auto size = size_from_json(*it);
        if (!size) {
            return std::unexpected(size.error());
        }
        options.size = *size;
    }
    if (auto it = json.find("debug_name"); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(malformed("debug_name must be a string"));
        }
        options.debug_name = it->get<std::string>();
    }
    return options;
}

} // namespace

auto LoadDisplayListOptions(std::string const& payload) -> Expected<DisplayListOptions> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(malformed("invalid display list options JSON"));
    }
    return options_from_json(json);
}

auto LoadDisplayListOptionsFile(std::filesystem::path const& path) -> Expected<DisplayListOptions> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to open '" + path.string() + "'"});
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return LoadDisplayListOptions(buffer.str());
}

auto SerializeDisplayListOptions(DisplayListOptions const& options, int indent) -> std::string {
    nlohmann::json json{
        {"prefab", options.prefab},
        {"reset_transform", options.reset_transform},
        {"debug_name", options.debug_name},
    };
    if (options.size) {
        json["size"] = nlohmann::json{{"width", options.size->width}, {"height", options.size->height}};
    } else {
        json["size"] = nullptr;
    }
    return json.dump(indent);
}

} // namespace DL
