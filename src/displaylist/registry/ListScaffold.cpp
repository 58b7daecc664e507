#include <displaylist/registry/ListScaffold.hpp>

#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace DL::Scaffold {
namespace {

[[nodiscard]] auto invalid(std::string message) -> Error {
    return Error{Error::Code::InvalidArgument, std::move(message)};
}

} // namespace

auto IsValidIdentifier(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    auto const first = static_cast<unsigned char>(text.front());
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    for (char ch : text) {
        auto const c = static_cast<unsigned char>(ch);
        if (!(std::isalnum(c) || c == '_')) {
            return false;
        }
    }
    return true;
}

auto IsValidQualifiedName(std::string_view text) -> bool {
    if (text.starts_with("::")) {
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return false;
    }
    while (true) {
        auto const separator = text.find("::");
        if (!IsValidIdentifier(text.substr(0, separator))) {
            return false;
        }
        if (separator == std::string_view::npos) {
            return true;
        }
        text.remove_prefix(separator + 2);
    }
}

auto Validate(ScaffoldRequest const& request, ElementTypeRegistry const& registry) -> Expected<ScaffoldPlan> {
    if (!IsValidIdentifier(request.class_name)) {
        return std::unexpected(invalid("class name '" + request.class_name + "' is not a C++ identifier"));
    }
    if (!request.name_space.empty() && !IsValidQualifiedName(request.name_space)) {
        return std::unexpected(invalid("namespace '" + request.name_space + "' is not a C++ namespace name"));
    }
    if (request.display_type.empty()) {
        return std::unexpected(invalid("no display element selected"));
    }
    auto const* type = registry.find(request.display_type);
    if (type == nullptr) {
        return std::unexpected(Error{Error::Code::NotFound,
                                     "display element '" + request.display_type + "' is not registered"});
    }

    if (!IsValidQualifiedName(type->display_type)) {
        return std::unexpected(invalid("display type '" + type->display_type + "' is not a C++ type name"));
    }
    if (type->header.empty()) {
        return std::unexpected(invalid("display element '" + type->display_type + "' has no header to include"));
    }
    if (type->header.find_first_of("\"\n") != std::string::npos) {
        return std::unexpected(invalid("header '" + type->header + "' cannot be written as an include"));
    }

    std::size_t data_index = 0;
    if (request.data_index) {
        data_index = *request.data_index;
    } else if (type->data_types.size() > 1) {
        return std::unexpected(invalid(ElementTypeRegistry::describe(*type)
                                       + " binds several data types; select one"));
    }
    if (data_index >= type->data_types.size()) {
        return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                     "data type index " + std::to_string(data_index) + " outside [0, "
                                         + std::to_string(type->data_types.size()) + ")"});
    }

    auto const& data_type = type->data_types[data_index];
    if (!IsValidQualifiedName(data_type)) {
        return std::unexpected(invalid("data type '" + data_type + "' is not a C++ type name"));
    }

    return ScaffoldPlan{.class_name   = request.class_name,
                        .display_type = type->display_type,
                        .data_type    = data_type,
                        .name_space   = request.name_space,
                        .header       = type->header};
}

auto GenerateListHeader(ScaffoldPlan const& plan) -> std::string {
    std::ostringstream oss;
    oss << "#pragma once\n\n";
    oss << "#include <displaylist/list/DisplayList.hpp>\n";
    if (!plan.header.empty()) {
        oss << "#include \"" << plan.header << "\"\n";
    }
    oss << "\n";
    if (!plan.name_space.empty()) {
        oss << "namespace " << plan.name_space << " {\n\n";
    }
    oss << "class " << plan.class_name << " : public DL::DisplayList<" << plan.display_type << ", "
        << plan.data_type << "> {\n";
    oss << "public:\n";
    oss << "    using DL::DisplayList<" << plan.display_type << ", " << plan.data_type
        << ">::DisplayList;\n";
    oss << "};\n";
    if (!plan.name_space.empty()) {
        oss << "\n} // namespace " << plan.name_space << "\n";
    }
    return oss.str();
}

auto WriteListHeader(ScaffoldPlan const& plan, std::filesystem::path const& directory)
    -> Expected<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoFailure,
                                     "failed to create '" + directory.string() + "': " + ec.message()});
    }
    auto const destination = directory / (plan.class_name + ".hpp");
    if (std::filesystem::exists(destination, ec)) {
        return std::unexpected(Error{Error::Code::IoFailure, "'" + destination.string() + "' already exists"});
    }
    std::ofstream stream(destination, std::ios::binary);
    if (!stream.is_open()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to open '" + destination.string() + "'"});
    }
    stream << GenerateListHeader(plan);
    if (!stream.good()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to write '" + destination.string() + "'"});
    }
    return destination;
}

} // namespace DL::Scaffold
