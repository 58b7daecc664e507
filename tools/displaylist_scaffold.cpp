#include <displaylist/core/Error.hpp>
#include <displaylist/registry/ElementTypeRegistry.hpp>
#include <displaylist/registry/ListScaffold.hpp>

#include "cli/ToolCli.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct ScaffoldOptions {
    std::optional<std::filesystem::path> manifest;
    std::optional<std::filesystem::path> outputDirectory;
    DL::Scaffold::ScaffoldRequest        request;
    bool                                 listTypes = false;
};

void print_usage() {
    std::cout << "Usage: displaylist_scaffold --manifest <file> [options]\n"
                 "Generates a DL::DisplayList subclass for a registered display element.\n"
                 "Options:\n"
                 "  --manifest <file>     JSON manifest: display, data and header per type (required)\n"
                 "  --list                Print the registered display element types and exit\n"
                 "  --class <Name>        Name of the generated list class\n"
                 "  --display <type>      Display element type to list\n"
                 "  --data <index>        Data type index, required when the element binds several\n"
                 "  --namespace <ns>      Namespace for the generated class\n"
                 "  --output <dir>        Write <Name>.hpp into dir instead of printing to stdout\n"
                 "  --help                Show this message\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<ScaffoldOptions> {
    using DL::Tools::ToolCli;
    ScaffoldOptions options;

    ToolCli cli;
    cli.set_program_name("displaylist_scaffold");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });

    auto required = [](std::string_view name, auto&& assign) {
        ToolCli::ValueOption option{};
        option.on_value = [name = std::string{name}, assign](std::optional<std::string_view> value)
            -> ToolCli::ParseError {
            if (!value || value->empty()) {
                return name + " requires a value";
            }
            assign(*value);
            return std::nullopt;
        };
        return option;
    };

    cli.add_value("--manifest", required("--manifest", [&](std::string_view value) {
                      options.manifest = std::filesystem::path(std::string{value});
                  }));
    cli.add_value("--output", required("--output", [&](std::string_view value) {
                      options.outputDirectory = std::filesystem::path(std::string{value});
                  }));
    cli.add_value("--class", required("--class", [&](std::string_view value) {
                      options.request.class_name.assign(value.begin(), value.end());
                  }));
    cli.add_value("--display", required("--display", [&](std::string_view value) {
                      options.request.display_type.assign(value.begin(), value.end());
                  }));
    cli.add_value("--namespace", required("--namespace", [&](std::string_view value) {
                      options.request.name_space.assign(value.begin(), value.end());
                  }));
    cli.add_size("--data", {.on_value = [&](std::size_t index) { options.request.data_index = index; }});
    cli.add_flag("--list", {.on_set = [&] { options.listTypes = true; }});

    auto helpHandler = [] {
        print_usage();
        std::exit(EXIT_SUCCESS);
    };
    cli.add_flag("--help", {.on_set = helpHandler});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    if (!options.manifest) {
        std::cerr << "displaylist_scaffold: --manifest is required\n";
        return std::nullopt;
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto cliOptions = parse_cli(argc, argv);
    if (!cliOptions) {
        print_usage();
        return EXIT_FAILURE;
    }

    auto registry = DL::LoadRegistryManifestFile(*cliOptions->manifest);
    if (!registry) {
        std::cerr << "Failed to load manifest: " << DL::describeError(registry.error()) << std::endl;
        return EXIT_FAILURE;
    }

    if (cliOptions->listTypes) {
        std::cout << registry->summary() << std::endl;
        return EXIT_SUCCESS;
    }

    auto plan = DL::Scaffold::Validate(cliOptions->request, *registry);
    if (!plan) {
        std::cerr << "Cannot scaffold list: " << DL::describeError(plan.error()) << std::endl;
        return EXIT_FAILURE;
    }

    if (!cliOptions->outputDirectory) {
        std::cout << DL::Scaffold::GenerateListHeader(*plan);
        return EXIT_SUCCESS;
    }

    auto written = DL::Scaffold::WriteListHeader(*plan, *cliOptions->outputDirectory);
    if (!written) {
        std::cerr << "Failed to write list header: " << DL::describeError(written.error()) << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "Wrote " << written->string() << std::endl;
    return EXIT_SUCCESS;
}
