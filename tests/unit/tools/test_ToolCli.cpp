#include <doctest/doctest.h>

#include "cli/ToolCli.hpp"

#include <optional>
#include <string>
#include <vector>

using DL::Tools::ToolCli;

namespace {

struct Argv {
    explicit Argv(std::vector<std::string> args)
        : storage(std::move(args)) {
        storage.insert(storage.begin(), "displaylist_scaffold");
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
    }

    [[nodiscard]] auto argc() const -> int {
        return static_cast<int>(pointers.size());
    }
    auto argv() -> char** {
        return pointers.data();
    }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

} // namespace

TEST_SUITE("ToolCli") {
    TEST_CASE("parses_flags_values_and_sizes") {
        ToolCli                  cli;
        bool                     listed = false;
        std::string              manifest;
        std::optional<std::size_t> index;
        cli.add_flag("--list", {.on_set = [&] { listed = true; }});
        cli.add_value("--manifest", {.on_value = [&](std::optional<std::string_view> value) -> ToolCli::ParseError {
                          manifest.assign(value->begin(), value->end());
                          return std::nullopt;
                      }});
        cli.add_size("--data", {.on_value = [&](std::size_t value) { index = value; }});

        Argv args({"--list", "--manifest", "types.json", "--data=2"});
        CHECK(cli.parse(args.argc(), args.argv()));
        CHECK(listed);
        CHECK(manifest == "types.json");
        CHECK(index == 2u);
    }

    TEST_CASE("reports_unknown_and_invalid_arguments") {
        ToolCli                  cli;
        std::vector<std::string> errors;
        cli.set_program_name("scaffold");
        cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
        cli.add_size("--data", {.on_value = [](std::size_t) {}});
        cli.add_flag("--list", {});

        Argv args({"--bogus", "--data", "two", "--list=yes"});
        CHECK_FALSE(cli.parse(args.argc(), args.argv()));
        CHECK(cli.had_errors());
        REQUIRE(errors.size() == 3);
        CHECK(errors[0] == "scaffold: unknown argument '--bogus'");
        CHECK(errors[1] == "scaffold: --data must be a non-negative integer");
        CHECK(errors[2] == "scaffold: --list does not take a value");
    }

    TEST_CASE("missing_value_is_an_error") {
        ToolCli                  cli;
        std::vector<std::string> errors;
        cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
        cli.add_value("--output", {.on_value = [](std::optional<std::string_view>) -> ToolCli::ParseError {
                          return std::nullopt;
                      }});
        cli.add_flag("--list", {});

        Argv args({"--output", "--list"});
        CHECK_FALSE(cli.parse(args.argc(), args.argv()));
        REQUIRE(errors.size() == 1);
        CHECK(errors[0] == "displaylist: --output requires a value");
    }

    TEST_CASE("aliases_resolve_to_their_target") {
        ToolCli cli;
        int     hits = 0;
        cli.add_flag("--help", {.on_set = [&] { ++hits; }});
        cli.add_alias("-h", "--help");

        Argv args({"-h", "--help"});
        CHECK(cli.parse(args.argc(), args.argv()));
        CHECK(hits == 2);
    }

    TEST_CASE("custom_unknown_handler_can_accept_tokens") {
        ToolCli                  cli;
        std::vector<std::string> positional;
        cli.set_unknown_argument_handler([&](std::string_view token) {
            positional.emplace_back(token);
            return true;
        });
        Argv args({"ItemList", "extra"});
        CHECK(cli.parse(args.argc(), args.argv()));
        CHECK(positional == std::vector<std::string>{"ItemList", "extra"});
    }
}
