#include <doctest/doctest.h>

#include <displaylist/registry/ListScaffold.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace DL;
using namespace DL::Scaffold;

namespace {

auto make_registry() -> ElementTypeRegistry {
    ElementTypeRegistry registry;
    REQUIRE(registry.register_type("Game::ItemView", {"Game::Item"}, "game/ItemView.hpp").has_value());
    REQUIRE(registry.register_type("Game::FeedView", {"Game::Post", "Game::Ad"}, "game/FeedView.hpp").has_value());
    return registry;
}

} // namespace

TEST_SUITE("ListScaffold") {
    TEST_CASE("identifier_validation") {
        CHECK(IsValidIdentifier("ItemList"));
        CHECK(IsValidIdentifier("_list2"));
        CHECK_FALSE(IsValidIdentifier(""));
        CHECK_FALSE(IsValidIdentifier("2list"));
        CHECK_FALSE(IsValidIdentifier("item-list"));
        CHECK(IsValidQualifiedName("Game::UI"));
        CHECK(IsValidQualifiedName("::Game"));
        CHECK_FALSE(IsValidQualifiedName("Game::"));
        CHECK_FALSE(IsValidQualifiedName("Game:::UI"));
    }

    TEST_CASE("single_data_type_needs_no_index") {
        auto registry = make_registry();
        auto plan     = Validate(ScaffoldRequest{.class_name = "ItemList", .display_type = "Game::ItemView"}, registry);
        REQUIRE(plan.has_value());
        CHECK(plan->data_type == "Game::Item");
        CHECK(plan->header == "game/ItemView.hpp");
    }

    TEST_CASE("ambiguous_data_type_requires_selection") {
        auto registry = make_registry();
        ScaffoldRequest request{.class_name = "FeedList", .display_type = "Game::FeedView"};
        CHECK(Validate(request, registry).error().code == Error::Code::InvalidArgument);
        request.data_index = 1;
        auto plan          = Validate(request, registry);
        REQUIRE(plan.has_value());
        CHECK(plan->data_type == "Game::Ad");
        request.data_index = 2;
        CHECK(Validate(request, registry).error().code == Error::Code::IndexOutOfRange);
    }

    TEST_CASE("rejects_bad_requests") {
        auto registry = make_registry();
        CHECK(Validate({.class_name = "bad name", .display_type = "Game::ItemView"}, registry).error().code
              == Error::Code::InvalidArgument);
        CHECK(Validate({.class_name = "List", .display_type = ""}, registry).error().code
              == Error::Code::InvalidArgument);
        CHECK(Validate({.class_name = "List", .display_type = "Game::Nope"}, registry).error().code
              == Error::Code::NotFound);
        CHECK(Validate({.class_name = "List", .display_type = "Game::ItemView", .name_space = "a b"}, registry)
                  .error()
                  .code
              == Error::Code::InvalidArgument);
    }

    TEST_CASE("rejects_entries_that_cannot_be_emitted") {
        auto registry = LoadRegistryManifest(R"({"types": [
            {"display": "Bad Type", "data": ["Item"], "header": "bad.hpp"},
            {"display": "Game::RowView", "data": ["Game::Row", "not a type"], "header": "game/RowView.hpp"},
            {"display": "Game::NoHeader", "data": ["Game::Item"]},
            {"display": "Game::Quoted", "data": ["Game::Item"], "header": "a\"b.hpp"}
        ]})");
        REQUIRE(registry.has_value());

        CHECK(Validate({.class_name = "List", .display_type = "Bad Type"}, *registry).error().code
              == Error::Code::InvalidArgument);
        CHECK(Validate({.class_name = "List", .display_type = "Game::RowView", .data_index = 1}, *registry)
                  .error()
                  .code
              == Error::Code::InvalidArgument);
        CHECK(Validate({.class_name = "List", .display_type = "Game::RowView", .data_index = 0}, *registry)
                  .has_value());
        CHECK(Validate({.class_name = "List", .display_type = "Game::NoHeader"}, *registry).error().code
              == Error::Code::InvalidArgument);
        CHECK(Validate({.class_name = "List", .display_type = "Game::Quoted"}, *registry).error().code
              == Error::Code::InvalidArgument);
    }

    TEST_CASE("generated_header_declares_the_list") {
        ScaffoldPlan plan{.class_name   = "ItemList",
                          .display_type = "Game::ItemView",
                          .data_type    = "Game::Item",
                          .name_space   = "Game::UI",
                          .header       = "game/ItemView.hpp"};
        auto const header = GenerateListHeader(plan);
        CHECK(header.starts_with("#pragma once\n"));
        CHECK(header.find("#include <displaylist/list/DisplayList.hpp>") != std::string::npos);
        CHECK(header.find("#include \"game/ItemView.hpp\"") != std::string::npos);
        CHECK(header.find("#include \"game/ItemView.hpp\"") < header.find("class ItemList"));
        CHECK(header.find("namespace Game::UI {") != std::string::npos);
        CHECK(header.find("class ItemList : public DL::DisplayList<Game::ItemView, Game::Item> {")
              != std::string::npos);
        CHECK(header.find("using DL::DisplayList<Game::ItemView, Game::Item>::DisplayList;") != std::string::npos);

        plan.name_space.clear();
        CHECK(GenerateListHeader(plan).find("namespace") == std::string::npos);
    }

    TEST_CASE("write_never_overwrites") {
        auto directory = std::filesystem::temp_directory_path() / "displaylist_scaffold_test";
        std::filesystem::remove_all(directory);
        ScaffoldPlan plan{
            .class_name = "ItemList", .display_type = "ItemView", .data_type = "Item", .header = "ItemView.hpp"};

        auto written = WriteListHeader(plan, directory);
        REQUIRE(written.has_value());
        CHECK(*written == directory / "ItemList.hpp");
        std::ifstream     in(*written);
        std::stringstream contents;
        contents << in.rdbuf();
        CHECK(contents.str() == GenerateListHeader(plan));

        auto again = WriteListHeader(plan, directory);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::IoFailure);
        std::filesystem::remove_all(directory);
    }
}
