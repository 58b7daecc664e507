#include <doctest/doctest.h>

#include "../DisplayListTestHelper.hpp"

#include <displaylist/registry/ElementTypeRegistry.hpp>

using namespace DL;

namespace {

struct Badge {
    std::string text;
};

class BadgeRowView : public ViewElement {
public:
    using ViewElement::ViewElement;

    auto populate(Testing::Row const&) -> Expected<void> {
        return {};
    }
    auto populate(Badge const&) -> Expected<void> {
        return {};
    }
};

} // namespace

TEST_SUITE("ElementTypeRegistry") {
    TEST_CASE("register_and_describe") {
        ElementTypeRegistry registry;
        REQUIRE(registry.register_type("Game::ItemView", {"Game::Item", "Game::Loot"}).has_value());
        auto const* type = registry.find("Game::ItemView");
        REQUIRE(type != nullptr);
        CHECK(ElementTypeRegistry::describe(*type) == "Game::ItemView (Game::Item, Game::Loot)");
        CHECK(registry.find("Game::Missing") == nullptr);
    }

    TEST_CASE("reregistering_merges_data_types") {
        ElementTypeRegistry registry;
        REQUIRE(registry.register_type("View", {"A", "A", "B"}).has_value());
        REQUIRE(registry.register_type("View", {"B", "C"}).has_value());
        CHECK(registry.size() == 1);
        CHECK(registry.find("View")->data_types == std::vector<std::string>{"A", "B", "C"});
    }

    TEST_CASE("rejects_incomplete_registrations") {
        ElementTypeRegistry registry;
        CHECK(registry.register_type("", {"A"}).error().code == Error::Code::InvalidArgument);
        CHECK(registry.register_type("View", {}).error().code == Error::Code::InvalidArgument);
        CHECK(registry.register_type("View", {"A", ""}).error().code == Error::Code::InvalidArgument);
        CHECK(registry.empty());
    }

    TEST_CASE("register_element_checks_bindings") {
        ElementTypeRegistry registry;
        auto status = registry.register_element<BadgeRowView, Testing::Row, Badge>(
            "BadgeRowView", {"DL::Testing::Row", "Badge"});
        REQUIRE(status.has_value());
        CHECK(registry.find("BadgeRowView")->data_types.size() == 2);
    }

    TEST_CASE("summary_lists_types_in_registration_order") {
        ElementTypeRegistry registry;
        REQUIRE(registry.register_type("B", {"Y"}).has_value());
        REQUIRE(registry.register_type("A", {"X"}).has_value());
        CHECK(registry.summary() == "Found 2 display element types:\nB (Y)\nA (X)");
    }

    TEST_CASE("manifest_loads_types") {
        auto registry = LoadRegistryManifest(
            R"({"types": [{"display": "ItemView", "data": ["Item"]}, {"display": "FeedView", "data": ["Post", "Ad"]}]})");
        REQUIRE(registry.has_value());
        CHECK(registry->size() == 2);
        CHECK(registry->types()[1].data_types == std::vector<std::string>{"Post", "Ad"});
        CHECK(registry->types()[0].header.empty());
    }

    TEST_CASE("manifest_carries_headers") {
        auto registry = LoadRegistryManifest(
            R"({"types": [{"display": "Game::ItemView", "data": ["Game::Item"], "header": "game/ItemView.hpp"}]})");
        REQUIRE(registry.has_value());
        CHECK(registry->find("Game::ItemView")->header == "game/ItemView.hpp");
        CHECK(LoadRegistryManifest(R"({"types": [{"display": "V", "data": ["D"], "header": 3}]})").error().code
              == Error::Code::MalformedInput);
    }

    TEST_CASE("reregistering_fills_a_missing_header") {
        ElementTypeRegistry registry;
        REQUIRE(registry.register_type("View", {"A"}).has_value());
        REQUIRE(registry.register_type("View", {"A"}, "View.hpp").has_value());
        REQUIRE(registry.register_type("View", {"A"}, "Other.hpp").has_value());
        CHECK(registry.find("View")->header == "View.hpp");
    }

    TEST_CASE("manifest_rejects_malformed_documents") {
        CHECK(LoadRegistryManifest("{").error().code == Error::Code::MalformedInput);
        CHECK(LoadRegistryManifest(R"({"items": []})").error().code == Error::Code::MalformedInput);
        CHECK(LoadRegistryManifest(R"({"types": [{"data": ["A"]}]})").error().code == Error::Code::MalformedInput);
        CHECK(LoadRegistryManifest(R"({"types": [{"display": "V"}]})").error().code == Error::Code::MalformedInput);
        CHECK(LoadRegistryManifest(R"({"types": [{"display": "V", "data": [1]}]})").error().code
              == Error::Code::MalformedInput);
        CHECK(LoadRegistryManifest(R"({"types": [{"display": "V", "data": []}]})").error().code
              == Error::Code::MalformedInput);
        CHECK(LoadRegistryManifestFile("/nonexistent/manifest.json").error().code == Error::Code::IoFailure);
    }
}
