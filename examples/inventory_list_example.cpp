#include <displaylist/config/DisplayListOptions.hpp>
#include <displaylist/core/Error.hpp>
#include <displaylist/diagnostics/PoolSnapshot.hpp>
#include <displaylist/host/MemorySceneHost.hpp>
#include <displaylist/list/DisplayList.hpp>
#include <displaylist/list/DisplayListObserver.hpp>
#include <displaylist/list/DynamicDisplayList.hpp>
#include <displaylist/list/KindDispatcher.hpp>
#include <displaylist/list/ViewElement.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct Item {
    std::string name;
    int         quantity = 0;
};

class ItemView : public DL::ViewElement {
public:
    using DL::ViewElement::ViewElement;

    auto populate(Item const& item) -> DL::Expected<void> {
        if (item.quantity < 0) {
            return std::unexpected(DL::Error{DL::Error::Code::InvalidArgument, "negative quantity for " + item.name});
        }
        label_ = item.name + " x" + std::to_string(item.quantity);
        return {};
    }

    [[nodiscard]] auto label() const -> std::string const& {
        return label_;
    }

private:
    std::string label_;
};

struct FeedEntry {
    std::string kind;
    std::string text;
};

constexpr DL::PrefabHandle kItemPrefab    = 1;
constexpr DL::PrefabHandle kHeaderPrefab  = 2;
constexpr DL::PrefabHandle kMessagePrefab = 3;

auto print_list(DL::DisplayList<ItemView, Item> const& list, DL::MemorySceneHost const& host) -> void {
    std::cout << list.name() << ": count=" << list.count() << " capacity=" << list.capacity() << "\n";
    for (auto* view : list.active_elements()) {
        std::cout << "  [" << *host.sibling_index(view->handle()) << "] " << view->label() << "\n";
    }
}

auto run() -> DL::Expected<void> {
    DL::MemorySceneHost host;
    host.register_prefab(kItemPrefab, "ItemRow");
    host.register_prefab(kHeaderPrefab, "Header");
    host.register_prefab(kMessagePrefab, "Message");
    auto const inventoryRoot = host.create_root("Inventory");

    DL::DisplayListOptions options{.prefab = kItemPrefab, .debug_name = "inventory"};
    DL::DisplayList<ItemView, Item> inventory(host, inventoryRoot, options);

    auto observer             = std::make_shared<DL::CallbackObserver<ItemView>>();
    observer->on_instantiated = [](ItemView& view) {
        std::cout << "  instantiated row " << view.handle() << "\n";
    };
    inventory.add_observer(observer);

    std::vector<Item> const full{{"Sword", 1}, {"Potion", 5}, {"Arrow", 40}, {"Shield", 1}};
    std::vector<Item> const spent{{"Sword", 1}, {"Arrow", 12}};

    for (auto const& pass : {full, spent, full}) {
        if (auto status = inventory.populate(pass); !status) {
            return status;
        }
        print_list(inventory, host);
    }

    auto snapshot = DL::Diagnostics::BuildPoolSnapshot(inventory.pool());
    std::cout << DL::Diagnostics::SerializePoolSnapshot(snapshot) << "\n";

    auto const feedRoot = host.create_root("Feed");
    DL::KindDispatcher<FeedEntry> dispatcher([](FeedEntry const& entry) { return entry.kind; });
    if (auto added = dispatcher.add_route("header", {.prefab = kHeaderPrefab}); !added) {
        return added;
    }
    if (auto added = dispatcher.add_route("message", {.prefab = kMessagePrefab}); !added) {
        return added;
    }

    DL::DynamicDisplayList<FeedEntry> feed(host, feedRoot, dispatcher);
    std::vector<FeedEntry> const entries{{"header", "Today"}, {"message", "Loot found"}, {"message", "Level up"}};
    if (auto status = feed.populate(entries); !status) {
        return status;
    }
    std::cout << "feed:";
    for (auto child : host.children(feedRoot)) {
        std::cout << " " << host.name(child);
    }
    std::cout << "\n";
    return {};
}

} // namespace

int main() {
    if (auto status = run(); !status) {
        std::cerr << "inventory_list_example failed: " << DL::describeError(status.error()) << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
