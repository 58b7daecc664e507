#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/host/SceneHost.hpp>
#include <displaylist/list/SlotPool.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace DL::Diagnostics {

struct SlotSummary {
    std::size_t   index  = 0;
    ElementHandle handle = kNullElement;
    bool          active = false;
};

struct PoolSnapshot {
    ElementHandle            root     = kNullElement;
    std::size_t              capacity = 0;
    std::size_t              count    = 0;
    std::vector<SlotSummary> slots;
};

template <typename Element>
[[nodiscard]] auto BuildPoolSnapshot(SlotPool<Element> const& pool) -> PoolSnapshot {
    PoolSnapshot snapshot;
    snapshot.root     = pool.root();
    snapshot.capacity = pool.capacity();
    snapshot.count    = pool.count();
    snapshot.slots.reserve(pool.capacity());
    auto const& slots = pool.slots();
    for (std::size_t index = 0; index < slots.size(); ++index) {
        snapshot.slots.push_back(SlotSummary{.index  = index,
                                             .handle = slots[index].element->handle(),
                                             .active = slots[index].active});
    }
    return snapshot;
}

auto SerializePoolSnapshot(PoolSnapshot const& snapshot, int indent = 2) -> std::string;

auto ParsePoolSnapshot(std::string const& payload) -> Expected<PoolSnapshot>;

} // namespace DL::Diagnostics
