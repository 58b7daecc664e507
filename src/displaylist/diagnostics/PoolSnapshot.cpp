#include <displaylist/diagnostics/PoolSnapshot.hpp>

#include <cstdint>

#include <nlohmann/json.hpp>

namespace DL::Diagnostics {
namespace {

[[nodiscard]] auto to_json(SlotSummary const& slot) -> nlohmann::json {
    return nlohmann::json{
        {"index", slot.index},
        {"handle", slot.handle},
        {"active", slot.active},
    };
}

[[nodiscard]] auto slot_from_json(nlohmann::json const& json) -> Expected<SlotSummary> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "pool slot must be an object"});
    }
    auto index  = json.find("index");
    auto handle = json.find("handle");
    auto active = json.find("active");
    if (index == json.end() || !index->is_number_unsigned() || handle == json.end()
        || !handle->is_number_unsigned() || active == json.end() || !active->is_boolean()) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "pool slot requires unsigned index, unsigned handle and boolean active"});
    }
    return SlotSummary{.index  = index->get<std::size_t>(),
                       .handle = handle->get<ElementHandle>(),
                       .active = active->get<bool>()};
}

} // namespace

auto SerializePoolSnapshot(PoolSnapshot const& snapshot, int indent) -> std::string {
    nlohmann::json slots = nlohmann::json::array();
    for (auto const& slot : snapshot.slots) {
        slots.push_back(to_json(slot));
    }
    nlohmann::json json{
        {"root", snapshot.root},
        {"capacity", snapshot.capacity},
        {"count", snapshot.count},
        {"slots", std::move(slots)},
    };
    return json.dump(indent);
}

auto ParsePoolSnapshot(std::string const& payload) -> Expected<PoolSnapshot> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid pool snapshot JSON"});
    }
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "pool snapshot must be an object"});
    }

    auto read_unsigned = [&json](char const* key) -> Expected<std::uint64_t> {
        auto it = json.find(key);
        if (it == json.end() || !it->is_number_unsigned()) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         std::string{"pool snapshot missing unsigned "} + key});
        }
        return it->get<std::uint64_t>();
    };

    auto root     = read_unsigned("root");
    auto capacity = read_unsigned("capacity");
    auto count    = read_unsigned("count");
    for (auto const* field : {&root, &capacity, &count}) {
        if (!*field) {
            return std::unexpected(field->error());
        }
    }

    PoolSnapshot snapshot;
    snapshot.root     = *root;
    snapshot.capacity = static_cast<std::size_t>(*capacity);
    snapshot.count    = static_cast<std::size_t>(*count);

    auto slots_it = json.find("slots");
    if (slots_it == json.end() || !slots_it->is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "pool snapshot slots must be an array"});
    }
    snapshot.slots.reserve(slots_it->size());
    for (auto const& entry : *slots_it) {
        auto slot = slot_from_json(entry);
        if (!slot) {
            return std::unexpected(slot.error());
        }
        snapshot.slots.push_back(*slot);
    }
    if (snapshot.count > snapshot.capacity || snapshot.slots.size() != snapshot.capacity) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "pool snapshot count/capacity disagree with its slots"});
    }
    return snapshot;
}

} // namespace DL::Diagnostics
