#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/host/SceneHost.hpp>
#include <displaylist/list/ViewElement.hpp>
#include <displaylist/log/TaggedLogger.hpp>

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace DL {

/**
 * SlotPool owns the view instances of one list and their activation state.
 *
 * Slots [0, count) are active and in data order; slots [count, capacity) are
 * hidden and parked behind the active ones in sibling order, waiting to be
 * reused from the front. Slots are only destroyed by clear(). Destroying the
 * pool itself leaves the scene nodes to the host hierarchy under root.
 *
 * Indices handed to get_or_create must be ascending and contiguous: asking for
 * anything past count fails with InvalidState instead of filling the gap. This
 * is stricter than a plain capacity bound: a pooled slot in (count, capacity)
 * is never reactivated ahead of the slots before it, so [0, count) is always
 * exactly the active range.
 */
template <typename Element>
    requires std::derived_from<Element, ViewElement>
class SlotPool {
public:
    using Factory = std::function<std::unique_ptr<Element>(ElementHandle)>;

    struct Slot {
        std::unique_ptr<Element> element;
        bool                     active = false;
    };

    struct Acquired {
        Element* element = nullptr;
        bool     created = false;
    };

    [[nodiscard]] static auto default_factory() -> Factory {
        if constexpr (std::constructible_from<Element, ElementHandle>) {
            return [](ElementHandle handle) { return std::make_unique<Element>(handle); };
        } else {
            return {};
        }
    }

    SlotPool(SceneHost& host,
             ElementHandle root,
             PrefabHandle prefab,
             SpawnOptions spawn,
             Factory factory = default_factory())
        : host_(&host), root_(root), prefab_(prefab), spawn_(std::move(spawn)), factory_(std::move(factory)) {}

    SlotPool(SlotPool const&)            = delete;
    SlotPool& operator=(SlotPool const&) = delete;
    SlotPool(SlotPool&&) noexcept        = default;
    SlotPool& operator=(SlotPool&&)      = default;

    auto get_or_create(std::size_t index) -> Expected<Acquired> {
        if (index < count_) {
            return Acquired{slots_[index].element.get(), false};
        }
        if (index > slots_.size()) {
            return std::unexpected(Error{Error::Code::InvalidState,
                                         "slot " + std::to_string(index) + " requested past capacity "
                                             + std::to_string(slots_.size())});
        }
        if (index > count_) {
            return std::unexpected(Error{Error::Code::InvalidState,
                                         "slot " + std::to_string(index) + " requested before slot "
                                             + std::to_string(count_) + " was bound"});
        }

        if (index < slots_.size()) {
            auto& slot = slots_[index];
            if (!slot.active) {
                if (auto status = host_->set_active(slot.element->handle(), true); !status) {
                    return std::unexpected(status.error());
                }
                slot.active = true;
            }
            ++count_;
            return Acquired{slot.element.get(), false};
        }

        auto element = instantiate(prefab_, spawn_);
        if (!element) {
            return std::unexpected(element.error());
        }
        auto* raw = element->get();
        slots_.push_back(Slot{std::move(*element), true});
        ++count_;
        dl_log("SlotPool instantiated slot " + std::to_string(index) + " handle="
                   + std::to_string(raw->handle()),
               "SlotPool");
        return Acquired{raw, true};
    }

    auto deactivate_from(std::size_t start) -> Expected<void> {
        for (auto index = start; index < slots_.size(); ++index) {
            auto&      slot   = slots_[index];
            auto const handle = slot.element->handle();
            if (slot.active) {
                if (auto status = host_->set_active(handle, false); !status) {
                    return std::unexpected(status.error());
                }
                slot.active = false;
                count_      = std::min(count_, index);
            }
            if (auto status = host_->set_sibling_order(handle, kLastSibling); !status) {
                return std::unexpected(status.error());
            }
        }
        count_ = std::min(count_, start);
        return {};
    }

    auto insert(std::ptrdiff_t index, ElementHandle handle) -> Expected<Element*> {
        if (index < 0 || static_cast<std::size_t>(index) > count_) {
            return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                         "insert index " + std::to_string(index) + " outside [0, "
                                             + std::to_string(count_) + "]"});
        }
        if (root_ == kNullElement || handle == kNullElement) {
            dl_log("Element could not be inserted into list " + std::to_string(root_) + " at "
                       + std::to_string(index) + ", element: " + std::to_string(handle),
                   "SlotPool", "ERROR");
            return std::unexpected(Error{Error::Code::InvalidArgument,
                                         root_ == kNullElement ? "list has no root" : "null element handle"});
        }
        if (index_of(handle)) {
            return std::unexpected(Error{Error::Code::InvalidArgument,
                                         "element " + std::to_string(handle) + " is already pooled"});
        }
        if (!factory_) {
            return std::unexpected(Error{Error::Code::InvalidState, "pool has no element factory"});
        }
        auto element = factory_(handle);
        if (!element) {
            return std::unexpected(Error{Error::Code::InvalidArgument,
                                         "element factory rejected handle " + std::to_string(handle)});
        }

        auto const position = static_cast<std::size_t>(index);
        if (auto status = host_->set_sibling_order(handle, position); !status) {
            return std::unexpected(status.error());
        }
        if (auto status = host_->set_active(handle, true); !status) {
            return std::unexpected(status.error());
        }
        auto* raw = element.get();
        slots_.insert(slots_.begin() + index, Slot{std::move(element), true});
        ++count_;
        return raw;
    }

    auto append(ElementHandle handle) -> Expected<Element*> {
        return insert(static_cast<std::ptrdiff_t>(count_), handle);
    }

    // false when index is not an active slot; the recycled view keeps its node
    // and moves to the tail, so capacity is unchanged. Host calls run first, so
    // a host failure leaves the slot active and in place.
    auto remove_at(std::ptrdiff_t index) -> Expected<bool> {
        if (index < 0 || static_cast<std::size_t>(index) >= count_) {
            return false;
        }
        auto const position = static_cast<std::size_t>(index);
        auto const handle   = slots_[position].element->handle();

        if (auto status = host_->set_active(handle, false); !status) {
            return std::unexpected(status.error());
        }
        if (auto status = host_->set_sibling_order(handle, kLastSibling); !status) {
            if (auto restored = host_->set_active(handle, true); !restored) {
                dl_log("SlotPool failed to reactivate " + std::to_string(handle) + ": "
                           + describeError(restored.error()),
                       "SlotPool", "ERROR");
            }
            return std::unexpected(status.error());
        }

        auto slot = std::move(slots_[position]);
        slots_.erase(slots_.begin() + index);
        slot.active = false;
        slots_.push_back(std::move(slot));
        --count_;
        return true;
    }

    auto create_child(PrefabHandle prefab, SpawnOptions const& options) -> Expected<Element*> {
        auto element = instantiate(prefab, options);
        if (!element) {
            return std::unexpected(element.error());
        }
        auto*      raw      = element->get();
        auto const position = count_;
        if (position < slots_.size()) {
            if (auto status = host_->set_sibling_order(raw->handle(), position); !status) {
                return std::unexpected(status.error());
            }
        }
        slots_.insert(slots_.begin() + static_cast<std::ptrdiff_t>(position), Slot{std::move(*element), true});
        ++count_;
        return raw;
    }

    // Destroys every scene node. Keeps going past host failures and reports the first.
    auto clear() -> Expected<void> {
        std::optional<Error> first_error;
        for (auto& slot : slots_) {
            if (auto status = host_->destroy(slot.element->handle()); !status && !first_error) {
                first_error = status.error();
            }
        }
        dl_log("SlotPool cleared " + std::to_string(slots_.size()) + " slots under root "
                   + std::to_string(root_),
               "SlotPool");
        slots_.clear();
        count_ = 0;
        if (first_error) {
            return std::unexpected(*first_error);
        }
        return {};
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        return slots_.size();
    }

    [[nodiscard]] auto count() const -> std::size_t {
        return count_;
    }

    [[nodiscard]] auto root() const -> ElementHandle {
        return root_;
    }

    [[nodiscard]] auto prefab() const -> PrefabHandle {
        return prefab_;
    }

    [[nodiscard]] auto spawn_options() const -> SpawnOptions const& {
        return spawn_;
    }

    auto operator[](std::size_t index) -> Element& {
        assert(index < slots_.size());
        return *slots_[index].element;
    }

    auto operator[](std::size_t index) const -> Element const& {
        assert(index < slots_.size());
        return *slots_[index].element;
    }

    [[nodiscard]] auto at(std::ptrdiff_t index) const -> Expected<Element*> {
        if (index < 0 || static_cast<std::size_t>(index) >= slots_.size()) {
            return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                         "index " + std::to_string(index) + " outside [0, "
                                             + std::to_string(slots_.size()) + ")"});
        }
        return slots_[static_cast<std::size_t>(index)].element.get();
    }

    [[nodiscard]] auto is_active(std::size_t index) const -> bool {
        return index < slots_.size() && slots_[index].active;
    }

    [[nodiscard]] auto index_of(ElementHandle handle) const -> std::optional<std::size_t> {
        for (std::size_t index = 0; index < slots_.size(); ++index) {
            if (slots_[index].element->handle() == handle) {
                return index;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto contains(ElementHandle handle) const -> bool {
        return index_of(handle).has_value();
    }

    [[nodiscard]] auto active_elements() const -> std::vector<Element*> {
        std::vector<Element*> elements;
        elements.reserve(count_);
        for (std::size_t index = 0; index < count_; ++index) {
            elements.push_back(slots_[index].element.get());
        }
        return elements;
    }

    [[nodiscard]] auto all_elements() const -> std::vector<Element*> {
        std::vector<Element*> elements;
        elements.reserve(slots_.size());
        for (auto const& slot : slots_) {
            elements.push_back(slot.element.get());
        }
        return elements;
    }

    [[nodiscard]] auto slots() const -> std::vector<Slot> const& {
        return slots_;
    }

private:
    auto instantiate(PrefabHandle prefab, SpawnOptions const& options) -> Expected<std::unique_ptr<Element>> {
        if (root_ == kNullElement) {
            dl_log("SlotPool cannot instantiate without a root", "SlotPool", "ERROR");
            return std::unexpected(Error{Error::Code::InvalidState, "list has no root"});
        }
        if (!factory_) {
            return std::unexpected(Error{Error::Code::InvalidState, "pool has no element factory"});
        }
        auto handle = host_->create_child(root_, prefab, options);
        if (!handle) {
            return std::unexpected(handle.error());
        }
        auto element = factory_(*handle);
        if (!element) {
            discard(*handle);
            return std::unexpected(Error{Error::Code::InvalidState,
                                         "element factory rejected handle " + std::to_string(*handle)});
        }
        if (auto status = host_->set_active(*handle, true); !status) {
            discard(*handle);
            return std::unexpected(status.error());
        }
        return element;
    }

    // Destroys a node created for a slot that never made it into the pool.
    auto discard(ElementHandle handle) -> void {
        if (auto destroyed = host_->destroy(handle); !destroyed) {
            dl_log("SlotPool failed to destroy orphaned node: " + describeError(destroyed.error()), "SlotPool",
                   "ERROR");
        }
    }

    SceneHost*        host_;
    ElementHandle     root_;
    PrefabHandle      prefab_;
    SpawnOptions      spawn_;
    Factory           factory_;
    std::vector<Slot> slots_{};
    std::size_t       count_ = 0;
};

} // namespace DL
