#pragma once

#include <displaylist/config/DebugFlags.hpp>
#include <displaylist/config/DisplayListOptions.hpp>
#include <displaylist/core/Error.hpp>
#include <displaylist/diagnostics/PoolSnapshot.hpp>
#include <displaylist/host/SceneHost.hpp>
#include <displaylist/list/DisplayListObserver.hpp>
#include <displaylist/list/PassGuard.hpp>
#include <displaylist/list/SlotPool.hpp>
#include <displaylist/list/ViewElement.hpp>
#include <displaylist/log/TaggedLogger.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace DL {

/**
 * DisplayList keeps one view of type V per record of type D, in order.
 *
 * populate() rebinds the pooled views from the front, instantiates views only
 * when the data outgrows the pool and hides the surplus instead of destroying
 * it. Every view's populate() runs synchronously inside the call, so a long
 * list blocks the caller's frame for the whole pass.
 *
 * A failing bind aborts the pass with BindFailure: views bound so far keep
 * their new data, the rest are untouched and data() still returns the previous
 * sequence. Mutating the list from a bind or observer callback fails with
 * InvalidState.
 *
 * insert()/remove_at() edit the view sequence directly and do not touch data().
 */
template <typename V, typename D>
    requires DisplayElement<V, D>
class DisplayList {
public:
    using View     = V;
    using Data     = D;
    using Observer = DisplayListObserver<V>;
    using Factory  = typename SlotPool<V>::Factory;

    DisplayList(SceneHost& host,
                ElementHandle root,
                DisplayListOptions const& options,
                Factory factory = SlotPool<V>::default_factory())
        : pool_(host, root, options.prefab, options.spawn_options(), std::move(factory)),
          debug_name_(options.debug_name.empty() ? "list@" + std::to_string(root) : options.debug_name) {}

    virtual ~DisplayList() = default;

    DisplayList(DisplayList const&)            = delete;
    DisplayList& operator=(DisplayList const&) = delete;

    auto populate(std::optional<std::vector<D>> data) -> Expected<void> {
        if (!data) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "populate requires a data sequence"});
        }
        if (auto status = ensure_idle("populate"); !status) {
            return status;
        }
        PassGuard guard{busy_};

        for (auto* element : pool_.active_elements()) {
            observers_.removed(*element);
        }

        auto const& records = *data;
        for (std::size_t index = 0; index < records.size(); ++index) {
            auto slot = pool_.get_or_create(index);
            if (!slot) {
                return std::unexpected(slot.error());
            }
            if (slot->created) {
                observers_.instantiated(*slot->element);
            }
            if (auto bound = slot->element->populate(records[index]); !bound) {
                auto message = "record " + std::to_string(index) + " of " + debug_name_;
                if (bound.error().message) {
                    message += ": " + *bound.error().message;
                }
                dl_log("DisplayList bind failed: " + message, "DisplayList", "ERROR");
                return std::unexpected(Error{Error::Code::BindFailure, std::move(message)});
            }
            observers_.added(*slot->element);
        }

        if (auto status = pool_.deactivate_from(records.size()); !status) {
            return status;
        }

        data_ = std::move(data);
        dl_log(debug_name_ + " populated count=" + std::to_string(pool_.count())
                   + " capacity=" + std::to_string(pool_.capacity()),
               "DisplayList");
        if (DebugSnapshotsEnabled()) {
            dl_log(Diagnostics::SerializePoolSnapshot(Diagnostics::BuildPoolSnapshot(pool_), -1), "Snapshot");
        }
        return {};
    }

    auto insert(std::ptrdiff_t index, ElementHandle handle) -> Expected<void> {
        if (auto status = ensure_idle("insert"); !status) {
            return status;
        }
        PassGuard guard{busy_};
        auto      inserted = pool_.insert(index, handle);
        if (!inserted) {
            return std::unexpected(inserted.error());
        }
        observers_.added(**inserted);
        return {};
    }

    auto remove_at(std::ptrdiff_t index) -> Expected<bool> {
        if (auto status = ensure_idle("remove_at"); !status) {
            return std::unexpected(status.error());
        }
        PassGuard guard{busy_};
        if (index < 0 || static_cast<std::size_t>(index) >= pool_.count()) {
            return false;
        }
        auto& element = pool_[static_cast<std::size_t>(index)];
        auto  removed = pool_.remove_at(index);
        if (removed && *removed) {
            observers_.removed(element);
        }
        return removed;
    }

    auto clear() -> Expected<void> {
        if (auto status = ensure_idle("clear"); !status) {
            return status;
        }
        PassGuard guard{busy_};
        for (auto* element : pool_.active_elements()) {
            observers_.removed(*element);
        }
        data_.reset();
        return pool_.clear();
    }

    auto add_observer(std::shared_ptr<Observer> const& observer) -> void {
        observers_.add(observer);
    }

    auto remove_observer(std::shared_ptr<Observer> const& observer) -> void {
        observers_.remove(observer);
    }

    [[nodiscard]] auto count() const -> std::size_t {
        return pool_.count();
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        return pool_.capacity();
    }

    auto operator[](std::size_t index) -> V& {
        return pool_[index];
    }

    auto operator[](std::size_t index) const -> V const& {
        return pool_[index];
    }

    [[nodiscard]] auto at(std::ptrdiff_t index) const -> Expected<V*> {
        return pool_.at(index);
    }

    [[nodiscard]] auto active_elements() const -> std::vector<V*> {
        return pool_.active_elements();
    }

    [[nodiscard]] auto all_elements() const -> std::vector<V*> {
        return pool_.all_elements();
    }

    [[nodiscard]] auto data() const -> std::optional<std::vector<D>> const& {
        return data_;
    }

    [[nodiscard]] auto root() const -> ElementHandle {
        return pool_.root();
    }

    [[nodiscard]] auto name() const -> std::string const& {
        return debug_name_;
    }

    [[nodiscard]] auto pool() const -> SlotPool<V> const& {
        return pool_;
    }

private:
    auto ensure_idle(char const* operation) const -> Expected<void> {
        return EnsureIdle(busy_, operation, debug_name_);
    }

    SlotPool<V>                   pool_;
    std::optional<std::vector<D>> data_{};
    ObserverList<V>               observers_{};
    std::string                   debug_name_;
    bool                          busy_ = false;
};

} // namespace DL
