#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/host/SceneHost.hpp>
#include <displaylist/list/PassGuard.hpp>
#include <displaylist/list/SlotPool.hpp>
#include <displaylist/list/ViewElement.hpp>
#include <displaylist/log/TaggedLogger.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace DL {

/**
 * DynamicDisplayList shows heterogeneous records. For each record, in order,
 * the caller's select_and_bind picks a prefab, spawns it through create_child,
 * binds it and returns the new node. Views are not pooled across passes:
 * populate tears down the previous children first.
 *
 * A record the selector cannot classify should fail with UnrecognizedVariant;
 * the error aborts the pass and is returned as-is. While a pass runs, the
 * selector may only call create_child; every other mutation fails with
 * InvalidState.
 */
template <typename D>
class DynamicDisplayList {
public:
    using Data          = D;
    using SelectAndBind = std::function<Expected<ElementHandle>(D const&, DynamicDisplayList&)>;

    DynamicDisplayList(SceneHost& host, ElementHandle root, SelectAndBind select_and_bind)
        : pool_(host, root, PrefabHandle{0}, SpawnOptions{}),
          select_and_bind_(std::move(select_and_bind)) {}

    DynamicDisplayList(DynamicDisplayList const&)            = delete;
    DynamicDisplayList& operator=(DynamicDisplayList const&) = delete;

    auto populate(std::optional<std::vector<D>> data) -> Expected<void> {
        if (!data) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "data parameter must not be null"});
        }
        if (!select_and_bind_) {
            return std::unexpected(Error{Error::Code::InvalidState, "no select_and_bind operation"});
        }
        if (auto status = ensure_idle("populate"); !status) {
            return status;
        }
        PassGuard guard{populating_};
        if (auto status = populate_pass(*data); !status) {
            return status;
        }
        data_ = std::move(data);
        return {};
    }

    // Spawns a child under the root and appends it to the active range.
    auto create_child(PrefabHandle prefab, SpawnOptions const& options = {}) -> Expected<ElementHandle> {
        auto element = pool_.create_child(prefab, options);
        if (!element) {
            return std::unexpected(element.error());
        }
        return (*element)->handle();
    }

    auto append(ElementHandle handle) -> Expected<void> {
        if (auto status = ensure_idle("append"); !status) {
            return status;
        }
        auto appended = pool_.append(handle);
        if (!appended) {
            return std::unexpected(appended.error());
        }
        return {};
    }

    auto insert(std::ptrdiff_t index, ElementHandle handle) -> Expected<void> {
        if (auto status = ensure_idle("insert"); !status) {
            return status;
        }
        auto inserted = pool_.insert(index, handle);
        if (!inserted) {
            return std::unexpected(inserted.error());
        }
        return {};
    }

    auto remove_at(std::ptrdiff_t index) -> Expected<bool> {
        if (auto status = ensure_idle("remove_at"); !status) {
            return std::unexpected(status.error());
        }
        return pool_.remove_at(index);
    }

    auto clear() -> Expected<void> {
        if (auto status = ensure_idle("clear"); !status) {
            return status;
        }
        return reset();
    }

    [[nodiscard]] auto count() const -> std::size_t {
        return pool_.count();
    }

    [[nodiscard]] auto capacity() const -> std::size_t {
        return pool_.capacity();
    }

    auto operator[](std::size_t index) -> ViewElement& {
        return pool_[index];
    }

    [[nodiscard]] auto at(std::ptrdiff_t index) const -> Expected<ViewElement*> {
        return pool_.at(index);
    }

    [[nodiscard]] auto active_elements() const -> std::vector<ViewElement*> {
        return pool_.active_elements();
    }

    [[nodiscard]] auto all_elements() const -> std::vector<ViewElement*> {
        return pool_.all_elements();
    }

    [[nodiscard]] auto data() const -> std::optional<std::vector<D>> const& {
        return data_;
    }

    [[nodiscard]] auto root() const -> ElementHandle {
        return pool_.root();
    }

    [[nodiscard]] auto pool() const -> SlotPool<ViewElement> const& {
        return pool_;
    }

private:
    auto ensure_idle(char const* operation) const -> Expected<void> {
        return EnsureIdle(populating_, operation, "dynamic list@" + std::to_string(pool_.root()));
    }

    auto reset() -> Expected<void> {
        data_.reset();
        return pool_.clear();
    }

    auto populate_pass(std::vector<D> const& records) -> Expected<void> {
        if (auto cleared = reset(); !cleared) {
            return cleared;
        }
        for (std::size_t index = 0; index < records.size(); ++index) {
            auto handle = select_and_bind_(records[index], *this);
            if (!handle) {
                dl_log("DynamicDisplayList record " + std::to_string(index) + " failed: "
                           + describeError(handle.error()),
                       "DynamicDisplayList", "ERROR");
                return std::unexpected(handle.error());
            }
            if (*handle == kNullElement) {
                return std::unexpected(Error{Error::Code::InvalidState,
                                             "select_and_bind returned no element for record "
                                                 + std::to_string(index)});
            }
            if (!pool_.contains(*handle)) {
                if (auto appended = pool_.append(*handle); !appended) {
                    return std::unexpected(appended.error());
                }
            }
        }
        return {};
    }

    SlotPool<ViewElement>         pool_;
    SelectAndBind                 select_and_bind_;
    std::optional<std::vector<D>> data_{};
    bool                          populating_ = false;
};

} // namespace DL
