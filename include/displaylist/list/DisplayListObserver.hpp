#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace DL {

/**
 * Lifecycle notifications of a DisplayList. Within one populate pass every
 * element_removed fires before the first element_added, and element_instantiated
 * fires once per new view, before its first bind.
 *
 * element_instantiated is the place for one-time setup such as wiring input
 * callbacks. element_added/element_removed fire for logical membership, so a
 * view that is reused across passes is reported removed and added again.
 */
template <typename V>
struct DisplayListObserver {
    virtual ~DisplayListObserver() = default;

    virtual void element_instantiated(V& /*element*/) {}
    virtual void element_added(V& /*element*/) {}
    virtual void element_removed(V& /*element*/) {}
};

template <typename V>
struct CallbackObserver final : DisplayListObserver<V> {
    std::function<void(V&)> on_instantiated;
    std::function<void(V&)> on_added;
    std::function<void(V&)> on_removed;

    void element_instantiated(V& element) override {
        if (on_instantiated)
            on_instantiated(element);
    }
    void element_added(V& element) override {
        if (on_added)
            on_added(element);
    }
    void element_removed(V& element) override {
        if (on_removed)
            on_removed(element);
    }
};

// Holds observers weakly and notifies them in registration order; expired
// entries are dropped on the next notification.
template <typename V>
class ObserverList {
public:
    auto add(std::shared_ptr<DisplayListObserver<V>> const& observer) -> void {
        if (observer) {
            observers_.push_back(observer);
        }
    }

    auto remove(std::shared_ptr<DisplayListObserver<V>> const& observer) -> void {
        std::erase_if(observers_, [&](auto const& weak) {
            auto locked = weak.lock();
            return !locked || locked == observer;
        });
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return observers_.size();
    }

    auto instantiated(V& element) -> void {
        notify([&](auto& observer) { observer.element_instantiated(element); });
    }
    auto added(V& element) -> void {
        notify([&](auto& observer) { observer.element_added(element); });
    }
    auto removed(V& element) -> void {
        notify([&](auto& observer) { observer.element_removed(element); });
    }

private:
    template <typename Fn>
    auto notify(Fn&& fn) -> void {
        bool expired = false;
        // Observers may unsubscribe while being notified; iterate a copy.
        auto const snapshot = observers_;
        for (auto const& weak : snapshot) {
            if (auto observer = weak.lock()) {
                fn(*observer);
            } else {
                expired = true;
            }
        }
        if (expired) {
            std::erase_if(observers_, [](auto const& weak) { return weak.expired(); });
        }
    }

    std::vector<std::weak_ptr<DisplayListObserver<V>>> observers_{};
};

} // namespace DL
