#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/host/SceneHost.hpp>

#include <concepts>

namespace DL {

// Base of every pooled view: ties a C++ object to the scene node it drives.
// The node itself belongs to the pool that created or adopted the view.
class ViewElement {
public:
    explicit ViewElement(ElementHandle handle)
        : handle_(handle) {}
    virtual ~ViewElement() = default;

    ViewElement(ViewElement const&)            = delete;
    ViewElement& operator=(ViewElement const&) = delete;

    [[nodiscard]] auto handle() const -> ElementHandle {
        return handle_;
    }

private:
    ElementHandle handle_;
};

template <typename V, typename D>
concept DisplayElement = std::derived_from<V, ViewElement> && requires(V& view, D const& data) {
    { view.populate(data) } -> std::same_as<Expected<void>>;
};

} // namespace DL
