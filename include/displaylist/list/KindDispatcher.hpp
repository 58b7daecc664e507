#pragma once

#include <displaylist/core/Error.hpp>
#include <displaylist/host/SceneHost.hpp>
#include <displaylist/list/DynamicDisplayList.hpp>

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DL {

// select_and_bind for DynamicDisplayList<D> that routes each record by a kind
// key. Copy it into the list after all routes are added.
template <typename D>
class KindDispatcher {
public:
    using KindOf = std::function<std::string(D const&)>;
    using Bind   = std::function<Expected<void>(ElementHandle, D const&)>;

    struct Route {
        PrefabHandle prefab = 0;
        SpawnOptions spawn{};
        Bind         bind;
    };

    explicit KindDispatcher(KindOf kind_of)
        : kind_of_(std::move(kind_of)) {}

    auto add_route(std::string kind, Route route) -> Expected<void> {
        if (kind.empty()) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "route kind must not be empty"});
        }
        if (routes_.find(kind) != routes_.end()) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "route '" + kind + "' already registered"});
        }
        kinds_.push_back(kind);
        routes_.emplace(std::move(kind), std::move(route));
        return {};
    }

    [[nodiscard]] auto kinds() const -> std::vector<std::string> const& {
        return kinds_;
    }

    auto operator()(D const& record, DynamicDisplayList<D>& list) const -> Expected<ElementHandle> {
        auto const kind  = kind_of_(record);
        auto const found = routes_.find(kind);
        if (found == routes_.end()) {
            return std::unexpected(Error{Error::Code::UnrecognizedVariant, "no route for kind '" + kind + "'"});
        }
        auto const& route  = found->second;
        auto        handle = list.create_child(route.prefab, route.spawn);
        if (!handle) {
            return std::unexpected(handle.error());
        }
        if (route.bind) {
            if (auto bound = route.bind(*handle, record); !bound) {
                return std::unexpected(Error{Error::Code::BindFailure,
                                             "kind '" + kind + "': " + describeError(bound.error())});
            }
        }
        return *handle;
    }

private:
    KindOf                                     kind_of_;
    phmap::flat_hash_map<std::string, Route>   routes_{};
    std::vector<std::string>                   kinds_{};
};

} // namespace DL
