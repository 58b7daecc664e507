#pragma once

#include <displaylist/core/Error.hpp>

#include <string>

namespace DL {

// Marks a list as mid-mutation for the guard's lifetime.
class PassGuard {
public:
    explicit PassGuard(bool& flag)
        : flag_(flag) {
        flag_ = true;
    }
    ~PassGuard() {
        flag_ = false;
    }

    PassGuard(PassGuard const&)            = delete;
    PassGuard& operator=(PassGuard const&) = delete;

private:
    bool& flag_;
};

[[nodiscard]] inline auto EnsureIdle(bool busy, char const* operation, std::string const& list_name)
    -> Expected<void> {
    if (busy) {
        return std::unexpected(Error{Error::Code::InvalidState,
                                     std::string{operation} + " called re-entrantly on " + list_name});
    }
    return {};
}

} // namespace DL
