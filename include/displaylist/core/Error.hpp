#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace DL {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidArgument,
        IndexOutOfRange,
        NotFound,
        InvalidState,
        UnrecognizedVariant,
        BindFailure,
        MalformedInput,
        IoFailure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::IndexOutOfRange:
        return "index_out_of_range";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::InvalidState:
        return "invalid_state";
    case Error::Code::UnrecognizedVariant:
        return "unrecognized_variant";
    case Error::Code::BindFailure:
        return "bind_failure";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::IoFailure:
        return "io_failure";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace DL
