#include <displaylist/config/DebugFlags.hpp>

#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

constexpr char const* kLogFlag       = "DISPLAYLIST_LOG";
constexpr char const* kSnapshotsFlag = "DISPLAYLIST_DEBUG_SNAPSHOTS";

} // namespace

namespace DL {

auto ParseTruthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto LoggingEnabledFromEnvironment() -> bool {
    return ParseTruthy(std::getenv(kLogFlag));
}

auto DebugSnapshotsEnabled() -> bool {
    static bool enabled = ParseTruthy(std::getenv(kSnapshotsFlag));
    return enabled;
}

} // namespace DL
