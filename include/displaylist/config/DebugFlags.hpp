#pragma once

#include <string_view>

namespace DL {

// Interprets an environment value the way every DISPLAYLIST_* flag does: unset
// is false, present-but-empty is true, and "0", "false", "off", "no" (any case,
// surrounding whitespace ignored) are false.
[[nodiscard]] auto ParseTruthy(char const* value) -> bool;

// DISPLAYLIST_LOG enables the tagged logger at startup.
[[nodiscard]] auto LoggingEnabledFromEnvironment() -> bool;

// DISPLAYLIST_DEBUG_SNAPSHOTS makes lists log a pool snapshot after every
// populate pass. Read once per process.
[[nodiscard]] auto DebugSnapshotsEnabled() -> bool;

} // namespace DL
