#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace MS::Utils {

/**
 * Parses durations such as "1h30m", "45s", "1.5h", "250ms" or "0".
 * Units: ns, us (or µs), ms, s, m, h. A leading '-' or '+' is accepted.
 */
[[nodiscard]] auto parseDuration(std::string_view text) -> Expected<std::chrono::nanoseconds>;

// Renders "1h0m0s", "1m30s", "1.5s", "250ms", "0s".
[[nodiscard]] auto formatDuration(std::chrono::nanoseconds duration) -> std::string;

} // namespace MS::Utils
