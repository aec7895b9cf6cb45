#pragma once

#include <chrono>
#include <string_view>

namespace healthgate {

// Parses a human readable duration made of one or several <number><unit> groups, with units
// 'h', 'm', 's', 'ms', 'us' (or 'µs') and 'ns', for instance "15s", "500ms", "1m30s" or "1.5s".
// A bare "0" is accepted. The number of each group may have a fractional part.
// Throws std::invalid_argument on malformed input or negative values.
std::chrono::nanoseconds ParseDuration(std::string_view durationStr);

}  // namespace healthgate
