#pragma once

#include <chrono>

namespace healthgate {

/// Alias some types to make it easier to use.
/// Durations handed to the servers are wall-clock durations, but every wait and deadline is measured on the
/// monotonic clock so that system time adjustments never shorten or extend a drain.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace healthgate
