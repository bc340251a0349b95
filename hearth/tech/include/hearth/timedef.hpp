#pragma once

#include <chrono>

namespace hearth {

/// The server only measures intervals (timeouts, drain deadlines, respawn backoff), so the monotonic clock is the
/// reference clock everywhere.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace hearth
