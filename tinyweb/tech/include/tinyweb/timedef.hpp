#pragma once

#include <chrono>

namespace tinyweb {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
/// Deadlines and timeouts are computed with steady_clock which is monotonic.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace tinyweb
