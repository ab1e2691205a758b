#pragma once

#include <chrono>
#include <string>

namespace usagestat::util {

// Single place to control the clock source.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// "YYYY-MM-DDTHH:MM:SS+00:00"; lexical order equals chronological order.
std::string ToIso8601(TimePoint tp);

std::string NowIso8601();

} // namespace usagestat::util
