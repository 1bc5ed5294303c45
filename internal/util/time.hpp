#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace issueflow::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMs();

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 UTC rendering used in JSON output ("" for 0).
std::string FormatUnixMillis(uint64_t ms);

} // namespace issueflow::util
