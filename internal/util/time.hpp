#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fleet::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z
std::string ToIso8601(TimePoint tp);

// Parses the format produced by ToIso8601. Returns false on malformed input.
bool ParseIso8601(const std::string& text, TimePoint* out);

} // namespace fleet::util
