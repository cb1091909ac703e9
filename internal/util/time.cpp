#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace fleet::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string ToIso8601(TimePoint tp) {
  const auto        ms     = ToUnixMillis(tp);
  const std::time_t secs    = static_cast<std::time_t>(ms / 1000);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(ms % 1000));
  return buffer;
}

bool ParseIso8601(const std::string& text, TimePoint* out) {
  std::tm utc{};
  int     millis = 0;
  const int matched = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d", &utc.tm_year, &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min,
                                  &utc.tm_sec, &millis);
  if (matched < 6) {
    return false;
  }

  utc.tm_year -= 1900;
  utc.tm_mon -= 1;
  const std::time_t secs = timegm(&utc);
  if (secs == static_cast<std::time_t>(-1)) {
    return false;
  }

  *out = TimePoint{} + std::chrono::seconds(secs) + std::chrono::milliseconds(matched == 7 ? millis : 0);
  return true;
}

} // namespace fleet::util
