#include "gitstamp/time.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>

namespace gitstamp::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{};
  if (localtime_r(&t, &lt) == nullptr)
    return 0;
  // tm_gmtoff is seconds east of UTC, DST included
  return static_cast<int>(lt.tm_gmtoff / 60);
}

std::string tz_offset_string(int minutes) {
  std::array<char, 8> buf{};
  const char sign = minutes >= 0 ? '+' : '-';
  const int m = std::abs(minutes);
  std::snprintf(buf.data(), buf.size(), "%c%02d%02d", sign, m / 60, m % 60);
  return {buf.data()};
}

std::string make_signature(const Identity &id, std::time_t when, int tz_minutes) {
  return id.name + " <" + id.email + "> " + std::to_string(static_cast<long long>(when)) + " " +
         tz_offset_string(tz_minutes);
}

} // namespace gitstamp::timeutil
