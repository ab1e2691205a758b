#include "time.hpp"

#include <ctime>

namespace usagestat::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  const std::time_t secs = Clock::to_time_t(std::chrono::time_point_cast<std::chrono::seconds>(tp));

  std::tm utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &utc);
  return std::string(buf, n);
}

std::string NowIso8601() {
  return ToIso8601(Now());
}

} // namespace usagestat::util
