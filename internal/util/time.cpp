#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace issueflow::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatUnixMillis(uint64_t ms) {
  if (ms == 0) {
    return {};
  }

  const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  const auto len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);

  char millis[8];
  std::snprintf(millis, sizeof(millis), ".%03uZ", static_cast<unsigned>(ms % 1000));
  return std::string(buffer, len) + millis;
}

} // namespace issueflow::util
