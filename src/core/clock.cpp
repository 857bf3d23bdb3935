#include "beacon/core/clock.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace beacon::core {

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto time_t_now = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&time_t_now, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string FixedClock::now_iso8601() {
  return fixed_time_;
}

}  // namespace beacon::core
