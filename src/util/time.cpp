#include "idlecore/util/time.h"

#include <array>
#include <chrono>
#include <ctime>

namespace idlecore {

std::string utc_now_iso8601() {
  const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::array<char, 64> buf{};
  if (std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
    return std::string("1970-01-01T00:00:00Z");
  }
  return std::string(buf.data());
}

} // namespace idlecore
