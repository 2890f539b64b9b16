#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sitestore::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  const auto t  = Clock::to_time_t(tp);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
  return out.str();
}

} // namespace sitestore::util
