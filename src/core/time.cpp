#include "flakeid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace flakeid::core {

std::string format_iso8601_millis(const Timestamp ts) {
  const auto millis_total = std::chrono::floor<std::chrono::milliseconds>(ts.time_since_epoch());
  const auto seconds = std::chrono::floor<std::chrono::seconds>(millis_total);
  const auto millis = (millis_total - seconds).count();

  const std::time_t time_t_value = static_cast<std::time_t>(seconds.count());
  std::tm utc{};
  // POSIX gmtime_r: std::gmtime shares a static buffer across threads.
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace flakeid::core
