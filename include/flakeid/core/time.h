#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
}

// Format as ISO 8601 UTC with millisecond precision: "2024-01-01T00:00:00.000Z".
// Instants before the Unix epoch are formatted with floor semantics on the millisecond.
[[nodiscard]] std::string format_iso8601_millis(Timestamp ts);

}  // namespace flakeid::core
