#include "flakeid/core/clock.h"

#include "flakeid/core/time.h"

namespace flakeid::core {

std::int64_t SystemClock::now_millis() {
  return to_unix_millis(now_utc());
}

std::int64_t ManualClock::now_millis() {
  return millis_.load(std::memory_order_acquire);
}

void ManualClock::set(const std::int64_t millis) {
  millis_.store(millis, std::memory_order_release);
}

void ManualClock::advance(const std::int64_t delta_millis) {
  millis_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

}  // namespace flakeid::core
