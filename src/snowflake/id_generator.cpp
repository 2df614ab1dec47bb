#include "flakeid/snowflake/id_generator.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

namespace flakeid::snowflake {

namespace {

// Polls that only yield before the wait falls back to short sleeps.
constexpr int kYieldPolls = 64;
constexpr auto kPollSleep = std::chrono::microseconds{50};

}  // namespace

core::Result<std::unique_ptr<SnowflakeIdGenerator>, ConfigurationError>
SnowflakeIdGenerator::create(const int node_id, core::IClock& clock) {
  using R = core::Result<std::unique_ptr<SnowflakeIdGenerator>, ConfigurationError>;
  if (node_id < kMinNodeId || node_id > kMaxNodeId) {
    return R::err(ConfigurationError{
        .code = ConfigurationErrorCode::kNodeIdOutOfRange,
        .detail = "node id " + std::to_string(node_id) + " is outside [" +
                  std::to_string(kMinNodeId) + ", " + std::to_string(kMaxNodeId) + "]",
    });
  }
  return R::ok(std::unique_ptr<SnowflakeIdGenerator>(new SnowflakeIdGenerator(node_id, clock)));
}

SnowflakeIdGenerator::SnowflakeIdGenerator(const int node_id, core::IClock& clock)
    : node_id_(node_id), clock_(clock) {}

GenerateResult SnowflakeIdGenerator::generate() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t now = clock_.now_millis();
  // A clock behind the epoch cannot be encoded; report it against the epoch so the first
  // id is never minted with a wrapped timestamp field.
  const std::int64_t floor_millis = std::max(last_timestamp_, kEpochMillis);
  if (now < floor_millis) {
    ++stats_.clock_regressions;
    return GenerateResult::err(ClockRegressionError{now, floor_millis});
  }

  // Compute the next state locally; nothing is committed until the id is certain.
  std::uint64_t sequence = 0;
  if (now == last_timestamp_) {
    sequence = (sequence_ + 1) & kSequenceMask;
    if (sequence == 0) {
      // 4096 ids already issued in this millisecond.
      ++stats_.sequence_exhaustions;
      now = wait_next_millis(last_timestamp_);
      if (now < last_timestamp_) {
        ++stats_.clock_regressions;
        return GenerateResult::err(ClockRegressionError{now, last_timestamp_});
      }
    }
  }

  sequence_ = sequence;
  last_timestamp_ = now;
  ++stats_.ids_generated;

  return GenerateResult::ok(compose(now, static_cast<std::uint64_t>(node_id_), sequence_));
}

std::int64_t SnowflakeIdGenerator::wait_next_millis(const std::int64_t last_millis) {
  int polls = 0;
  for (;;) {
    const std::int64_t now = clock_.now_millis();
    if (now != last_millis) {
      return now;
    }
    if (polls < kYieldPolls) {
      ++polls;
      std::this_thread::yield();
    } else {
      std::this_thread::sleep_for(kPollSleep);
    }
  }
}

GeneratorStats SnowflakeIdGenerator::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace flakeid::snowflake
