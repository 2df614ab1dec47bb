#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/snowflake/errors.h"
#include "flakeid/snowflake/layout.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace flakeid::snowflake {

using GenerateResult = core::Result<SnowflakeId, ClockRegressionError>;

// Abstract ID generator interface for dependency injection.
// Components that create records hold an ISnowflakeIdGenerator& rather than reaching for a
// process-wide instance; tests substitute generators backed by fake clocks.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ISnowflakeIdGenerator {
 public:
  virtual ~ISnowflakeIdGenerator() = default;

  // Mint the next identifier.
  // Contract: successive successful calls on one instance return strictly increasing values.
  // A clock reading behind the last issued timestamp, or behind kEpochMillis, is a
  // ClockRegressionError.
  [[nodiscard]] virtual GenerateResult generate() = 0;

 protected:
  ISnowflakeIdGenerator() = default;
  ISnowflakeIdGenerator(const ISnowflakeIdGenerator&) = default;
  ISnowflakeIdGenerator& operator=(const ISnowflakeIdGenerator&) = default;
  ISnowflakeIdGenerator(ISnowflakeIdGenerator&&) = default;
  ISnowflakeIdGenerator& operator=(ISnowflakeIdGenerator&&) = default;
};

// GeneratorStats are diagnostic counters. They never influence ID composition.
struct GeneratorStats {
  std::uint64_t ids_generated{0};         // NOLINT(readability-identifier-naming)
  std::uint64_t sequence_exhaustions{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t clock_regressions{0};     // NOLINT(readability-identifier-naming)
};

// SnowflakeIdGenerator mints 41/10/12-bit Snowflake IDs for one node.
//
// Thread-safety: generate() runs entirely under one mutex, including the wait for the next
// millisecond after 4096 IDs in the same millisecond. Other callers block for at most that
// wait (sub-millisecond on a live clock), and no two callers can observe the same sequence
// wraparound.
//
// Lifetime: the clock is held by reference and must outlive the generator. One instance per
// process, constructed at startup and passed to whatever needs IDs.
class SnowflakeIdGenerator final : public ISnowflakeIdGenerator {
 public:
  // Fails with kNodeIdOutOfRange unless kMinNodeId <= node_id <= kMaxNodeId.
  [[nodiscard]] static core::Result<std::unique_ptr<SnowflakeIdGenerator>, ConfigurationError>
  create(int node_id, core::IClock& clock);

  ~SnowflakeIdGenerator() override = default;

  // Not copyable or movable (owns mutex and minting state)
  SnowflakeIdGenerator(const SnowflakeIdGenerator&) = delete;
  SnowflakeIdGenerator& operator=(const SnowflakeIdGenerator&) = delete;
  SnowflakeIdGenerator(SnowflakeIdGenerator&&) = delete;
  SnowflakeIdGenerator& operator=(SnowflakeIdGenerator&&) = delete;

  [[nodiscard]] GenerateResult generate() override;

  [[nodiscard]] int node_id() const { return node_id_; }
  [[nodiscard]] GeneratorStats stats() const;

 private:
  SnowflakeIdGenerator(int node_id, core::IClock& clock);

  // Poll the clock until it reads anything other than last_millis and return that reading.
  // A reading below last_millis is a regression for the caller to report. Caller holds mutex_.
  std::int64_t wait_next_millis(std::int64_t last_millis);

  static constexpr std::int64_t kNeverMinted = -1;

  const int node_id_;
  core::IClock& clock_;

  mutable std::mutex mutex_;
  std::int64_t last_timestamp_{kNeverMinted};
  std::uint64_t sequence_{0};
  GeneratorStats stats_;
};

}  // namespace flakeid::snowflake
