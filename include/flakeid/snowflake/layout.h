#pragma once

#include <cstdint>

namespace flakeid::snowflake {

// SnowflakeId is a 64-bit identifier, most-significant bit first:
//
//   | 0 | timestamp-delta (41) | node-id (10) | sequence (12) |
//
// timestamp-delta counts milliseconds since kEpochMillis. The top bit is zero for every id the
// generator issues (it refuses clocks behind the epoch), so the value also fits a signed
// 64-bit column. compose() itself masks rather than rejects, see below.
using SnowflakeId = std::uint64_t;

// 2024-01-01T00:00:00Z. Fixed for the whole fleet: changing it reorders already-issued IDs.
inline constexpr std::int64_t kEpochMillis = 1704067200000;

inline constexpr int kTimestampBits = 41;
inline constexpr int kNodeIdBits = 10;
inline constexpr int kSequenceBits = 12;

inline constexpr int kNodeIdShift = kSequenceBits;
inline constexpr int kTimestampShift = kSequenceBits + kNodeIdBits;

inline constexpr std::uint64_t kTimestampMask = (std::uint64_t{1} << kTimestampBits) - 1;
inline constexpr std::uint64_t kNodeIdMask = (std::uint64_t{1} << kNodeIdBits) - 1;
inline constexpr std::uint64_t kSequenceMask = (std::uint64_t{1} << kSequenceBits) - 1;

inline constexpr int kMinNodeId = 0;
inline constexpr int kMaxNodeId = static_cast<int>(kNodeIdMask);
inline constexpr int kMaxSequence = static_cast<int>(kSequenceMask);

// compose packs absolute Unix milliseconds, node id and sequence into a SnowflakeId.
// Each field is masked to its width; a timestamp outside
// [kEpochMillis, kEpochMillis + 2^41) wraps within the 41-bit field.
[[nodiscard]] constexpr SnowflakeId compose(const std::int64_t timestamp_millis,
                                            const std::uint64_t node_id,
                                            const std::uint64_t sequence) {
  const auto delta = static_cast<std::uint64_t>(timestamp_millis - kEpochMillis) & kTimestampMask;
  return (delta << kTimestampShift) | ((node_id & kNodeIdMask) << kNodeIdShift) |
         (sequence & kSequenceMask);
}

}  // namespace flakeid::snowflake
