#include "flakeid/snowflake/snowflake_info.h"

namespace flakeid::snowflake {

SnowflakeInfo parse(const SnowflakeId id) {
  // The sign bit is not masked off, so an id with the top bit set decodes to a timestamp beyond
  // the 41-bit range rather than being rejected.
  const auto timestamp = static_cast<std::int64_t>(id >> kTimestampShift) + kEpochMillis;
  return SnowflakeInfo{
      .id = id,
      .timestamp = timestamp,
      .node_id = static_cast<int>((id >> kNodeIdShift) & kNodeIdMask),
      .sequence = static_cast<int>(id & kSequenceMask),
      .generated_at = core::from_unix_millis(timestamp),
  };
}

}  // namespace flakeid::snowflake
