#pragma once

#include "flakeid/core/time.h"
#include "flakeid/snowflake/layout.h"

#include <cstdint>

namespace flakeid::snowflake {

// SnowflakeInfo is the decomposition of a SnowflakeId. Pure function of the id.
struct SnowflakeInfo {
  SnowflakeId id{0};               // NOLINT(readability-identifier-naming)
  std::int64_t timestamp{0};       // NOLINT(readability-identifier-naming)
  int node_id{0};                  // NOLINT(readability-identifier-naming)
  int sequence{0};                 // NOLINT(readability-identifier-naming)
  core::Timestamp generated_at{};  // NOLINT(readability-identifier-naming)

  bool operator==(const SnowflakeInfo&) const = default;
};

// parse decodes any 64-bit value. Never fails: input that was not produced by this scheme
// decodes to whatever its bits say.
[[nodiscard]] SnowflakeInfo parse(SnowflakeId id);

}  // namespace flakeid::snowflake
