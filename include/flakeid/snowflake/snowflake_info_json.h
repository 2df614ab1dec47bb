#pragma once

#include "flakeid/snowflake/snowflake_info.h"

#include <nlohmann/json.hpp>

#include <optional>

namespace flakeid::snowflake {

/// Serialize SnowflakeInfo to JSON:
/// {"id", "timestamp", "node_id", "sequence", "generated_at" (ISO 8601 UTC, millisecond precision)}
[[nodiscard]] nlohmann::json snowflake_info_to_json(const SnowflakeInfo& info);

/// Rebuild SnowflakeInfo from JSON. Only "id" is read; every other field is re-derived by parse()
/// so a document cannot describe an inconsistent decomposition.
/// Returns nullopt when "id" is missing, not an integer, or negative.
[[nodiscard]] std::optional<SnowflakeInfo> snowflake_info_from_json(const nlohmann::json& j);

}  // namespace flakeid::snowflake
