#include "flakeid/snowflake/snowflake_info_json.h"

#include <cstdint>

namespace flakeid::snowflake {

nlohmann::json snowflake_info_to_json(const SnowflakeInfo& info) {
  nlohmann::json j;
  j["id"] = info.id;
  j["timestamp"] = info.timestamp;
  j["node_id"] = info.node_id;
  j["sequence"] = info.sequence;
  j["generated_at"] = core::format_iso8601_millis(info.generated_at);
  return j;
}

std::optional<SnowflakeInfo> snowflake_info_from_json(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("id")) {
    return std::nullopt;
  }
  const auto& id = j["id"];
  if (id.is_number_unsigned()) {
    return parse(id.get<SnowflakeId>());
  }
  // Documents built in code from a signed literal store number_integer.
  if (id.is_number_integer() && id.get<std::int64_t>() >= 0) {
    return parse(static_cast<SnowflakeId>(id.get<std::int64_t>()));
  }
  return std::nullopt;
}

}  // namespace flakeid::snowflake
