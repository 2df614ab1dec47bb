#include "flakeid/snowflake/node_config.h"

#include <charconv>
#include <string>

namespace flakeid::snowflake {

std::optional<int> parse_node_id(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  // from_chars rejects a leading '+' but accepts '-'; both signs are fine for a node id.
  std::string_view digits = text;
  if (digits.front() == '+') {
    digits.remove_prefix(1);
    if (digits.empty() || digits.front() == '-') {
      return std::nullopt;
    }
  }

  int value = 0;
  const char* first = digits.data();
  const char* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

core::Result<NodeIdConfig, ConfigurationError> resolve_node_id(
    const std::optional<std::string>& flag_value, const char* env_value) {
  using R = core::Result<NodeIdConfig, ConfigurationError>;

  std::string raw;
  NodeIdSource source = NodeIdSource::kDefault;
  if (flag_value.has_value()) {
    raw = flag_value.value();
    source = NodeIdSource::kFlag;
  } else if (env_value != nullptr && env_value[0] != '\0') {
    raw = env_value;
    source = NodeIdSource::kEnv;
  } else {
    return R::ok(NodeIdConfig{});
  }

  const auto parsed = parse_node_id(raw);
  if (!parsed.has_value()) {
    return R::err(ConfigurationError{
        .code = ConfigurationErrorCode::kNodeIdMalformed,
        .detail = "node id from " + to_string(source) + " is not an integer: '" + raw + "'",
    });
  }
  return R::ok(NodeIdConfig{.node_id = parsed.value(), .source = source});
}

std::string to_string(const NodeIdSource source) {
  switch (source) {
    case NodeIdSource::kFlag:
      return "--node-id";
    case NodeIdSource::kEnv:
      return kNodeIdEnvVar;
    case NodeIdSource::kDefault:
      return "default";
  }
  return "unknown";
}

}  // namespace flakeid::snowflake
