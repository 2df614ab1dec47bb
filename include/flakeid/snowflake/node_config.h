#pragma once

#include "flakeid/core/result.h"
#include "flakeid/snowflake/errors.h"

#include <optional>
#include <string>
#include <string_view>

namespace flakeid::snowflake {

// Environment variable carrying the node id. Each concurrently running process in the fleet
// must see a distinct value; assigning them is the deployment's job.
inline constexpr const char* kNodeIdEnvVar = "NODE_ID";

// Node id used when neither a flag nor the environment supplies one.
inline constexpr int kDefaultNodeId = 0;

enum class NodeIdSource {
  kFlag,     // NOLINT(readability-identifier-naming)
  kEnv,      // NOLINT(readability-identifier-naming)
  kDefault,  // NOLINT(readability-identifier-naming)
};

struct NodeIdConfig {
  int node_id{kDefaultNodeId};                  // NOLINT(readability-identifier-naming)
  NodeIdSource source{NodeIdSource::kDefault};  // NOLINT(readability-identifier-naming)
};

// parse_node_id accepts an optionally signed decimal integer with no surrounding whitespace.
// Range is NOT checked here: out-of-range values are rejected when the generator is created.
// Returns nullopt for empty input, non-digits, or values that do not fit in int.
[[nodiscard]] std::optional<int> parse_node_id(std::string_view text);

// resolve_node_id picks the node id: flag value first, then env value, then kDefaultNodeId.
// An env value that is empty is treated as unset.
// Fails with kNodeIdMalformed when the chosen value does not parse.
[[nodiscard]] core::Result<NodeIdConfig, ConfigurationError> resolve_node_id(
    const std::optional<std::string>& flag_value, const char* env_value);

[[nodiscard]] std::string to_string(NodeIdSource source);

}  // namespace flakeid::snowflake
