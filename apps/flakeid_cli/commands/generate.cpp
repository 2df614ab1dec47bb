#include "generate.h"

#include "flakeid/core/clock.h"
#include "flakeid/core/services.h"
#include "flakeid/snowflake/id_generator.h"
#include "flakeid/snowflake/node_config.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

struct GenerateCliConfig {
  std::optional<std::string> node_id;
  int count{1};
  bool json{false};
};

bool handle_count(GenerateCliConfig& config, const std::string& value) {
  const auto count = parse_count_text(value);
  if (!count.has_value()) {
    std::cerr << "Invalid --count: " << value << " (valid: 1.." << kMaxGenerateCount << ")\n";
    return false;
  }
  config.count = count.value();
  return true;
}

std::vector<flakeid::apps::Option<GenerateCliConfig>> build_option_registry() {
  return {
      {"--node-id", true, "Node id in [0, 1023] (default: $NODE_ID, else 0)",
       [](GenerateCliConfig& c, const std::string& v) {
         c.node_id = v;
         return true;
       }},
      {"--count", true, "Number of ids to mint (default: 1)", handle_count},
      {"--json", false, "Print decomposed ids as a JSON array",
       [](GenerateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  namespace sf = flakeid::snowflake;

  const auto options = build_option_registry();
  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    flakeid::apps::print_usage(std::cerr, "flakeid generate [options]", options);
    return 1;
  }
  const auto& config = parsed.config;

  const auto node_config = sf::resolve_node_id(
      config.node_id, std::getenv(sf::kNodeIdEnvVar));  // NOLINT(concurrency-mt-unsafe)
  if (!node_config.has_value()) {
    std::cerr << "Error: " << sf::describe(node_config.error()) << "\n";
    return 1;
  }
  if (node_config.value().source == sf::NodeIdSource::kDefault) {
    std::cerr << "WARNING: No --node-id or " << sf::kNodeIdEnvVar << " set. Using node id "
              << sf::kDefaultNodeId << ".\n"
                 "         Ids are only unique if no other live process shares this node id.\n";
  }

  flakeid::core::SystemClock clock;
  auto generator_result = sf::SnowflakeIdGenerator::create(node_config.value().node_id, clock);
  if (!generator_result.has_value()) {
    std::cerr << "Error: " << sf::describe(generator_result.error()) << "\n";
    return 1;
  }
  auto generator = std::move(generator_result).value();

  flakeid::core::Services services{clock, *generator};
  return execute_generate(services.id_generator, config.count, config.json, std::cout,
                          std::cerr);
}
