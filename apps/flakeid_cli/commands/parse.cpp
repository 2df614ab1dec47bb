#include "parse.h"

#include "parse_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ParseCliConfig {};

}  // namespace

int cmd_parse(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<flakeid::apps::Option<ParseCliConfig>> options;
  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || parsed.positionals.empty()) {
    flakeid::apps::print_usage(std::cerr, "flakeid parse <id> [<id> ...]", options);
    return 1;
  }
  return execute_parse(parsed.positionals, std::cout, std::cerr);
}
