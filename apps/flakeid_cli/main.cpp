#include "flakeid/core/version.h"

#include "commands/generate.h"
#include "commands/parse.h"
#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cout << "flakeid v" << flakeid::core::kBuildVersion << "\n"
            << "Usage: flakeid <command> [options]\n"
            << "Commands:\n"
            << "  generate [--node-id N] [--count K] [--json]  Mint Snowflake ids\n"
            << "  parse <id> [<id> ...]                        Decode ids to JSON\n"
            << "  version                                      Print the version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_help();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "parse") {
    return cmd_parse(argc, argv);
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << flakeid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_help();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}
