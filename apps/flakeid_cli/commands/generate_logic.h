#pragma once

#include "flakeid/snowflake/id_generator.h"

#include <optional>
#include <ostream>
#include <string_view>

// Upper bound on --count; keeps a typo from minting for minutes.
constexpr int kMaxGenerateCount = 1'000'000;

// parse_count_text: decimal text to a count in [1, kMaxGenerateCount]. nullopt for empty,
// signed, whitespace-padded, non-digit or out-of-range input.
std::optional<int> parse_count_text(std::string_view text);

// execute_generate: mint `count` ids and write them to out, one decimal id per line, or as a
// JSON array of decomposed ids when as_json is set.
// Stops at the first clock regression, reports it to err and returns 1. In text mode the ids
// minted before the failure have already been written; in JSON mode nothing is written.
// Takes only the generator interface so tests can drive it with fake clocks.
int execute_generate(flakeid::snowflake::ISnowflakeIdGenerator& generator, int count,
                     bool as_json, std::ostream& out, std::ostream& err);
