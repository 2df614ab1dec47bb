#pragma once

#include "flakeid/snowflake/layout.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// parse_id_text: decimal text to SnowflakeId. nullopt for empty, signed, non-digit or
// overflowing input.
std::optional<flakeid::snowflake::SnowflakeId> parse_id_text(std::string_view text);

// execute_parse: decode each id and print its JSON decomposition to out: a single object for
// one id, an array for several. Any malformed id is reported to err and nothing is printed.
int execute_parse(const std::vector<std::string>& id_texts, std::ostream& out, std::ostream& err);
