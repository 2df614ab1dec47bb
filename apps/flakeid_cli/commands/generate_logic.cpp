#include "generate_logic.h"

#include "flakeid/snowflake/errors.h"
#include "flakeid/snowflake/snowflake_info.h"
#include "flakeid/snowflake/snowflake_info_json.h"

#include <nlohmann/json.hpp>

#include <charconv>

std::optional<int> parse_count_text(const std::string_view text) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    return std::nullopt;
  }
  int value = 0;
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last || value < 1 || value > kMaxGenerateCount) {
    return std::nullopt;
  }
  return value;
}

int execute_generate(flakeid::snowflake::ISnowflakeIdGenerator& generator, const int count,
                     const bool as_json, std::ostream& out, std::ostream& err) {
  namespace sf = flakeid::snowflake;

  nlohmann::json ids = nlohmann::json::array();
  for (int i = 0; i < count; ++i) {
    const auto result = generator.generate();
    if (!result.has_value()) {
      err << "Error: " << sf::describe(result.error()) << "\n";
      return 1;
    }
    if (as_json) {
      ids.push_back(sf::snowflake_info_to_json(sf::parse(result.value())));
    } else {
      out << result.value() << "\n";
    }
  }

  if (as_json) {
    out << ids.dump(2) << "\n";
  }
  return 0;
}
