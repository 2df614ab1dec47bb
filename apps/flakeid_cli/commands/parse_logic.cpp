#include "parse_logic.h"

#include "flakeid/snowflake/snowflake_info.h"
#include "flakeid/snowflake/snowflake_info_json.h"

#include <nlohmann/json.hpp>

#include <charconv>

std::optional<flakeid::snowflake::SnowflakeId> parse_id_text(const std::string_view text) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    return std::nullopt;
  }
  flakeid::snowflake::SnowflakeId value = 0;
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

int execute_parse(const std::vector<std::string>& id_texts, std::ostream& out,
                  std::ostream& err) {
  namespace sf = flakeid::snowflake;

  if (id_texts.empty()) {
    err << "Error: at least one <id> is required\n";
    return 1;
  }

  nlohmann::json decoded = nlohmann::json::array();
  for (const auto& text : id_texts) {
    const auto id = parse_id_text(text);
    if (!id.has_value()) {
      err << "Error: not a 64-bit unsigned decimal id: '" << text << "'\n";
      return 1;
    }
    decoded.push_back(sf::snowflake_info_to_json(sf::parse(id.value())));
  }

  out << (decoded.size() == 1 ? decoded[0] : decoded).dump(2) << "\n";
  return 0;
}
