#include "flakeid/snowflake/node_config.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

using namespace flakeid::snowflake;

// ── parse_node_id ───────────────────────────────────────────────────────────

TEST_CASE("parse_node_id: decimal integers", "[config][node_id]") {
  CHECK(parse_node_id("0") == 0);
  CHECK(parse_node_id("1023") == 1023);
  CHECK(parse_node_id("+7") == 7);
  // Out of range still parses; the generator rejects it.
  CHECK(parse_node_id("-1") == -1);
  CHECK(parse_node_id("1024") == 1024);
}

TEST_CASE("parse_node_id: malformed input returns nullopt", "[config][node_id]") {
  CHECK_FALSE(parse_node_id("").has_value());
  CHECK_FALSE(parse_node_id("abc").has_value());
  CHECK_FALSE(parse_node_id("12abc").has_value());
  CHECK_FALSE(parse_node_id(" 12").has_value());
  CHECK_FALSE(parse_node_id("1.5").has_value());
  CHECK_FALSE(parse_node_id("+").has_value());
  CHECK_FALSE(parse_node_id("+-3").has_value());
  CHECK_FALSE(parse_node_id("99999999999999999999").has_value());
}

// ── resolve_node_id ─────────────────────────────────────────────────────────

TEST_CASE("resolve_node_id: flag wins over environment", "[config][node_id]") {
  const auto result = resolve_node_id(std::string{"12"}, "34");
  REQUIRE(result.has_value());
  CHECK(result.value().node_id == 12);
  CHECK(result.value().source == NodeIdSource::kFlag);
}

TEST_CASE("resolve_node_id: environment used when no flag", "[config][node_id]") {
  const auto result = resolve_node_id(std::nullopt, "34");
  REQUIRE(result.has_value());
  CHECK(result.value().node_id == 34);
  CHECK(result.value().source == NodeIdSource::kEnv);
}

TEST_CASE("resolve_node_id: default when nothing is set", "[config][node_id]") {
  for (const char* env : {static_cast<const char*>(nullptr), ""}) {
    const auto result = resolve_node_id(std::nullopt, env);
    REQUIRE(result.has_value());
    CHECK(result.value().node_id == kDefaultNodeId);
    CHECK(result.value().source == NodeIdSource::kDefault);
  }
}

TEST_CASE("resolve_node_id: malformed value is a configuration error", "[config][node_id]") {
  const auto from_env = resolve_node_id(std::nullopt, "node-3");
  REQUIRE_FALSE(from_env.has_value());
  CHECK(from_env.error().code == ConfigurationErrorCode::kNodeIdMalformed);
  CHECK(from_env.error().detail.find("NODE_ID") != std::string::npos);

  const auto from_flag = resolve_node_id(std::string{""}, "5");
  REQUIRE_FALSE(from_flag.has_value());
  CHECK(from_flag.error().detail.find("--node-id") != std::string::npos);
}
