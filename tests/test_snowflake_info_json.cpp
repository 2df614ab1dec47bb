#include "flakeid/snowflake/layout.h"
#include "flakeid/snowflake/snowflake_info.h"
#include "flakeid/snowflake/snowflake_info_json.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

using namespace flakeid::snowflake;

TEST_CASE("snowflake_info_to_json: all fields present", "[json]") {
  const SnowflakeId id = compose(kEpochMillis + 1'234, 12, 34);
  const auto j = snowflake_info_to_json(parse(id));

  CHECK(j["id"].get<SnowflakeId>() == id);
  CHECK(j["timestamp"].get<std::int64_t>() == kEpochMillis + 1'234);
  CHECK(j["node_id"].get<int>() == 12);
  CHECK(j["sequence"].get<int>() == 34);
  CHECK(j["generated_at"].get<std::string>() == "2024-01-01T00:00:01.234Z");
}

TEST_CASE("snowflake_info_from_json: derives fields from id", "[json]") {
  const SnowflakeId id = compose(kEpochMillis + 99, 1, 2);

  SECTION("accepts the serialized form") {
    const auto info = snowflake_info_from_json(snowflake_info_to_json(parse(id)));
    REQUIRE(info.has_value());
    CHECK(*info == parse(id));
  }

  SECTION("ignores inconsistent derived fields") {
    nlohmann::json j;
    j["id"] = id;
    j["node_id"] = 999;
    const auto info = snowflake_info_from_json(j);
    REQUIRE(info.has_value());
    CHECK(info->node_id == 1);
  }
}

TEST_CASE("snowflake_info_from_json: rejects documents without a usable id", "[json]") {
  CHECK_FALSE(snowflake_info_from_json(nlohmann::json::object()).has_value());
  CHECK_FALSE(snowflake_info_from_json(nlohmann::json::array()).has_value());
  CHECK_FALSE(snowflake_info_from_json(nlohmann::json{{"id", "123"}}).has_value());
  CHECK_FALSE(snowflake_info_from_json(nlohmann::json{{"id", -1}}).has_value());
  CHECK_FALSE(snowflake_info_from_json(nlohmann::json{{"id", 1.5}}).has_value());
}

TEST_CASE("snowflake_info_from_json: accepts a non-negative signed id", "[json]") {
  const nlohmann::json j{{"id", 4096}};
  REQUIRE(j["id"].is_number_integer());
  REQUIRE_FALSE(j["id"].is_number_unsigned());

  const auto info = snowflake_info_from_json(j);
  REQUIRE(info.has_value());
  CHECK(info->id == 4096);
  CHECK(info->node_id == 1);
  CHECK(info->sequence == 0);
}
