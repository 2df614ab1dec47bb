#include "flakeid/core/time.h"
#include "flakeid/snowflake/layout.h"
#include "flakeid/snowflake/snowflake_info.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <random>

using namespace flakeid;
using namespace flakeid::snowflake;

TEST_CASE("parse: known id decomposes into its fields", "[parse]") {
  const SnowflakeId id = (1000ULL << 22) | (513ULL << 12) | 77ULL;
  const auto info = parse(id);

  CHECK(info.id == id);
  CHECK(info.timestamp == kEpochMillis + 1000);
  CHECK(info.node_id == 513);
  CHECK(info.sequence == 77);
  CHECK(core::to_unix_millis(info.generated_at) == kEpochMillis + 1000);
}

TEST_CASE("parse: zero is the epoch", "[parse]") {
  const auto info = parse(0);
  CHECK(info.timestamp == kEpochMillis);
  CHECK(info.node_id == 0);
  CHECK(info.sequence == 0);
  CHECK(core::format_iso8601_millis(info.generated_at) == "2024-01-01T00:00:00.000Z");
}

TEST_CASE("parse: total over ids this scheme never produces", "[parse]") {
  const auto info = parse(std::numeric_limits<SnowflakeId>::max());
  CHECK(info.node_id == kMaxNodeId);
  CHECK(info.sequence == kMaxSequence);
  CHECK(info.timestamp == kEpochMillis + static_cast<std::int64_t>((1ULL << 42) - 1));
}

TEST_CASE("parse: re-encoding random field values reproduces the id", "[parse]") {
  std::mt19937_64 rng(20240101);
  std::uniform_int_distribution<std::uint64_t> delta_dist(0, kTimestampMask);
  std::uniform_int_distribution<std::uint64_t> node_dist(0, kNodeIdMask);
  std::uniform_int_distribution<std::uint64_t> seq_dist(0, kSequenceMask);

  for (int i = 0; i < 10'000; ++i) {
    const auto timestamp = kEpochMillis + static_cast<std::int64_t>(delta_dist(rng));
    const auto node_id = node_dist(rng);
    const auto sequence = seq_dist(rng);
    const SnowflakeId id = compose(timestamp, node_id, sequence);

    const auto info = parse(id);
    REQUIRE(info.timestamp == timestamp);
    REQUIRE(static_cast<std::uint64_t>(info.node_id) == node_id);
    REQUIRE(static_cast<std::uint64_t>(info.sequence) == sequence);
    REQUIRE(compose(info.timestamp, static_cast<std::uint64_t>(info.node_id),
                    static_cast<std::uint64_t>(info.sequence)) == id);
  }
}
