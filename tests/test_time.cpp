#include "flakeid/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using namespace flakeid::core;

TEST_CASE("format_iso8601_millis: UTC with millisecond precision", "[time]") {
  CHECK(format_iso8601_millis(from_unix_millis(0)) == "1970-01-01T00:00:00.000Z");
  CHECK(format_iso8601_millis(from_unix_millis(1704067200123)) == "2024-01-01T00:00:00.123Z");
  CHECK(format_iso8601_millis(from_unix_millis(951782400007)) == "2000-02-29T00:00:00.007Z");
}

TEST_CASE("from_unix_millis and to_unix_millis are inverses", "[time]") {
  for (const std::int64_t millis : {0LL, 1LL, 1704067200000LL, 4102444800999LL}) {
    CHECK(to_unix_millis(from_unix_millis(millis)) == millis);
  }
}
