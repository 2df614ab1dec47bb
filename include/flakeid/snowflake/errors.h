#pragma once

#include <cstdint>
#include <string>

namespace flakeid::snowflake {

// Error types following E.14 (use purpose-designed types as error indicators).

enum class ConfigurationErrorCode {
  kNodeIdOutOfRange,  // NOLINT(readability-identifier-naming)
  kNodeIdMalformed,   // NOLINT(readability-identifier-naming)
};

// ConfigurationError is raised once, at startup. A process that receives one must not mint IDs.
struct ConfigurationError {
  ConfigurationErrorCode code;  // NOLINT(readability-identifier-naming)
  std::string detail;           // NOLINT(readability-identifier-naming)
};

// ClockRegressionError reports a clock reading earlier than the last timestamp used to mint
// an ID (or earlier than kEpochMillis before the first ID; last_millis then holds the epoch).
// Recoverable: the generator state is untouched and a later call succeeds once the
// clock catches up.
struct ClockRegressionError {
  std::int64_t observed_millis;  // NOLINT(readability-identifier-naming)
  std::int64_t last_millis;      // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::int64_t drift_millis() const { return last_millis - observed_millis; }
};

[[nodiscard]] std::string to_string(ConfigurationErrorCode code);

[[nodiscard]] std::string describe(const ConfigurationError& error);
[[nodiscard]] std::string describe(const ClockRegressionError& error);

}  // namespace flakeid::snowflake
