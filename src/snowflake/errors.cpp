#include "flakeid/snowflake/errors.h"

namespace flakeid::snowflake {

std::string to_string(const ConfigurationErrorCode code) {
  switch (code) {
    case ConfigurationErrorCode::kNodeIdOutOfRange:
      return "node_id_out_of_range";
    case ConfigurationErrorCode::kNodeIdMalformed:
      return "node_id_malformed";
  }
  return "unknown";
}

std::string describe(const ConfigurationError& error) {
  return "configuration error (" + to_string(error.code) + "): " + error.detail;
}

std::string describe(const ClockRegressionError& error) {
  return "clock moved backwards by " + std::to_string(error.drift_millis()) +
         " ms (observed " + std::to_string(error.observed_millis) + ", last issued " +
         std::to_string(error.last_millis) + "); refusing to generate id";
}

}  // namespace flakeid::snowflake
