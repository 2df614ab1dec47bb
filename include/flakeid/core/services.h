#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/snowflake/id_generator.h"

namespace flakeid::core {

// Services is a composition root that bundles the process-wide dependencies.
// It holds references (not ownership) to the clock and the ID generator.
// Entry points create the concrete instances, keep them alive for the process lifetime,
// and hand Services (or its members) to the components that need them.
struct Services {
  IClock& clock;                                    // NOLINT(readability-identifier-naming)
  snowflake::ISnowflakeIdGenerator& id_generator;  // NOLINT(readability-identifier-naming)

  Services(IClock& clock, snowflake::ISnowflakeIdGenerator& id_generator)
      : clock(clock), id_generator(id_generator) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace flakeid::core
