#pragma once

#include <atomic>
#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos control time explicitly.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock time in milliseconds since the Unix epoch (UTC).
  // Contract: safe to call concurrently from multiple threads.
  virtual std::int64_t now_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
// Readings may move backwards when the host clock is adjusted (NTP, manual changes).
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_millis() override;
};

// Manual clock: returns whatever was last set, for deterministic tests/demos.
// Thread-safe. Time only moves when set() or advance() is called.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::int64_t start_millis) : millis_(start_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::int64_t now_millis() override;

  void set(std::int64_t millis);

  // Move the clock by delta milliseconds (negative delta moves it backwards).
  void advance(std::int64_t delta_millis);

 private:
  std::atomic<std::int64_t> millis_;
};

}  // namespace flakeid::core
