#pragma once

#include "auditchain/core/time.h"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace auditchain::core {

// Abstract clock interface for timestamp injection.
// Production code reads system time; tests drive a ManualClock.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current UTC time truncated to milliseconds.
  virtual Timestamp now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Manual clock: returns a settable instant for deterministic tests.
// Thread-safe; concurrent appenders may read it while a test advances it.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(Timestamp start) : millis_(to_unix_millis(start)) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  Timestamp now() override;

  void set(Timestamp ts);
  void advance(std::chrono::milliseconds delta);

 private:
  std::atomic<std::int64_t> millis_;
};

}  // namespace auditchain::core
