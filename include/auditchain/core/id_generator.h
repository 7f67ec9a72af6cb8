#pragma once

#include <atomic>
#include <mutex>
#include <random>
#include <string>

namespace auditchain::core {

// Abstract ID generator interface for dependency injection.
// Record and checkpoint IDs are UUID-formatted text and are never reused.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is a 36-character lower-case UUID string.
  virtual std::string next() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: random version-4 UUIDs.
// Thread-safe. Uniqueness across processes relies on 122 random bits per ID.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator();
  ~SystemIdGenerator() override = default;

  // Not copyable or movable (contains mutex)
  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next() override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

// Deterministic ID generator: sequential counter rendered in UUID shape.
// For tests where reproducible output is required.
// Thread-safe. Same sequence of next() calls produces same IDs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  // Not copyable or movable (contains atomic counter)
  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next() override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace auditchain::core
