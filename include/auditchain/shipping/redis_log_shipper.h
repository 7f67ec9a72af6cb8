#pragma once

#ifdef AUDITCHAIN_STORAGE_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit; use interfaces only."
#endif

#include "auditchain/shipping/log_shipper.h"
#include "auditchain/shipping/redis_config.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw::redis {
class Redis;
}  // namespace sw::redis

namespace auditchain::shipping {

// RedisLogShipper appends each committed record to a Redis stream.
//
// Stream entry fields:
//   id      record id
//   scope   "global" or "workspace:<id>"
//   action  record action
//   record  the record as JSON
// The stream is trimmed to roughly stream_maxlen entries (XADD MAXLEN ~).
//
// One XADD per record, no retry: a failed delivery is reported and dropped.
class RedisLogShipper final : public ILogShipper {
 public:
  // Connects and sends PING. Throws std::runtime_error if Redis is unreachable.
  explicit RedisLogShipper(RedisConfig config);

  ~RedisLogShipper() override;

  // Disable copy/move (unique_ptr to connection)
  RedisLogShipper(const RedisLogShipper&) = delete;
  RedisLogShipper& operator=(const RedisLogShipper&) = delete;
  RedisLogShipper(RedisLogShipper&&) = delete;
  RedisLogShipper& operator=(RedisLogShipper&&) = delete;

  [[nodiscard]] ShipResult ship(const domain::AuditRecord& record) override;
  [[nodiscard]] std::string status() const override;

  [[nodiscard]] std::string last_error() const;

 private:
  RedisConfig config_;
  std::unique_ptr<sw::redis::Redis> redis_;
  std::atomic<bool> healthy_{true};
  mutable std::mutex error_mutex_;
  std::string last_error_;
};

}  // namespace auditchain::shipping
