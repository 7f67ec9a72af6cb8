#include "auditchain/shipping/redis_log_shipper.h"

#include "auditchain/domain/record_json.h"

#include <stdexcept>
#include <sw/redis++/redis++.h>
#include <utility>
#include <vector>

namespace auditchain::shipping {

RedisLogShipper::RedisLogShipper(RedisConfig config) : config_(std::move(config)) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_connection_uri(config_));
    // Test connection
    redis_->ping();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisLogShipper::~RedisLogShipper() = default;

ShipResult RedisLogShipper::ship(const domain::AuditRecord& record) {
  const std::vector<std::pair<std::string, std::string>> fields = {
      {"id", record.id},
      {"scope", domain::to_string(record.scope())},
      {"action", record.action},
      {"record", domain::audit_record_to_json(record).dump()},
  };

  try {
    redis_->xadd(config_.stream_key, "*", fields.begin(), fields.end(),
                 static_cast<long long>(config_.stream_maxlen), true);
    healthy_.store(true, std::memory_order_release);
    return ShipResult{true, ""};
  } catch (const std::exception& e) {
    healthy_.store(false, std::memory_order_release);
    std::string error = "XADD " + config_.stream_key + " failed: " + e.what();
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_ = error;
    }
    return ShipResult{false, std::move(error)};
  }
}

std::string RedisLogShipper::status() const {
  return healthy_.load(std::memory_order_acquire) ? "ok" : "error";
}

std::string RedisLogShipper::last_error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

}  // namespace auditchain::shipping
