#pragma once

#include <string>

namespace auditchain::shipping {

// RedisHealthResult holds the outcome of a redis_ping() call.
struct RedisHealthResult {
  bool reachable{false};  // NOLINT(readability-identifier-naming)
  std::string error;      // NOLINT(readability-identifier-naming)
};

// redis_ping opens a direct connection to the shipping target and sends PING.
// Accepts the same URI forms as parse_redis_uri. Never throws; all errors are
// reported in RedisHealthResult.error.
[[nodiscard]] RedisHealthResult redis_ping(const std::string& uri);

}  // namespace auditchain::shipping
