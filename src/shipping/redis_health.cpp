#include "auditchain/shipping/redis_health.h"

#include "auditchain/shipping/redis_config.h"

#include <sw/redis++/redis++.h>

namespace auditchain::shipping {

RedisHealthResult redis_ping(const std::string& uri) {
  const auto config = parse_redis_uri(uri);
  if (!config.has_value()) {
    return RedisHealthResult{false, "invalid Redis URI '" + uri + "'"};
  }

  try {
    sw::redis::Redis redis(redis_connection_uri(config.value()));
    redis.ping();
    return RedisHealthResult{true, ""};
  } catch (const std::exception& e) {
    return RedisHealthResult{false, e.what()};
  }
}

}  // namespace auditchain::shipping
