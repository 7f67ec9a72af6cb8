#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace auditchain::shipping {

inline constexpr const char* kDefaultStreamKey = "auditchain:records";
inline constexpr std::size_t kDefaultStreamMaxLen = 100000;

// RedisConfig holds a parsed and validated Redis URI for log shipping.
//
// URI formats accepted:
//   tcp://host:port
//   redis://host:port
//   tcp://host          (port defaults to 6379)
//   redis://host:port/N (N = database index, redis:// scheme only)
// followed by an optional query string:
//   ?stream=<key>&maxlen=<n>
struct RedisConfig {
  std::string uri;                                // NOLINT(readability-identifier-naming)
  std::string host;                               // NOLINT(readability-identifier-naming)
  int port{6379};                                 // NOLINT(readability-identifier-naming)
  int redis_db{0};                                // NOLINT(readability-identifier-naming)
  std::string stream_key{kDefaultStreamKey};      // NOLINT(readability-identifier-naming)
  std::size_t stream_maxlen{kDefaultStreamMaxLen};  // NOLINT(readability-identifier-naming)
};

// parse_redis_uri attempts to parse a Redis URI string.
// Returns RedisConfig on success, nullopt if the format is not recognised.
//
// Rejects: empty string, no recognised scheme, missing host, invalid port,
// a /N path on tcp://, unknown or empty query parameters, maxlen == 0.
//
// No dependency on redis++; pure string parsing.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// Connection URI for redis++ (scheme, host, port, db; no query string).
[[nodiscard]] std::string redis_connection_uri(const RedisConfig& config);

// redis_config_to_log_string returns a deterministic, human-readable
// representation of a RedisConfig for startup diagnostics.
// Format: "host:port/db stream=<key>"
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace auditchain::shipping
