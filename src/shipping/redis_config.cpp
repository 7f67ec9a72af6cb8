#include "auditchain/shipping/redis_config.h"

#include <string_view>

namespace auditchain::shipping {

namespace {

std::optional<long long> parse_decimal(std::string_view text, long long max_value) {
  if (text.empty() || text.size() > 18) {
    return std::nullopt;
  }
  long long value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  if (value > max_value) {
    return std::nullopt;
  }
  return value;
}

bool apply_query(std::string_view query, RedisConfig& config) {
  while (!query.empty()) {
    const auto amp = query.find('&');
    const std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

    const auto eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == pair.size()) {
      return false;
    }
    const std::string_view key = pair.substr(0, eq);
    const std::string_view value = pair.substr(eq + 1);

    if (key == "stream") {
      config.stream_key = std::string{value};
    } else if (key == "maxlen") {
      const auto maxlen = parse_decimal(value, 1'000'000'000LL);
      if (!maxlen.has_value() || maxlen.value() == 0) {
        return false;
      }
      config.stream_maxlen = static_cast<std::size_t>(maxlen.value());
    } else {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return std::nullopt;
  }

  std::string_view view{uri};
  std::string_view rest;
  bool redis_scheme = false;

  if (view.starts_with("tcp://")) {
    rest = view.substr(6);
  } else if (view.starts_with("redis://")) {
    rest = view.substr(8);
    redis_scheme = true;
  } else {
    return std::nullopt;
  }

  RedisConfig config;
  config.uri = uri;

  const auto question = rest.find('?');
  if (question != std::string_view::npos) {
    if (!apply_query(rest.substr(question + 1), config)) {
      return std::nullopt;
    }
    rest = rest.substr(0, question);
  }

  const auto slash = rest.find('/');
  std::string_view host_port_view = rest.substr(0, slash);
  if (slash != std::string_view::npos) {
    if (!redis_scheme) {
      return std::nullopt;
    }
    const auto db = parse_decimal(rest.substr(slash + 1), 15);
    if (!db.has_value()) {
      return std::nullopt;
    }
    config.redis_db = static_cast<int>(db.value());
  }

  if (host_port_view.empty()) {
    return std::nullopt;
  }

  // Split on last colon to separate host from port.
  const auto colon_pos = host_port_view.rfind(':');
  if (colon_pos == std::string_view::npos) {
    config.host = std::string{host_port_view};
  } else {
    config.host = std::string{host_port_view.substr(0, colon_pos)};
    const auto port = parse_decimal(host_port_view.substr(colon_pos + 1), 65535);
    if (!port.has_value() || port.value() < 1) {
      return std::nullopt;
    }
    config.port = static_cast<int>(port.value());
  }

  if (config.host.empty()) {
    return std::nullopt;
  }

  return config;
}

std::string redis_connection_uri(const RedisConfig& config) {
  return "tcp://" + config.host + ":" + std::to_string(config.port) + "/" +
         std::to_string(config.redis_db);
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  return config.host + ":" + std::to_string(config.port) + "/" + std::to_string(config.redis_db) +
         " stream=" + config.stream_key;
}

}  // namespace auditchain::shipping
