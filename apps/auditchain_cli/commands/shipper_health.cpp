#include "shipper_health.h"

#include "auditchain/shipping/redis_config.h"
#include "auditchain/shipping/redis_health.h"

#include "exit_codes.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ShipperHealthCliConfig {
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_shipper_health(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<auditchain::apps::Option<ShipperHealthCliConfig>> options = {
      {"--redis", true, "Redis URI (e.g. tcp://127.0.0.1:6379?stream=audit)",
       [](ShipperHealthCliConfig& c, const std::string& v) {
         c.redis_uri = v;
         return true;
       }},
  };
  auto config = auditchain::apps::parse_options(argc, argv, options, 2);

  if (!config.redis_uri.has_value()) {
    std::cerr << "Error: --redis <uri> is required\n";
    return kExitError;
  }

  const auto parsed = auditchain::shipping::parse_redis_uri(config.redis_uri.value());
  if (!parsed.has_value()) {
    std::cerr << "Error: invalid Redis URI '" << config.redis_uri.value() << "'\n"
              << "Accepted formats: tcp://host:port, redis://host:port/N, tcp://host"
                 " with optional ?stream=<key>&maxlen=<n>\n";
    return kExitError;
  }

  const auto result = auditchain::shipping::redis_ping(config.redis_uri.value());
  if (result.reachable) {
    std::cout << "OK: Redis reachable at "
              << auditchain::shipping::redis_config_to_log_string(parsed.value()) << "\n";
    return kExitOk;
  }

  std::cerr << "ERROR: " << result.error << "\n";
  return kExitError;
}
