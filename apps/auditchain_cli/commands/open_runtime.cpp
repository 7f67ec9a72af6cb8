#include "open_runtime.h"

#include "auditchain/shipping/redis_config.h"
#include "auditchain/shipping/redis_log_shipper.h"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

std::unique_ptr<auditchain::app::LedgerRuntime> open_runtime(const CliStoreConfig& config) {
  const std::filesystem::path db_file(config.db_path);
  if (db_file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_file.parent_path(), ec);
    if (ec) {
      std::cerr << "Error: cannot create directory " << db_file.parent_path() << ": "
                << ec.message() << "\n";
      return nullptr;
    }
  }

  std::unique_ptr<auditchain::shipping::ILogShipper> shipper;
  if (config.redis_uri.has_value()) {
    const auto redis_cfg = auditchain::shipping::parse_redis_uri(config.redis_uri.value());
    if (!redis_cfg.has_value()) {
      std::cerr << "Error: invalid Redis URI '" << config.redis_uri.value() << "'\n";
      return nullptr;
    }
    try {
      shipper = std::make_unique<auditchain::shipping::RedisLogShipper>(redis_cfg.value());
    } catch (const std::exception& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return nullptr;
    }
  }

  auditchain::app::RuntimeOptions options;
  options.db_path = config.db_path;
  options.archive_dir = config.archive_dir;

  auto runtime = auditchain::app::LedgerRuntime::open(options, std::move(shipper), std::cerr);
  if (!runtime.has_value()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return nullptr;
  }
  return std::move(runtime.value());
}
