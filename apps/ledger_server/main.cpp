#include "auditchain/app/ledger_runtime.h"
#include "auditchain/core/version.h"
#include "auditchain/shipping/log_shipper.h"
#include "auditchain/shipping/redis_config.h"
#include "auditchain/shipping/redis_log_shipper.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

using namespace auditchain;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto config = server::parse_args(argc, argv);

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_ledger_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  // Every subsystem announces its operational mode. Ephemeral and degraded
  // modes are logged as explicit WARNINGs.
  std::cerr << "auditchain ledger server v" << core::kBuildVersion << "\n";

  if (config.db_path.has_value()) {
    std::cerr << "Storage:     SQLite -- " << config.db_path.value()
              << (config.separate_reader ? " (separate reader connection)" : "") << "\n";
  } else {
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         The audit chain and its checkpoints will be LOST on process exit.\n"
                 "         Pass --db <path> to enable persistence.\n";
  }

  std::unique_ptr<shipping::ILogShipper> shipper;
  if (config.redis_uri.has_value()) {
    // Format was validated above.
    const auto redis_cfg = shipping::parse_redis_uri(config.redis_uri.value());
    try {
      shipper = std::make_unique<shipping::RedisLogShipper>(redis_cfg.value());
      std::cerr << "Shipping:    Redis stream -- "
                << shipping::redis_config_to_log_string(redis_cfg.value()) << "\n";
    } catch (const std::exception& e) {
      std::cerr << "WARNING: " << e.what() << "\n"
                << "         Log shipping DISABLED; records are still committed to the chain.\n";
    }
  } else {
    std::cerr << "Shipping:    disabled (pass --redis <uri> to forward records)\n";
  }

  if (config.archive_dir.has_value()) {
    std::cerr << "Archive:     JSONL -- " << config.archive_dir.value() << "\n";
  } else {
    std::cerr << "Archive:     no export (archived records are deleted after checkpointing)\n";
  }

  app::RuntimeOptions options;
  options.db_path = config.db_path;
  options.separate_reader = config.separate_reader;
  options.archive_dir = config.archive_dir;
  options.ledger.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms);
  options.ledger.append_attempts = config.append_attempts;

  auto runtime_result = app::LedgerRuntime::open(options, std::move(shipper), std::cerr);
  if (!runtime_result.has_value()) {
    std::cerr << "Error: " << runtime_result.error() << "\n";
    return 1;
  }
  auto runtime = std::move(runtime_result.value());

  if (!server::run_startup_verification(config.verify_on_startup, runtime->ledger(), std::cerr)) {
    return 1;
  }

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  server::ServerContext ctx{runtime->ledger(), runtime->clock(), config};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
