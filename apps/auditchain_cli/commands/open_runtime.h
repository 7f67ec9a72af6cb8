#pragma once

#include "auditchain/app/ledger_runtime.h"

#include <memory>
#include <optional>
#include <string>

// CliStoreConfig is the storage and shipping part of every subcommand's flags.
struct CliStoreConfig {
  std::string db_path{"data/auditchain.db"};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> archive_dir;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;       // NOLINT(readability-identifier-naming)
};

// Opens the SQLite ledger at config.db_path (creating its directory) and, when
// redis_uri is set, connects the Redis log shipper.
// Prints an Error: line and returns nullptr on failure.
std::unique_ptr<auditchain::app::LedgerRuntime> open_runtime(const CliStoreConfig& config);
