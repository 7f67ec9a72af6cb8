#pragma once

#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/core/result.h"
#include "auditchain/ledger/archive_manager.h"
#include "auditchain/ledger/archive_sink.h"
#include "auditchain/ledger/audit_ledger.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/immutability_guard.h"
#include "auditchain/ledger/ledger_config.h"
#include "auditchain/shipping/log_shipper.h"
#include "auditchain/storage/ledger_store.h"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace auditchain::app {

struct RuntimeOptions {
  // SQLite file; nullopt selects the ephemeral in-memory store.
  std::optional<std::string> db_path;  // NOLINT(readability-identifier-naming)
  // Open a second connection to db_path for verification and queries.
  bool separate_reader{false};              // NOLINT(readability-identifier-naming)
  std::optional<std::string> archive_dir;  // NOLINT(readability-identifier-naming)
  ledger::LedgerConfig ledger;             // NOLINT(readability-identifier-naming)
};

// LedgerRuntime is the composition root shared by the CLI and the server.
// It owns every ledger component and wires them in dependency order:
//   store -> appender -> guard -> archiver -> ledger
// Entry points choose the log shipper and hand it over.
class LedgerRuntime {
 public:
  // Opens the store (applying schema migrations for SQLite) and builds the
  // components. shipper == nullptr selects NullLogShipper.
  [[nodiscard]] static core::Result<std::unique_ptr<LedgerRuntime>, std::string> open(
      const RuntimeOptions& options, std::unique_ptr<shipping::ILogShipper> shipper,
      std::ostream& log);

  ~LedgerRuntime();

  LedgerRuntime(const LedgerRuntime&) = delete;
  LedgerRuntime& operator=(const LedgerRuntime&) = delete;
  LedgerRuntime(LedgerRuntime&&) = delete;
  LedgerRuntime& operator=(LedgerRuntime&&) = delete;

  [[nodiscard]] ledger::AuditLedger& ledger() { return *ledger_; }
  [[nodiscard]] storage::ILedgerStore& store() { return *store_; }
  [[nodiscard]] core::IClock& clock() { return clock_; }
  [[nodiscard]] bool is_persistent() const { return persistent_; }

 private:
  LedgerRuntime() = default;

  core::SystemClock clock_;
  core::SystemIdGenerator ids_;
  bool persistent_{false};
  std::unique_ptr<storage::ILedgerStore> store_;
  std::unique_ptr<shipping::ILogShipper> shipper_;
  std::unique_ptr<ledger::IArchiveSink> sink_;
  std::unique_ptr<ledger::ChainAppender> appender_;
  std::unique_ptr<ledger::ImmutabilityGuard> guard_;
  std::unique_ptr<ledger::ArchiveManager> archiver_;
  std::unique_ptr<ledger::AuditLedger> ledger_;
};

}  // namespace auditchain::app
