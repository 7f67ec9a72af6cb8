#pragma once

#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/core/result.h"
#include "auditchain/domain/archive_checkpoint.h"
#include "auditchain/domain/chain_scope.h"
#include "auditchain/ledger/archive_sink.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/immutability_guard.h"
#include "auditchain/storage/ledger_store.h"

#include <cstddef>
#include <optional>
#include <string>

namespace auditchain::ledger {

struct ArchiveRequest {
  domain::ChainScope scope;                  // NOLINT(readability-identifier-naming)
  core::Timestamp older_than;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> actor_user_id;  // NOLINT(readability-identifier-naming)
  bool dry_run{false};                       // NOLINT(readability-identifier-naming)
};

struct ArchiveOutcome {
  // Written checkpoint, or the one that would be written on a dry run.
  // nullopt when no record was old enough.
  std::optional<domain::ArchiveCheckpoint> checkpoint;  // NOLINT(readability-identifier-naming)
  std::size_t records_archived{0};                      // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> oldest_archived;       // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> newest_archived;       // NOLINT(readability-identifier-naming)
  bool dry_run{false};                                  // NOLINT(readability-identifier-naming)
};

// ArchiveManager removes the records of a scope older than a cutoff and
// leaves a checkpoint anchoring the chain across the gap.
//
// One transaction, holding the scope lock throughout:
//   select records with created_at < older_than
//   export them to the sink, when one is configured
//   inside a maintenance window:
//     insert the checkpoint (newest selected record's id, created_at, hash)
//     append audit.records_archived
//     delete the selected records
//   commit
//
// Checkpoint and deletion commit together or not at all.
class ArchiveManager {
 public:
  ArchiveManager(storage::ILedgerStore& store, ChainAppender& appender, ImmutabilityGuard& guard,
                 core::IIdGenerator& ids, core::IClock& clock, IArchiveSink* sink = nullptr);

  // Errors: kWriteConflict, kStorageError (including sink failure),
  //         kImmutabilityViolation, kArchivalInconsistency.
  [[nodiscard]] core::LedgerResult<ArchiveOutcome> archive(const ArchiveRequest& request);

 private:
  storage::ILedgerStore& store_;
  ChainAppender& appender_;
  ImmutabilityGuard& guard_;
  core::IIdGenerator& ids_;
  core::IClock& clock_;
  IArchiveSink* sink_;
};

// Cutoff for a retention policy of `months` calendar months before now.
[[nodiscard]] core::Timestamp retention_cutoff(core::Timestamp now, int months);

}  // namespace auditchain::ledger
