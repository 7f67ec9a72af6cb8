#pragma once

#include "auditchain/core/result.h"
#include "auditchain/core/time.h"
#include "auditchain/domain/archive_checkpoint.h"
#include "auditchain/domain/audit_record.h"
#include "auditchain/domain/chain_scope.h"
#include "auditchain/storage/maintenance_window.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace auditchain::storage {

// ChainTip is what the next record of a scope must link to.
struct ChainTip {
  enum class Source {
    kGenesis,     // NOLINT(readability-identifier-naming)
    kRecord,      // NOLINT(readability-identifier-naming)
    kCheckpoint,  // NOLINT(readability-identifier-naming)
  };

  std::string hash;                           // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> created_at;  // NOLINT(readability-identifier-naming)
  Source source{Source::kGenesis};            // NOLINT(readability-identifier-naming)
};

// ChainWindow is a consistent snapshot of one scope for verification.
//
// records are ascending by chain order. predecessor is the live record just
// before records.front() when a limit truncated the window. checkpoints are
// every checkpoint of the scope, ascending by last_record_created_at.
struct ChainWindow {
  domain::ChainScope scope;                             // NOLINT(readability-identifier-naming)
  std::vector<domain::AuditRecord> records;             // NOLINT(readability-identifier-naming)
  std::optional<domain::AuditRecord> predecessor;       // NOLINT(readability-identifier-naming)
  std::vector<domain::ArchiveCheckpoint> checkpoints;   // NOLINT(readability-identifier-naming)
};

// RecordQuery filters the read-only reporting surface. Results are newest first.
struct RecordQuery {
  std::optional<std::string> action;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> resource_type;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> resource_id;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> actor_user_id;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> workspace_id;   // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> start;      // NOLINT(readability-identifier-naming)
  std::optional<core::Timestamp> end;        // NOLINT(readability-identifier-naming)
  std::size_t limit{100};                    // NOLINT(readability-identifier-naming)
  std::size_t offset{0};                     // NOLINT(readability-identifier-naming)
};

// IChainReader is the read capability the verifier and reporting need.
class IChainReader {
 public:
  virtual ~IChainReader() = default;

  // Snapshot of one scope. With a limit, only the newest `limit` records are
  // returned (plus their predecessor, if any).
  [[nodiscard]] virtual core::LedgerResult<ChainWindow> read_window(
      const domain::ChainScope& scope, std::optional<std::size_t> limit) const = 0;

  // Every scope that has at least one record or checkpoint.
  [[nodiscard]] virtual core::LedgerResult<std::vector<domain::ChainScope>> list_scopes()
      const = 0;

  [[nodiscard]] virtual core::LedgerResult<std::vector<domain::AuditRecord>> query(
      const RecordQuery& query) const = 0;

 protected:
  IChainReader() = default;
  IChainReader(const IChainReader&) = default;
  IChainReader& operator=(const IChainReader&) = default;
  IChainReader(IChainReader&&) = default;
  IChainReader& operator=(IChainReader&&) = default;
};

// ILedgerTransaction is an exclusive write transaction on one chain scope.
//
// While it is alive no other transaction on the same scope can begin, in
// this process or any other sharing the store. Destroying it without a
// successful commit() rolls back every change made through it.
//
// There is no update operation. Deletion requires a MaintenanceWindow that
// covers this transaction.
class ILedgerTransaction {
 public:
  virtual ~ILedgerTransaction() = default;

  [[nodiscard]] virtual const domain::ChainScope& scope() const = 0;

  // Tip as seen inside this transaction, including records inserted through it.
  [[nodiscard]] virtual core::LedgerResult<ChainTip> read_tip() = 0;

  [[nodiscard]] virtual core::LedgerResult<bool> insert_record(
      const domain::AuditRecord& record) = 0;

  // Records of this scope with created_at < cutoff, ascending.
  [[nodiscard]] virtual core::LedgerResult<std::vector<domain::AuditRecord>> select_older_than(
      core::Timestamp cutoff) = 0;

  [[nodiscard]] virtual core::LedgerResult<bool> insert_checkpoint(
      const domain::ArchiveCheckpoint& checkpoint) = 0;

  // Returns the number of rows removed.
  [[nodiscard]] virtual core::LedgerResult<std::size_t> delete_records(
      const std::vector<std::string>& record_ids, const MaintenanceWindow& window) = 0;

  [[nodiscard]] virtual core::LedgerResult<bool> commit() = 0;

 protected:
  ILedgerTransaction() = default;
  ILedgerTransaction(const ILedgerTransaction&) = default;
  ILedgerTransaction& operator=(const ILedgerTransaction&) = default;
  ILedgerTransaction(ILedgerTransaction&&) = default;
  ILedgerTransaction& operator=(ILedgerTransaction&&) = default;
};

// ILedgerStore is the durable home of the audit chain and its checkpoints.
class ILedgerStore : public IChainReader {
 public:
  ~ILedgerStore() override = default;

  // Acquires the scope lock, waiting at most lock_timeout.
  // Fails with kWriteConflict when the lock is not acquired in time.
  [[nodiscard]] virtual core::LedgerResult<std::unique_ptr<ILedgerTransaction>> begin(
      const domain::ChainScope& scope, std::chrono::milliseconds lock_timeout) = 0;

  // Approximate bytes held by the ledger, for health reporting.
  [[nodiscard]] virtual core::LedgerResult<std::int64_t> storage_size_bytes() const = 0;

 protected:
  ILedgerStore() = default;
  ILedgerStore(const ILedgerStore&) = default;
  ILedgerStore& operator=(const ILedgerStore&) = default;
  ILedgerStore(ILedgerStore&&) = default;
  ILedgerStore& operator=(ILedgerStore&&) = default;
};

}  // namespace auditchain::storage
