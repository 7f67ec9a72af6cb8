#pragma once

#ifdef AUDITCHAIN_STORAGE_BOUNDARY_GUARD
#error "Concrete storage/redis header included in a guarded translation unit; use interfaces only."
#endif

#include "auditchain/storage/ledger_store.h"
#include "auditchain/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace auditchain::storage::sqlite {

class SqliteLedgerTransaction;

// SqliteLedgerStore implements ILedgerStore on SQLite (schema v2).
//
// Write transactions use BEGIN IMMEDIATE, so the RESERVED lock serializes
// appenders across every process sharing the file. sqlite3_busy_timeout bounds
// the wait; a timed mutex serializes threads sharing this connection.
//
// Reads run inside a read transaction for a consistent snapshot. When a
// separate reader connection to the same file is supplied (WAL mode), reads
// never wait for writers; otherwise they share the writer connection.
//
// UPDATE and DELETE are rejected by triggers; deletion is permitted only inside
// a transaction holding a MaintenanceWindow.
class SqliteLedgerStore final : public ILedgerStore {
 public:
  explicit SqliteLedgerStore(std::shared_ptr<SqliteDb> db,
                             std::shared_ptr<SqliteDb> reader = nullptr);
  ~SqliteLedgerStore() override = default;

  SqliteLedgerStore(const SqliteLedgerStore&) = delete;
  SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;
  SqliteLedgerStore(SqliteLedgerStore&&) = delete;
  SqliteLedgerStore& operator=(SqliteLedgerStore&&) = delete;

  [[nodiscard]] core::LedgerResult<ChainWindow> read_window(
      const domain::ChainScope& scope, std::optional<std::size_t> limit) const override;
  [[nodiscard]] core::LedgerResult<std::vector<domain::ChainScope>> list_scopes() const override;
  [[nodiscard]] core::LedgerResult<std::vector<domain::AuditRecord>> query(
      const RecordQuery& query) const override;

  [[nodiscard]] core::LedgerResult<std::unique_ptr<ILedgerTransaction>> begin(
      const domain::ChainScope& scope, std::chrono::milliseconds lock_timeout) override;
  [[nodiscard]] core::LedgerResult<std::int64_t> storage_size_bytes() const override;

 private:
  // Connection for reads plus the lock guarding it.
  struct ReadHandle {
    std::unique_lock<std::timed_mutex> writer_lock;  // NOLINT(readability-identifier-naming)
    std::unique_lock<std::mutex> reader_lock;        // NOLINT(readability-identifier-naming)
    sqlite3* connection{nullptr};                    // NOLINT(readability-identifier-naming)
  };

  [[nodiscard]] ReadHandle acquire_reader() const;

  std::shared_ptr<SqliteDb> db_;
  std::shared_ptr<SqliteDb> reader_;
  mutable std::timed_mutex write_mutex_;
  mutable std::mutex reader_mutex_;
};

}  // namespace auditchain::storage::sqlite
