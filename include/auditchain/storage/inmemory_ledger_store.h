#pragma once

#include "auditchain/storage/ledger_store.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace auditchain::storage {

class InMemoryLedgerTransaction;

// InMemoryLedgerStore keeps the chain in process memory.
//
// Used for ephemeral server mode and unit tests. Writers to one scope are
// serialized by a per-scope timed mutex; changes are staged in the transaction
// and become visible atomically on commit. Each scope keeps an index of its
// links and ids, so tip reads and fork checks do not scan the chain.
class InMemoryLedgerStore final : public ILedgerStore {
 public:
  InMemoryLedgerStore() = default;
  ~InMemoryLedgerStore() override = default;

  InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore(InMemoryLedgerStore&&) = delete;
  InMemoryLedgerStore& operator=(InMemoryLedgerStore&&) = delete;

  [[nodiscard]] core::LedgerResult<ChainWindow> read_window(
      const domain::ChainScope& scope, std::optional<std::size_t> limit) const override;
  [[nodiscard]] core::LedgerResult<std::vector<domain::ChainScope>> list_scopes() const override;
  [[nodiscard]] core::LedgerResult<std::vector<domain::AuditRecord>> query(
      const RecordQuery& query) const override;

  [[nodiscard]] core::LedgerResult<std::unique_ptr<ILedgerTransaction>> begin(
      const domain::ChainScope& scope, std::chrono::milliseconds lock_timeout) override;
  [[nodiscard]] core::LedgerResult<std::int64_t> storage_size_bytes() const override;

 private:
  friend class InMemoryLedgerTransaction;

  struct StoredRecord {
    std::uint64_t sequence;      // NOLINT(readability-identifier-naming)
    domain::AuditRecord record;  // NOLINT(readability-identifier-naming)
  };

  // Committed state of one scope.
  struct ScopeChain {
    std::vector<StoredRecord> records;  // NOLINT(readability-identifier-naming)
    // previous_hash -> id of the record that links to it.
    std::map<std::string, std::string> links;  // NOLINT(readability-identifier-naming)
    std::set<std::string> ids;                 // NOLINT(readability-identifier-naming)
    // Ascending by last_record_created_at.
    std::vector<domain::ArchiveCheckpoint> checkpoints;  // NOLINT(readability-identifier-naming)
  };

  std::timed_mutex& scope_lock(const domain::ChainScope& scope);

  mutable std::mutex data_mutex_;
  std::map<std::optional<std::string>, ScopeChain> chains_;
  std::uint64_t next_sequence_{0};
  std::map<std::optional<std::string>, std::unique_ptr<std::timed_mutex>> scope_locks_;
};

}  // namespace auditchain::storage
