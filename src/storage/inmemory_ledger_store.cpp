#include "auditchain/storage/inmemory_ledger_store.h"

#include "auditchain/ledger/record_hash.h"

#include <algorithm>
#include <set>

namespace auditchain::storage {

using core::LedgerErrorCode;
using domain::ArchiveCheckpoint;
using domain::AuditRecord;
using domain::ChainScope;

namespace {

bool checkpoint_before(const ArchiveCheckpoint& a, const ArchiveCheckpoint& b) {
  return a.last_record_created_at < b.last_record_created_at;
}

bool matches(const AuditRecord& record, const RecordQuery& q) {
  if (q.action.has_value() && record.action != q.action.value()) {
    return false;
  }
  if (q.resource_type.has_value() && record.resource_type != q.resource_type.value()) {
    return false;
  }
  if (q.resource_id.has_value() && record.resource_id != q.resource_id.value()) {
    return false;
  }
  if (q.actor_user_id.has_value() && record.actor_user_id != q.actor_user_id) {
    return false;
  }
  if (q.workspace_id.has_value() && record.workspace_id != q.workspace_id) {
    return false;
  }
  if (q.start.has_value() && record.created_at < q.start.value()) {
    return false;
  }
  if (q.end.has_value() && record.created_at > q.end.value()) {
    return false;
  }
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Transaction
// ────────────────────────────────────────────────────────────────

class InMemoryLedgerTransaction final : public ILedgerTransaction {
 public:
  InMemoryLedgerTransaction(InMemoryLedgerStore& store, ChainScope scope,
                            std::unique_lock<std::timed_mutex> lock)
      : store_(store), scope_(std::move(scope)), lock_(std::move(lock)) {}
  ~InMemoryLedgerTransaction() override = default;

  InMemoryLedgerTransaction(const InMemoryLedgerTransaction&) = delete;
  InMemoryLedgerTransaction& operator=(const InMemoryLedgerTransaction&) = delete;
  InMemoryLedgerTransaction(InMemoryLedgerTransaction&&) = delete;
  InMemoryLedgerTransaction& operator=(InMemoryLedgerTransaction&&) = delete;

  [[nodiscard]] const ChainScope& scope() const override { return scope_; }

  core::LedgerResult<ChainTip> read_tip() override {
    if (finished_) {
      return finished_error<ChainTip>();
    }
    if (!staged_records_.empty()) {
      const auto& last = staged_records_.back();
      return core::LedgerResult<ChainTip>::ok(
          ChainTip{last.record_hash, last.created_at, ChainTip::Source::kRecord});
    }

    std::optional<ArchiveCheckpoint> latest;
    {
      std::lock_guard<std::mutex> data_lock(store_.data_mutex_);
      if (const auto* chain = committed_chain()) {
        // Archival deletes from the front, so the live tip is found near the back.
        for (auto it = chain->records.rbegin(); it != chain->records.rend(); ++it) {
          if (!deleted_ids_.contains(it->record.id)) {
            return core::LedgerResult<ChainTip>::ok(ChainTip{
                it->record.record_hash, it->record.created_at, ChainTip::Source::kRecord});
          }
        }
        if (!chain->checkpoints.empty()) {
          latest = chain->checkpoints.back();
        }
      }
    }
    for (const auto& checkpoint : staged_checkpoints_) {
      if (!latest.has_value() || !checkpoint_before(checkpoint, latest.value())) {
        latest = checkpoint;
      }
    }
    if (latest.has_value()) {
      return core::LedgerResult<ChainTip>::ok(ChainTip{latest->last_record_hash,
                                                       latest->last_record_created_at,
                                                       ChainTip::Source::kCheckpoint});
    }

    return core::LedgerResult<ChainTip>::ok(
        ChainTip{std::string(ledger::kGenesisHash), std::nullopt, ChainTip::Source::kGenesis});
  }

  core::LedgerResult<bool> insert_record(const AuditRecord& record) override {
    if (finished_) {
      return finished_error<bool>();
    }
    if (record.scope() != scope_) {
      return core::ledger_error<bool>(LedgerErrorCode::kInvalidInput,
                                      "record " + record.id + " does not belong to scope " +
                                          domain::to_string(scope_));
    }
    if (const auto malformed = ledger::record_format_error(record); !malformed.empty()) {
      return core::ledger_error<bool>(LedgerErrorCode::kInvalidInput, malformed);
    }

    bool duplicate_id = false;
    bool forked = false;
    {
      std::lock_guard<std::mutex> data_lock(store_.data_mutex_);
      if (const auto* chain = committed_chain()) {
        duplicate_id = chain->ids.contains(record.id) && !deleted_ids_.contains(record.id);
        const auto link = chain->links.find(record.previous_hash);
        forked = link != chain->links.end() && !deleted_ids_.contains(link->second);
      }
    }
    for (const auto& staged : staged_records_) {
      duplicate_id = duplicate_id || staged.id == record.id;
      forked = forked || staged.previous_hash == record.previous_hash;
    }

    if (duplicate_id) {
      return core::ledger_error<bool>(LedgerErrorCode::kStorageError,
                                      "duplicate record id " + record.id);
    }
    if (forked) {
      return core::ledger_error<bool>(LedgerErrorCode::kWriteConflict,
                                      "another record already links to " + record.previous_hash);
    }

    staged_records_.push_back(record);
    return core::LedgerResult<bool>::ok(true);
  }

  core::LedgerResult<std::vector<AuditRecord>> select_older_than(core::Timestamp cutoff) override {
    if (finished_) {
      return finished_error<std::vector<AuditRecord>>();
    }
    std::vector<AuditRecord> out;
    {
      std::lock_guard<std::mutex> data_lock(store_.data_mutex_);
      if (const auto* chain = committed_chain()) {
        for (const auto& stored : chain->records) {
          if (stored.record.created_at < cutoff && !deleted_ids_.contains(stored.record.id)) {
            out.push_back(stored.record);
          }
        }
      }
    }
    for (const auto& record : staged_records_) {
      if (record.created_at < cutoff) {
        out.push_back(record);
      }
    }
    return core::LedgerResult<std::vector<AuditRecord>>::ok(std::move(out));
  }

  core::LedgerResult<bool> insert_checkpoint(const ArchiveCheckpoint& checkpoint) override {
    if (finished_) {
      return finished_error<bool>();
    }
    if (checkpoint.scope() != scope_) {
      return core::ledger_error<bool>(LedgerErrorCode::kInvalidInput,
                                      "checkpoint " + checkpoint.id +
                                          " does not belong to scope " + domain::to_string(scope_));
    }
    if (!ledger::is_hex_digest(checkpoint.last_record_hash)) {
      return core::ledger_error<bool>(LedgerErrorCode::kInvalidInput,
                                      "checkpoint " + checkpoint.id +
                                          " has a malformed last_record_hash");
    }
    staged_checkpoints_.push_back(checkpoint);
    return core::LedgerResult<bool>::ok(true);
  }

  core::LedgerResult<std::size_t> delete_records(const std::vector<std::string>& record_ids,
                                                 const MaintenanceWindow& window) override {
    if (finished_) {
      return finished_error<std::size_t>();
    }
    if (!window.covers(*this)) {
      return core::ledger_error<std::size_t>(
          LedgerErrorCode::kImmutabilityViolation,
          "immutability violation: audit records cannot be deleted outside maintenance");
    }

    std::size_t removed = 0;
    for (const auto& id : record_ids) {
      const auto staged = std::find_if(staged_records_.begin(), staged_records_.end(),
                                       [&](const AuditRecord& r) { return r.id == id; });
      if (staged != staged_records_.end()) {
        staged_records_.erase(staged);
        ++removed;
        continue;
      }
      if (deleted_ids_.contains(id)) {
        continue;
      }
      bool committed = false;
      {
        std::lock_guard<std::mutex> data_lock(store_.data_mutex_);
        const auto* chain = committed_chain();
        committed = chain != nullptr && chain->ids.contains(id);
      }
      if (committed) {
        deleted_ids_.insert(id);
        ++removed;
      }
    }
    return core::LedgerResult<std::size_t>::ok(removed);
  }

  core::LedgerResult<bool> commit() override {
    if (finished_) {
      return finished_error<bool>();
    }

    {
      std::lock_guard<std::mutex> data_lock(store_.data_mutex_);
      auto& chain = store_.chains_[scope_.workspace_id];

      if (!deleted_ids_.empty()) {
        auto& records = chain.records;
        for (const auto& stored : records) {
          if (deleted_ids_.contains(stored.record.id)) {
            chain.ids.erase(stored.record.id);
            chain.links.erase(stored.record.previous_hash);
          }
        }
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const InMemoryLedgerStore::StoredRecord& stored) {
                                       return deleted_ids_.contains(stored.record.id);
                                     }),
                      records.end());
      }

      for (auto& record : staged_records_) {
        chain.ids.insert(record.id);
        chain.links.emplace(record.previous_hash, record.id);
        chain.records.push_back(
            InMemoryLedgerStore::StoredRecord{store_.next_sequence_++, std::move(record)});
      }

      for (auto& checkpoint : staged_checkpoints_) {
        const auto at = std::upper_bound(chain.checkpoints.begin(), chain.checkpoints.end(),
                                         checkpoint, checkpoint_before);
        chain.checkpoints.insert(at, std::move(checkpoint));
      }
    }

    staged_records_.clear();
    staged_checkpoints_.clear();
    deleted_ids_.clear();
    finished_ = true;
    lock_.unlock();
    return core::LedgerResult<bool>::ok(true);
  }

 private:
  template <typename T>
  static core::LedgerResult<T> finished_error() {
    return core::ledger_error<T>(LedgerErrorCode::kStorageError, "transaction already finished");
  }

  // Requires store_.data_mutex_.
  const InMemoryLedgerStore::ScopeChain* committed_chain() const {
    const auto it = store_.chains_.find(scope_.workspace_id);
    return it == store_.chains_.end() ? nullptr : &it->second;
  }

  InMemoryLedgerStore& store_;
  ChainScope scope_;
  std::unique_lock<std::timed_mutex> lock_;
  std::vector<AuditRecord> staged_records_;
  std::vector<ArchiveCheckpoint> staged_checkpoints_;
  std::set<std::string> deleted_ids_;
  bool finished_{false};
};

// ────────────────────────────────────────────────────────────────
// Store
// ────────────────────────────────────────────────────────────────

std::timed_mutex& InMemoryLedgerStore::scope_lock(const ChainScope& scope) {
  std::lock_guard<std::mutex> data_lock(data_mutex_);
  auto& slot = scope_locks_[scope.workspace_id];
  if (!slot) {
    slot = std::make_unique<std::timed_mutex>();
  }
  return *slot;
}

core::LedgerResult<std::unique_ptr<ILedgerTransaction>> InMemoryLedgerStore::begin(
    const ChainScope& scope, std::chrono::milliseconds lock_timeout) {
  using R = core::LedgerResult<std::unique_ptr<ILedgerTransaction>>;

  if (!scope.is_valid()) {
    return core::ledger_error<std::unique_ptr<ILedgerTransaction>>(
        LedgerErrorCode::kInvalidInput, "workspace_id of a chain scope must not be empty");
  }

  std::unique_lock<std::timed_mutex> lock(scope_lock(scope), std::defer_lock);
  if (!lock.try_lock_for(lock_timeout)) {
    return core::ledger_error<std::unique_ptr<ILedgerTransaction>>(
        LedgerErrorCode::kWriteConflict,
        "timed out waiting for the chain lock of " + domain::to_string(scope));
  }
  return R::ok(std::make_unique<InMemoryLedgerTransaction>(*this, scope, std::move(lock)));
}

core::LedgerResult<ChainWindow> InMemoryLedgerStore::read_window(
    const ChainScope& scope, std::optional<std::size_t> limit) const {
  std::lock_guard<std::mutex> data_lock(data_mutex_);

  ChainWindow window;
  window.scope = scope;
  const auto it = chains_.find(scope.workspace_id);
  if (it == chains_.end()) {
    return core::LedgerResult<ChainWindow>::ok(std::move(window));
  }
  const auto& chain = it->second;

  std::size_t first = 0;
  if (limit.has_value() && chain.records.size() > limit.value()) {
    first = chain.records.size() - limit.value();
    window.predecessor = chain.records[first - 1].record;
  }
  window.records.reserve(chain.records.size() - first);
  for (std::size_t i = first; i < chain.records.size(); ++i) {
    window.records.push_back(chain.records[i].record);
  }
  window.checkpoints = chain.checkpoints;

  return core::LedgerResult<ChainWindow>::ok(std::move(window));
}

core::LedgerResult<std::vector<ChainScope>> InMemoryLedgerStore::list_scopes() const {
  std::lock_guard<std::mutex> data_lock(data_mutex_);

  std::vector<ChainScope> scopes;
  for (const auto& [workspace_id, chain] : chains_) {
    if (!chain.records.empty() || !chain.checkpoints.empty()) {
      scopes.push_back(ChainScope{workspace_id});
    }
  }
  return core::LedgerResult<std::vector<ChainScope>>::ok(std::move(scopes));
}

core::LedgerResult<std::vector<AuditRecord>> InMemoryLedgerStore::query(
    const RecordQuery& q) const {
  std::lock_guard<std::mutex> data_lock(data_mutex_);

  std::vector<const StoredRecord*> matched;
  for (const auto& [workspace_id, chain] : chains_) {
    if (q.workspace_id.has_value() && workspace_id != q.workspace_id) {
      continue;
    }
    for (const auto& stored : chain.records) {
      if (matches(stored.record, q)) {
        matched.push_back(&stored);
      }
    }
  }
  // Newest first; commit order breaks timestamp ties.
  std::sort(matched.begin(), matched.end(), [](const StoredRecord* a, const StoredRecord* b) {
    if (a->record.created_at != b->record.created_at) {
      return a->record.created_at > b->record.created_at;
    }
    return a->sequence > b->sequence;
  });

  std::vector<AuditRecord> page;
  for (std::size_t i = q.offset; i < matched.size() && page.size() < q.limit; ++i) {
    page.push_back(matched[i]->record);
  }
  return core::LedgerResult<std::vector<AuditRecord>>::ok(std::move(page));
}

core::LedgerResult<std::int64_t> InMemoryLedgerStore::storage_size_bytes() const {
  std::lock_guard<std::mutex> data_lock(data_mutex_);

  std::int64_t total = 0;
  for (const auto& entry : chains_) {
    for (const auto& stored : entry.second.records) {
      const auto& record = stored.record;
      total += static_cast<std::int64_t>(record.id.size() + record.action.size() +
                                         record.resource_type.size() + record.resource_id.size() +
                                         record.details.dump().size() +
                                         record.previous_hash.size() + record.record_hash.size());
    }
  }
  return core::LedgerResult<std::int64_t>::ok(total);
}

}  // namespace auditchain::storage
