#include "auditchain/storage/sqlite/sqlite_ledger_store.h"

#include "auditchain/ledger/record_hash.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <iostream>
#include <string_view>

namespace auditchain::storage::sqlite {

using core::LedgerError;
using core::LedgerErrorCode;
using domain::ArchiveCheckpoint;
using domain::AuditRecord;
using domain::ChainScope;

namespace {

constexpr const char* kRecordColumns =
    "id, created_at, actor_user_id, workspace_id, action, resource_type, resource_id,"
    " details_json, ip_address, user_agent, previous_hash, record_hash";

constexpr const char* kCheckpointColumns =
    "id, workspace_id, last_record_id, last_record_created_at, last_record_hash,"
    " records_archived, archived_at, archive_location, archive_checksum, created_by";

// ── Error mapping ──────────────────────────────────────────────────────────

LedgerErrorCode classify(int rc, std::string_view message) {
  if (message.find("immutability violation") != std::string_view::npos ||
      rc == SQLITE_CONSTRAINT_TRIGGER) {
    return LedgerErrorCode::kImmutabilityViolation;
  }
  const int primary = rc & 0xff;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    return LedgerErrorCode::kWriteConflict;
  }
  if (primary == SQLITE_CONSTRAINT &&
      message.find("idx_audit_records_link") != std::string_view::npos) {
    return LedgerErrorCode::kWriteConflict;
  }
  return LedgerErrorCode::kStorageError;
}

LedgerError sqlite_error(sqlite3* db, int rc, const std::string& context) {
  const std::string message = sqlite3_errmsg(db);
  return LedgerError{classify(rc, message), context + ": " + message};
}

template <typename T>
core::LedgerResult<T> fail(sqlite3* db, int rc, const std::string& context) {
  return core::LedgerResult<T>::err(sqlite_error(db, rc, context));
}

template <typename T>
core::LedgerResult<T> prepare_failed(const PreparedStatement& stmt, const std::string& context) {
  return core::ledger_error<T>(LedgerErrorCode::kStorageError, context + ": " + stmt.error());
}

// ── Binding / reading ──────────────────────────────────────────────────────

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    bind_text(stmt, index, value.value());
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : "";  // NOLINT
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, col);
}

core::LedgerResult<core::Timestamp> column_timestamp(sqlite3_stmt* stmt, int col) {
  const std::string text = column_text(stmt, col);
  const auto parsed = core::parse_iso8601(text);
  if (!parsed.has_value()) {
    return core::ledger_error<core::Timestamp>(LedgerErrorCode::kStorageError,
                                               "stored timestamp is malformed: '" + text + "'");
  }
  return core::LedgerResult<core::Timestamp>::ok(parsed.value());
}

core::LedgerResult<AuditRecord> read_record(sqlite3_stmt* stmt) {
  AuditRecord record;
  record.id = column_text(stmt, 0);
  auto created_at = column_timestamp(stmt, 1);
  if (!created_at.has_value()) {
    return core::LedgerResult<AuditRecord>::err(created_at.error());
  }
  record.created_at = created_at.value();
  record.actor_user_id = column_optional_text(stmt, 2);
  record.workspace_id = column_optional_text(stmt, 3);
  record.action = column_text(stmt, 4);
  record.resource_type = column_text(stmt, 5);
  record.resource_id = column_text(stmt, 6);

  // details are not hashed; an unparsable value is surfaced verbatim.
  const std::string details = column_text(stmt, 7);
  auto parsed = nlohmann::json::parse(details, nullptr, false);
  record.details = parsed.is_discarded() ? nlohmann::json(details) : std::move(parsed);

  record.ip_address = column_optional_text(stmt, 8);
  record.user_agent = column_optional_text(stmt, 9);
  record.previous_hash = column_text(stmt, 10);
  record.record_hash = column_text(stmt, 11);
  return core::LedgerResult<AuditRecord>::ok(std::move(record));
}

core::LedgerResult<ArchiveCheckpoint> read_checkpoint(sqlite3_stmt* stmt) {
  ArchiveCheckpoint checkpoint;
  checkpoint.id = column_text(stmt, 0);
  checkpoint.workspace_id = column_optional_text(stmt, 1);
  checkpoint.last_record_id = column_text(stmt, 2);
  auto last_created = column_timestamp(stmt, 3);
  if (!last_created.has_value()) {
    return core::LedgerResult<ArchiveCheckpoint>::err(last_created.error());
  }
  checkpoint.last_record_created_at = last_created.value();
  checkpoint.last_record_hash = column_text(stmt, 4);
  checkpoint.records_archived = sqlite3_column_int64(stmt, 5);
  auto archived_at = column_timestamp(stmt, 6);
  if (!archived_at.has_value()) {
    return core::LedgerResult<ArchiveCheckpoint>::err(archived_at.error());
  }
  checkpoint.archived_at = archived_at.value();
  checkpoint.archive_location = column_optional_text(stmt, 7);
  checkpoint.archive_checksum = column_optional_text(stmt, 8);
  checkpoint.created_by = column_optional_text(stmt, 9);
  return core::LedgerResult<ArchiveCheckpoint>::ok(std::move(checkpoint));
}

// Steps a prepared SELECT, decoding every row with read_row.
template <typename T, typename ReadRow>
core::LedgerResult<std::vector<T>> collect_rows(sqlite3* db, sqlite3_stmt* stmt,
                                                ReadRow read_row, const std::string& context) {
  std::vector<T> rows;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto row = read_row(stmt);
    if (!row.has_value()) {
      return core::LedgerResult<std::vector<T>>::err(row.error());
    }
    rows.push_back(std::move(row.value()));
  }
  if (rc != SQLITE_DONE) {
    return fail<std::vector<T>>(db, rc, context);
  }
  return core::LedgerResult<std::vector<T>>::ok(std::move(rows));
}

core::LedgerResult<std::vector<ArchiveCheckpoint>> select_checkpoints(sqlite3* db,
                                                                      const ChainScope& scope) {
  const std::string sql = std::string("SELECT ") + kCheckpointColumns +
                          " FROM archive_checkpoints WHERE workspace_id IS ?1"
                          " ORDER BY last_record_created_at ASC, seq ASC";
  PreparedStatement stmt(db, sql);
  if (!stmt.is_valid()) {
    return prepare_failed<std::vector<ArchiveCheckpoint>>(stmt, "select checkpoints");
  }
  bind_optional_text(stmt.get(), 1, scope.workspace_id);
  return collect_rows<ArchiveCheckpoint>(db, stmt.get(), read_checkpoint, "select checkpoints");
}

// Read transaction: every SELECT inside it sees one snapshot.
class ReadTransaction {
 public:
  explicit ReadTransaction(sqlite3* db) : db_(db) {
    rc_ = sqlite3_exec(db_, "BEGIN", nullptr, nullptr, nullptr);
  }
  ~ReadTransaction() {
    if (rc_ == SQLITE_OK && sqlite3_get_autocommit(db_) == 0) {
      if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "WARNING: failed to close read transaction: " << sqlite3_errmsg(db_) << "\n";
      }
    }
  }

  ReadTransaction(const ReadTransaction&) = delete;
  ReadTransaction& operator=(const ReadTransaction&) = delete;
  ReadTransaction(ReadTransaction&&) = delete;
  ReadTransaction& operator=(ReadTransaction&&) = delete;

  [[nodiscard]] int status() const { return rc_; }

 private:
  sqlite3* db_;
  int rc_{SQLITE_OK};
};

}  // namespace

// ────────────────────────────────────────────────────────────────
// Transaction
// ────────────────────────────────────────────────────────────────

class SqliteLedgerTransaction final : public ILedgerTransaction {
 public:
  SqliteLedgerTransaction(sqlite3* db, ChainScope scope, std::unique_lock<std::timed_mutex> lock)
      : db_(db), scope_(std::move(scope)), lock_(std::move(lock)) {}

  ~SqliteLedgerTransaction() override {
    if (!finished_ && sqlite3_get_autocommit(db_) == 0) {
      if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "WARNING: ledger transaction rollback failed: " << sqlite3_errmsg(db_)
                  << "\n";
      }
    }
  }

  SqliteLedgerTransaction(const SqliteLedgerTransaction&) = delete;
  SqliteLedgerTransaction& operator=(const SqliteLedgerTransaction&) = delete;
  SqliteLedgerTransaction(SqliteLedgerTransaction&&) = delete;
  SqliteLedgerTransaction& operator=(SqliteLedgerTransaction&&) = delete;

  [[nodiscard]] const ChainScope& scope() const override { return scope_; }

  core::LedgerResult<ChainTip> read_tip() override {
    if (finished_) {
      return finished_error<ChainTip>();
    }

    {
      PreparedStatement stmt(db_,
                             "SELECT record_hash, created_at FROM audit_records"
                             " WHERE workspace_id IS ?1 ORDER BY created_at DESC, seq DESC"
                             " LIMIT 1");
      if (!stmt.is_valid()) {
        return prepare_failed<ChainTip>(stmt, "read chain tip");
      }
      bind_optional_text(stmt.get(), 1, scope_.workspace_id);
      const int rc = sqlite3_step(stmt.get());
      if (rc == SQLITE_ROW) {
        auto created_at = column_timestamp(stmt.get(), 1);
        if (!created_at.has_value()) {
          return core::LedgerResult<ChainTip>::err(created_at.error());
        }
        return core::LedgerResult<ChainTip>::ok(ChainTip{
            column_text(stmt.get(), 0), created_at.value(), ChainTip::Source::kRecord});
      }
      if (rc != SQLITE_DONE) {
        return fail<ChainTip>(db_, rc, "read chain tip");
      }
    }

    {
      PreparedStatement stmt(db_,
                             "SELECT last_record_hash, last_record_created_at"
                             " FROM archive_checkpoints WHERE workspace_id IS ?1"
                             " ORDER BY last_record_created_at DESC, seq DESC LIMIT 1");
      if (!stmt.is_valid()) {
        return prepare_failed<ChainTip>(stmt, "read checkpoint anchor");
      }
      bind_optional_text(stmt.get(), 1, scope_.workspace_id);
      const int rc = sqlite3_step(stmt.get());
      if (rc == SQLITE_ROW) {
        auto created_at = column_timestamp(stmt.get(), 1);
        if (!created_at.has_value()) {
          return core::LedgerResult<ChainTip>::err(created_at.error());
        }
        return core::LedgerResult<ChainTip>::ok(ChainTip{
            column_text(stmt.get(), 0), created_at.value(), ChainTip::Source::kCheckpoint});
      }
      if (rc != SQLITE_DONE) {
        return fail<ChainTip>(db_, rc, "read checkpoint anchor");
      }
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

    PreparedStatement stmt(db_, R"(
      INSERT INTO audit_records
        (id, created_at, actor_user_id, workspace_id, action, resource_type, resource_id,
         details_json, ip_address, user_agent, previous_hash, record_hash)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.is_valid()) {
      return prepare_failed<bool>(stmt, "insert audit record");
    }

    bind_text(stmt.get(), 1, record.id);
    bind_text(stmt.get(), 2, core::format_iso8601_millis(record.created_at));
    bind_optional_text(stmt.get(), 3, record.actor_user_id);
    bind_optional_text(stmt.get(), 4, record.workspace_id);
    bind_text(stmt.get(), 5, record.action);
    bind_text(stmt.get(), 6, record.resource_type);
    bind_text(stmt.get(), 7, record.resource_id);
    bind_text(stmt.get(), 8, record.details.dump());
    bind_optional_text(stmt.get(), 9, record.ip_address);
    bind_optional_text(stmt.get(), 10, record.user_agent);
    bind_text(stmt.get(), 11, record.previous_hash);
    bind_text(stmt.get(), 12, record.record_hash);

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
      return fail<bool>(db_, rc, "insert audit record " + record.id);
    }
    return core::LedgerResult<bool>::ok(true);
  }

  core::LedgerResult<std::vector<AuditRecord>> select_older_than(core::Timestamp cutoff) override {
    if (finished_) {
      return finished_error<std::vector<AuditRecord>>();
    }
    const std::string sql = std::string("SELECT ") + kRecordColumns +
                            " FROM audit_records WHERE workspace_id IS ?1 AND created_at < ?2"
                            " ORDER BY created_at ASC, seq ASC";
    PreparedStatement stmt(db_, sql);
    if (!stmt.is_valid()) {
      return prepare_failed<std::vector<AuditRecord>>(stmt, "select archivable records");
    }
    bind_optional_text(stmt.get(), 1, scope_.workspace_id);
    bind_text(stmt.get(), 2, core::format_iso8601_millis(cutoff));
    return collect_rows<AuditRecord>(db_, stmt.get(), read_record, "select archivable records");
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

    PreparedStatement stmt(db_, R"(
      INSERT INTO archive_checkpoints
        (id, workspace_id, last_record_id, last_record_created_at, last_record_hash,
         records_archived, archived_at, archive_location, archive_checksum, created_by)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.is_valid()) {
      return prepare_failed<bool>(stmt, "insert archive checkpoint");
    }

    bind_text(stmt.get(), 1, checkpoint.id);
    bind_optional_text(stmt.get(), 2, checkpoint.workspace_id);
    bind_text(stmt.get(), 3, checkpoint.last_record_id);
    bind_text(stmt.get(), 4, core::format_iso8601_millis(checkpoint.last_record_created_at));
    bind_text(stmt.get(), 5, checkpoint.last_record_hash);
    sqlite3_bind_int64(stmt.get(), 6, checkpoint.records_archived);
    bind_text(stmt.get(), 7, core::format_iso8601_millis(checkpoint.archived_at));
    bind_optional_text(stmt.get(), 8, checkpoint.archive_location);
    bind_optional_text(stmt.get(), 9, checkpoint.archive_checksum);
    bind_optional_text(stmt.get(), 10, checkpoint.created_by);

    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
      return fail<bool>(db_, rc, "insert archive checkpoint " + checkpoint.id);
    }
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

    auto raised = set_maintenance_flag(window.id());
    if (!raised.has_value()) {
      return core::LedgerResult<std::size_t>::err(raised.error());
    }

    auto removed = delete_rows(record_ids);

    // Lower the flag even when deletion failed; the transaction may still be rolled back.
    auto lowered = set_maintenance_flag(std::nullopt);
    if (!removed.has_value()) {
      return removed;
    }
    if (!lowered.has_value()) {
      return core::LedgerResult<std::size_t>::err(lowered.error());
    }
    return removed;
  }

  core::LedgerResult<bool> commit() override {
    if (finished_) {
      return finished_error<bool>();
    }
    const int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
      return fail<bool>(db_, rc, "commit ledger transaction");
    }
    finished_ = true;
    lock_.unlock();
    return core::LedgerResult<bool>::ok(true);
  }

 private:
  template <typename T>
  static core::LedgerResult<T> finished_error() {
    return core::ledger_error<T>(LedgerErrorCode::kStorageError, "transaction already finished");
  }

  core::LedgerResult<bool> set_maintenance_flag(const std::optional<std::string>& window_id) {
    PreparedStatement stmt(db_,
                           "UPDATE ledger_maintenance SET active = ?1, window_id = ?2 WHERE id = 1");
    if (!stmt.is_valid()) {
      return prepare_failed<bool>(stmt, "toggle maintenance flag");
    }
    sqlite3_bind_int(stmt.get(), 1, window_id.has_value() ? 1 : 0);
    bind_optional_text(stmt.get(), 2, window_id);
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
      return fail<bool>(db_, rc, "toggle maintenance flag");
    }
    return core::LedgerResult<bool>::ok(true);
  }

  core::LedgerResult<std::size_t> delete_rows(const std::vector<std::string>& record_ids) {
    PreparedStatement stmt(db_, "DELETE FROM audit_records WHERE id = ?1 AND workspace_id IS ?2");
    if (!stmt.is_valid()) {
      return prepare_failed<std::size_t>(stmt, "delete archived records");
    }

    std::size_t removed = 0;
    for (const auto& id : record_ids) {
      stmt.reset();
      bind_text(stmt.get(), 1, id);
      bind_optional_text(stmt.get(), 2, scope_.workspace_id);
      const int rc = sqlite3_step(stmt.get());
      if (rc != SQLITE_DONE) {
        return fail<std::size_t>(db_, rc, "delete audit record " + id);
      }
      removed += static_cast<std::size_t>(sqlite3_changes(db_));
    }
    return core::LedgerResult<std::size_t>::ok(removed);
  }

  sqlite3* db_;
  ChainScope scope_;
  std::unique_lock<std::timed_mutex> lock_;
  bool finished_{false};
};

// ────────────────────────────────────────────────────────────────
// Store
// ────────────────────────────────────────────────────────────────

SqliteLedgerStore::SqliteLedgerStore(std::shared_ptr<SqliteDb> db,
                                     std::shared_ptr<SqliteDb> reader)
    : db_(std::move(db)), reader_(std::move(reader)) {}

SqliteLedgerStore::ReadHandle SqliteLedgerStore::acquire_reader() const {
  ReadHandle handle;
  if (reader_) {
    handle.reader_lock = std::unique_lock<std::mutex>(reader_mutex_);
    handle.connection = reader_->connection();
  } else {
    handle.writer_lock = std::unique_lock<std::timed_mutex>(write_mutex_);
    handle.connection = db_->connection();
  }
  return handle;
}

core::LedgerResult<std::unique_ptr<ILedgerTransaction>> SqliteLedgerStore::begin(
    const ChainScope& scope, std::chrono::milliseconds lock_timeout) {
  using R = core::LedgerResult<std::unique_ptr<ILedgerTransaction>>;

  if (!scope.is_valid()) {
    return core::ledger_error<std::unique_ptr<ILedgerTransaction>>(
        LedgerErrorCode::kInvalidInput, "workspace_id of a chain scope must not be empty");
  }

  std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
  if (!lock.try_lock_for(lock_timeout)) {
    return core::ledger_error<std::unique_ptr<ILedgerTransaction>>(
        LedgerErrorCode::kWriteConflict,
        "timed out waiting for the chain lock of " + domain::to_string(scope));
  }

  sqlite3* conn = db_->connection();
  sqlite3_busy_timeout(conn, static_cast<int>(lock_timeout.count()));
  const int rc = sqlite3_exec(conn, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    return fail<std::unique_ptr<ILedgerTransaction>>(conn, rc,
                                                      "begin transaction on " +
                                                          domain::to_string(scope));
  }

  return R::ok(std::make_unique<SqliteLedgerTransaction>(conn, scope, std::move(lock)));
}

core::LedgerResult<ChainWindow> SqliteLedgerStore::read_window(
    const ChainScope& scope, std::optional<std::size_t> limit) const {
  auto handle = acquire_reader();
  sqlite3* conn = handle.connection;

  ReadTransaction snapshot(conn);
  if (snapshot.status() != SQLITE_OK) {
    return fail<ChainWindow>(conn, snapshot.status(), "begin read snapshot");
  }

  // Newest limit + 1 rows, re-ordered ascending; the extra row is the predecessor.
  const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM (SELECT seq, " +
                          kRecordColumns +
                          " FROM audit_records WHERE workspace_id IS ?1"
                          " ORDER BY created_at DESC, seq DESC LIMIT ?2)"
                          " ORDER BY created_at ASC, seq ASC";
  PreparedStatement stmt(conn, sql);
  if (!stmt.is_valid()) {
    return prepare_failed<ChainWindow>(stmt, "read chain window");
  }
  bind_optional_text(stmt.get(), 1, scope.workspace_id);
  sqlite3_bind_int64(stmt.get(), 2,
                     limit.has_value() ? static_cast<sqlite3_int64>(limit.value()) + 1 : -1);

  auto rows = collect_rows<AuditRecord>(conn, stmt.get(), read_record, "read chain window");
  if (!rows.has_value()) {
    return core::LedgerResult<ChainWindow>::err(rows.error());
  }

  auto checkpoints = select_checkpoints(conn, scope);
  if (!checkpoints.has_value()) {
    return core::LedgerResult<ChainWindow>::err(checkpoints.error());
  }

  ChainWindow window;
  window.scope = scope;
  auto& records = rows.value();
  if (limit.has_value() && records.size() > limit.value()) {
    window.predecessor = std::move(records.front());
    records.erase(records.begin());
  }
  window.records = std::move(records);
  window.checkpoints = std::move(checkpoints.value());
  return core::LedgerResult<ChainWindow>::ok(std::move(window));
}

core::LedgerResult<std::vector<ChainScope>> SqliteLedgerStore::list_scopes() const {
  auto handle = acquire_reader();
  sqlite3* conn = handle.connection;

  PreparedStatement stmt(conn,
                         "SELECT workspace_id FROM audit_records"
                         " UNION SELECT workspace_id FROM archive_checkpoints ORDER BY 1");
  if (!stmt.is_valid()) {
    return prepare_failed<std::vector<ChainScope>>(stmt, "list chain scopes");
  }
  return collect_rows<ChainScope>(
      conn, stmt.get(),
      [](sqlite3_stmt* s) {
        return core::LedgerResult<ChainScope>::ok(ChainScope{column_optional_text(s, 0)});
      },
      "list chain scopes");
}

core::LedgerResult<std::vector<AuditRecord>> SqliteLedgerStore::query(const RecordQuery& q) const {
  std::string sql = std::string("SELECT ") + kRecordColumns + " FROM audit_records WHERE 1 = 1";
  std::vector<std::string> binds;

  const auto add_filter = [&](const std::optional<std::string>& value, const char* clause) {
    if (value.has_value()) {
      sql += clause;
      binds.push_back(value.value());
    }
  };
  add_filter(q.action, " AND action = ?");
  add_filter(q.resource_type, " AND resource_type = ?");
  add_filter(q.resource_id, " AND resource_id = ?");
  add_filter(q.actor_user_id, " AND actor_user_id = ?");
  add_filter(q.workspace_id, " AND workspace_id = ?");
  if (q.start.has_value()) {
    sql += " AND created_at >= ?";
    binds.push_back(core::format_iso8601_millis(q.start.value()));
  }
  if (q.end.has_value()) {
    sql += " AND created_at <= ?";
    binds.push_back(core::format_iso8601_millis(q.end.value()));
  }
  sql += " ORDER BY created_at DESC, seq DESC LIMIT ? OFFSET ?";

  auto handle = acquire_reader();
  sqlite3* conn = handle.connection;

  PreparedStatement stmt(conn, sql);
  if (!stmt.is_valid()) {
    return prepare_failed<std::vector<AuditRecord>>(stmt, "query audit records");
  }
  int index = 1;
  for (const auto& value : binds) {
    bind_text(stmt.get(), index++, value);
  }
  sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(q.limit));
  sqlite3_bind_int64(stmt.get(), index, static_cast<sqlite3_int64>(q.offset));

  return collect_rows<AuditRecord>(conn, stmt.get(), read_record, "query audit records");
}

core::LedgerResult<std::int64_t> SqliteLedgerStore::storage_size_bytes() const {
  auto handle = acquire_reader();
  sqlite3* conn = handle.connection;

  PreparedStatement stmt(conn,
                         "SELECT page_count * page_size FROM pragma_page_count(),"
                         " pragma_page_size()");
  if (!stmt.is_valid()) {
    return prepare_failed<std::int64_t>(stmt, "read database size");
  }
  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW) {
    return fail<std::int64_t>(conn, rc, "read database size");
  }
  return core::LedgerResult<std::int64_t>::ok(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace auditchain::storage::sqlite
