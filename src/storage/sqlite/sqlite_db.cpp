#include "auditchain/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace auditchain::storage::sqlite {

// Deleter implementations
void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Embedded schema v1 SQL: the chain, its checkpoints and the maintenance flag.
//
// created_at is stored as YYYY-MM-DDTHH:MM:SS.mmmZ text, whose lexicographic
// order is chronological. seq breaks ties in commit order.
// The (scope, previous_hash) unique index makes a fork unrepresentable.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS audit_records (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  created_at TEXT NOT NULL,
  actor_user_id TEXT,
  workspace_id TEXT,
  action TEXT NOT NULL,
  resource_type TEXT NOT NULL,
  resource_id TEXT NOT NULL,
  details_json TEXT NOT NULL,
  ip_address TEXT,
  user_agent TEXT,
  previous_hash TEXT NOT NULL CHECK(length(previous_hash) = 64),
  record_hash TEXT NOT NULL CHECK(length(record_hash) = 64)
);

CREATE INDEX IF NOT EXISTS idx_audit_records_chain
  ON audit_records(workspace_id, created_at, seq);

CREATE UNIQUE INDEX IF NOT EXISTS idx_audit_records_link
  ON audit_records(ifnull(workspace_id, ''), previous_hash);

CREATE INDEX IF NOT EXISTS idx_audit_records_action ON audit_records(action, created_at);
CREATE INDEX IF NOT EXISTS idx_audit_records_resource
  ON audit_records(resource_type, resource_id, created_at);
CREATE INDEX IF NOT EXISTS idx_audit_records_actor ON audit_records(actor_user_id, created_at);

CREATE TABLE IF NOT EXISTS archive_checkpoints (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  workspace_id TEXT,
  last_record_id TEXT NOT NULL,
  last_record_created_at TEXT NOT NULL,
  last_record_hash TEXT NOT NULL CHECK(length(last_record_hash) = 64),
  records_archived INTEGER NOT NULL CHECK(records_archived > 0),
  archived_at TEXT NOT NULL,
  archive_location TEXT,
  archive_checksum TEXT,
  created_by TEXT
);

CREATE INDEX IF NOT EXISTS idx_archive_checkpoints_scope
  ON archive_checkpoints(workspace_id, last_record_created_at);

CREATE TABLE IF NOT EXISTS ledger_maintenance (
  id INTEGER PRIMARY KEY CHECK(id = 1),
  active INTEGER NOT NULL DEFAULT 0 CHECK(active IN (0, 1)),
  window_id TEXT
);

INSERT OR IGNORE INTO ledger_maintenance (id, active) VALUES (1, 0);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

// Embedded schema v2 SQL: immutability triggers.
// Record deletion is allowed only while ledger_maintenance.active = 1, which
// the store sets and clears inside a single maintenance transaction.
constexpr const char* kSchemaV2 = R"(
CREATE TRIGGER IF NOT EXISTS audit_records_no_update
BEFORE UPDATE ON audit_records
BEGIN
  SELECT RAISE(ABORT, 'immutability violation: audit_records rows cannot be updated');
END;

CREATE TRIGGER IF NOT EXISTS audit_records_no_delete
BEFORE DELETE ON audit_records
WHEN (SELECT active FROM ledger_maintenance WHERE id = 1) IS NOT 1
BEGIN
  SELECT RAISE(ABORT, 'immutability violation: audit_records rows cannot be deleted outside maintenance');
END;

CREATE TRIGGER IF NOT EXISTS archive_checkpoints_no_update
BEFORE UPDATE ON archive_checkpoints
BEGIN
  SELECT RAISE(ABORT, 'immutability violation: archive_checkpoints rows cannot be updated');
END;

CREATE TRIGGER IF NOT EXISTS archive_checkpoints_no_delete
BEFORE DELETE ON archive_checkpoints
BEGIN
  SELECT RAISE(ABORT, 'immutability violation: archive_checkpoints rows cannot be deleted');
END;

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (2, datetime('now'));
)";

namespace {

constexpr int kDefaultBusyTimeoutMs = 5000;

}  // namespace

SqliteDb::SqliteDb(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using R = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return R::err("Failed to open database: " + error);
  }

  // Extended codes distinguish trigger aborts from other constraint failures.
  sqlite3_extended_result_codes(db, 1);
  // Default wait for schema migrations; ledger transactions set their own bound.
  sqlite3_busy_timeout(db, kDefaultBusyTimeoutMs);

  auto handle = std::shared_ptr<SqliteDb>(new SqliteDb(db, path));

  if (!handle->is_memory()) {
    auto wal = handle->exec("PRAGMA journal_mode = WAL;");
    if (!wal.has_value()) {
      return R::err("Failed to enable WAL journal: " + wal.error());
    }
    auto sync = handle->exec("PRAGMA synchronous = FULL;");
    if (!sync.has_value()) {
      return R::err("Failed to set synchronous mode: " + sync.error());
    }
  }

  return R::ok(std::move(handle));
}

int SqliteDb::get_schema_version() const {
  // Check if schema_version table exists
  sqlite3_stmt* stmt = nullptr;
  const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1";
  int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  }

  sqlite3_finalize(stmt);
  return version;
}

core::Result<bool, std::string> SqliteDb::apply_migration(int version, const char* sql) {
  if (get_schema_version() >= version) {
    return core::Result<bool, std::string>::ok(true);
  }

  // A migration is all-or-nothing; concurrent openers serialize on the write lock.
  const std::string script = std::string("BEGIN IMMEDIATE;\n") + sql + "\nCOMMIT;";
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), script.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    if (sqlite3_get_autocommit(db_.get()) == 0) {
      sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
    }
    return core::Result<bool, std::string>::err("Failed to apply schema v" +
                                                std::to_string(version) + ": " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  return apply_migration(1, kSchemaV1);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v2() {
  // Ensure v1 is applied first
  auto v1_result = ensure_schema_v1();
  if (!v1_result.has_value()) {
    return v1_result;
  }
  return apply_migration(2, kSchemaV2);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    stmt_ = nullptr;
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

}  // namespace auditchain::storage::sqlite
