#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/core/time.h"
#include "auditchain/ledger/archive_manager.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/chain_verifier.h"
#include "auditchain/ledger/immutability_guard.h"
#include "auditchain/ledger/record_hash.h"
#include "auditchain/storage/sqlite/sqlite_db.h"
#include "auditchain/storage/sqlite/sqlite_ledger_store.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

using namespace auditchain;
using core::LedgerErrorCode;

// Helper: open an in-memory DB with schema v2 applied.
static std::shared_ptr<storage::sqlite::SqliteDb> make_db() {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  auto schema = db->ensure_schema_v2();
  REQUIRE(schema.has_value());
  return db;
}

static domain::AuditEventInput sqlite_event(const std::string& resource_id,
                                            std::optional<std::string> workspace = "ws-1") {
  domain::AuditEventInput event;
  event.actor_user_id = "user-1";
  event.workspace_id = std::move(workspace);
  event.action = "document.update";
  event.resource_type = "document";
  event.resource_id = resource_id;
  event.details = nlohmann::json{{"field", "title"}};
  return event;
}

// ── schema ──────────────────────────────────────────────────────────────────

TEST_CASE("SqliteDb: schema v2 applies once", "[sqlite][schema]") {
  auto db = make_db();
  CHECK(db->get_schema_version() == 2);
  REQUIRE(db->ensure_schema_v2().has_value());
  CHECK(db->get_schema_version() == 2);
  CHECK(db->is_memory());
}

// ── append and read ─────────────────────────────────────────────────────────

TEST_CASE("SqliteLedgerStore: appended chain round-trips and verifies", "[sqlite][ledger]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00.123Z").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);

  auto first = appender.append(sqlite_event("doc-1"));
  REQUIRE(first.has_value());
  for (int i = 2; i <= 5; ++i) {
    REQUIRE(appender.append(sqlite_event("doc-" + std::to_string(i))).has_value());
  }
  REQUIRE(appender.append(sqlite_event("login", std::nullopt)).has_value());

  auto window = store.read_window(domain::ChainScope::workspace("ws-1"), std::nullopt);
  REQUIRE(window.has_value());
  REQUIRE(window.value().records.size() == 5);
  const auto& stored = window.value().records.front();
  CHECK(stored.id == first.value().id);
  CHECK(stored.created_at == first.value().created_at);
  CHECK(stored.record_hash == first.value().record_hash);
  CHECK(stored.details["field"] == "title");
  CHECK_FALSE(stored.ip_address.has_value());

  auto scopes = store.list_scopes();
  REQUIRE(scopes.has_value());
  CHECK(scopes.value().size() == 2);

  auto report = ledger::verify_chain(store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().records_checked == 6);
}

TEST_CASE("SqliteLedgerStore: limited window carries its predecessor", "[sqlite][ledger]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00Z").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  for (int i = 0; i < 8; ++i) {
    REQUIRE(appender.append(sqlite_event("doc-" + std::to_string(i))).has_value());
  }

  auto window = store.read_window(domain::ChainScope::workspace("ws-1"), 3);
  REQUIRE(window.has_value());
  CHECK(window.value().records.size() == 3);
  REQUIRE(window.value().predecessor.has_value());
  CHECK(window.value().predecessor.value().resource_id == "doc-4");
  CHECK(window.value().records.front().resource_id == "doc-5");
  CHECK(ledger::verify_window(window.value()).empty());
}

TEST_CASE("SqliteLedgerStore: query filters newest first with paging", "[sqlite][ledger]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00Z").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  for (int i = 0; i < 6; ++i) {
    REQUIRE(appender.append(sqlite_event("doc-" + std::to_string(i % 2))).has_value());
    clock.advance(std::chrono::minutes{1});
  }

  storage::RecordQuery q;
  q.resource_id = "doc-1";
  auto matched = store.query(q);
  REQUIRE(matched.has_value());
  REQUIRE(matched.value().size() == 3);
  CHECK(matched.value()[0].created_at > matched.value()[1].created_at);

  q.limit = 1;
  q.offset = 2;
  auto paged = store.query(q);
  REQUIRE(paged.has_value());
  REQUIRE(paged.value().size() == 1);
  CHECK(paged.value()[0].id == matched.value()[2].id);

  auto size = store.storage_size_bytes();
  REQUIRE(size.has_value());
  CHECK(size.value() > 0);
}

TEST_CASE("SqliteLedgerStore: dropped transaction rolls back", "[sqlite][ledger]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00Z").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  {
    auto tx = store.begin(domain::ChainScope::workspace("ws-1"), std::chrono::milliseconds{100});
    REQUIRE(tx.has_value());
    REQUIRE(appender.append_in(*tx.value(), sqlite_event("doc-1")).has_value());
  }
  auto window = store.read_window(domain::ChainScope::workspace("ws-1"), std::nullopt);
  REQUIRE(window.has_value());
  CHECK(window.value().records.empty());

  // The chain restarts at genesis.
  auto record = appender.append(sqlite_event("doc-2"));
  REQUIRE(record.has_value());
  CHECK(record.value().previous_hash == ledger::kGenesisHash);
}

// ── immutability ────────────────────────────────────────────────────────────

TEST_CASE("SqliteLedgerStore: UPDATE and DELETE are rejected by the schema",
          "[sqlite][immutability]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00Z").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  auto record = appender.append(sqlite_event("doc-1"));
  REQUIRE(record.has_value());

  auto update = db->exec("UPDATE audit_records SET action = 'document.delete'");
  REQUIRE_FALSE(update.has_value());
  CHECK(update.error().find("immutability violation") != std::string::npos);

  auto del = db->exec("DELETE FROM audit_records");
  REQUIRE_FALSE(del.has_value());
  CHECK(del.error().find("immutability violation") != std::string::npos);

  auto report = ledger::verify_chain(store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().records_checked == 1);
}

TEST_CASE("SqliteLedgerStore: checkpoints are immutable", "[sqlite][immutability]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2025-01-01").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  ledger::ImmutabilityGuard guard(appender, ids);
  ledger::ArchiveManager archiver(store, appender, guard, ids, clock);

  REQUIRE(appender.append(sqlite_event("doc-1")).has_value());
  clock.set(core::parse_iso8601("2026-01-01").value());
  ledger::ArchiveRequest request;
  request.scope = domain::ChainScope::workspace("ws-1");
  request.older_than = core::parse_iso8601("2025-06-01").value();
  REQUIRE(archiver.archive(request).has_value());

  auto update = db->exec("UPDATE archive_checkpoints SET records_archived = 99");
  REQUIRE_FALSE(update.has_value());
  CHECK(update.error().find("immutability violation") != std::string::npos);
  auto del = db->exec("DELETE FROM archive_checkpoints");
  REQUIRE_FALSE(del.has_value());
  CHECK(del.error().find("immutability violation") != std::string::npos);
}

TEST_CASE("SqliteLedgerStore: a second link to the same hash is a write conflict",
          "[sqlite][ledger]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);

  domain::AuditRecord a;
  a.id = "r-a";
  a.created_at = core::parse_iso8601("2026-01-01").value();
  a.workspace_id = "ws-1";
  a.action = "document.create";
  a.previous_hash = std::string(ledger::kGenesisHash);
  a.record_hash = ledger::compute_record_hash(a);
  domain::AuditRecord b = a;
  b.id = "r-b";
  b.resource_id = "other";
  b.record_hash = ledger::compute_record_hash(b);

  auto tx = store.begin(domain::ChainScope::workspace("ws-1"), std::chrono::milliseconds{100});
  REQUIRE(tx.has_value());
  REQUIRE(tx.value()->insert_record(a).has_value());
  auto fork = tx.value()->insert_record(b);
  REQUIRE_FALSE(fork.has_value());
  CHECK(fork.error().code == LedgerErrorCode::kWriteConflict);
}

TEST_CASE("SqliteLedgerStore: empty workspace id is invalid input, not a conflict",
          "[sqlite][ledger]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00Z").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);

  REQUIRE(appender.append(sqlite_event("doc-1", std::nullopt)).has_value());
  auto shadow = appender.append(sqlite_event("doc-2", ""));
  REQUIRE_FALSE(shadow.has_value());
  CHECK(shadow.error().code == LedgerErrorCode::kInvalidInput);

  auto tx = store.begin(domain::ChainScope::workspace(""), std::chrono::milliseconds{100});
  REQUIRE_FALSE(tx.has_value());
  CHECK(tx.error().code == LedgerErrorCode::kInvalidInput);

  auto report = ledger::verify_chain(store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().records_checked == 1);
}

TEST_CASE("SqliteLedgerStore: malformed hashes are rejected before insert", "[sqlite][ledger]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);

  domain::AuditRecord record;
  record.id = "r-a";
  record.created_at = core::parse_iso8601("2026-01-01").value();
  record.workspace_id = "ws-1";
  record.action = "document.create";
  record.previous_hash = "GENESIS";
  record.record_hash = ledger::compute_record_hash(record);

  auto tx = store.begin(domain::ChainScope::workspace("ws-1"), std::chrono::milliseconds{100});
  REQUIRE(tx.has_value());
  auto bad_link = tx.value()->insert_record(record);
  REQUIRE_FALSE(bad_link.has_value());
  CHECK(bad_link.error().code == LedgerErrorCode::kInvalidInput);

  domain::ArchiveCheckpoint checkpoint;
  checkpoint.id = "cp-1";
  checkpoint.last_record_id = "r-0";
  checkpoint.last_record_created_at = record.created_at;
  checkpoint.last_record_hash = std::string(63, 'a');
  checkpoint.workspace_id = "ws-1";
  checkpoint.archived_at = record.created_at;
  auto bad_checkpoint = tx.value()->insert_checkpoint(checkpoint);
  REQUIRE_FALSE(bad_checkpoint.has_value());
  CHECK(bad_checkpoint.error().code == LedgerErrorCode::kInvalidInput);
}

TEST_CASE("SqliteLedgerStore: tampering behind the triggers is detected",
          "[sqlite][immutability]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00Z").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  std::string target;
  for (int i = 0; i < 5; ++i) {
    auto record = appender.append(sqlite_event("doc-" + std::to_string(i)));
    REQUIRE(record.has_value());
    if (i == 2) {
      target = record.value().id;
    }
  }

  REQUIRE(db->exec("DROP TRIGGER audit_records_no_update").has_value());
  REQUIRE(db->exec("UPDATE audit_records SET actor_user_id = 'mallory' WHERE id = '" + target +
                   "'")
              .has_value());

  auto report = ledger::verify_chain(store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK_FALSE(report.value().valid);
  REQUIRE(report.value().findings.size() == 1);
  CHECK(report.value().findings[0].record_id == target);
  CHECK(report.value().findings[0].error_message == "Record hash mismatch");
}

// ── archival on SQLite ──────────────────────────────────────────────────────

TEST_CASE("SqliteLedgerStore: archival commits checkpoint and deletion together",
          "[sqlite][archive]") {
  auto db = make_db();
  storage::sqlite::SqliteLedgerStore store(db);
  core::ManualClock clock(core::parse_iso8601("2025-01-01").value());
  core::DeterministicIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  ledger::ImmutabilityGuard guard(appender, ids);
  ledger::ArchiveManager archiver(store, appender, guard, ids, clock);

  for (int i = 0; i < 6; ++i) {
    REQUIRE(appender.append(sqlite_event("doc-" + std::to_string(i))).has_value());
    clock.advance(std::chrono::hours{24});
  }
  clock.set(core::parse_iso8601("2026-01-01").value());

  ledger::ArchiveRequest request;
  request.scope = domain::ChainScope::workspace("ws-1");
  request.older_than = core::parse_iso8601("2025-01-04").value();
  request.actor_user_id = "admin-1";
  auto outcome = archiver.archive(request);
  REQUIRE(outcome.has_value());
  CHECK(outcome.value().records_archived == 3);

  auto window = store.read_window(request.scope, std::nullopt);
  REQUIRE(window.has_value());
  REQUIRE(window.value().checkpoints.size() == 1);
  const auto& checkpoint = window.value().checkpoints.front();
  CHECK(checkpoint.id == outcome.value().checkpoint.value().id);
  CHECK(checkpoint.created_by == std::optional<std::string>{"admin-1"});
  CHECK(window.value().records.size() == 6);
  CHECK(window.value().records.front().resource_id == "doc-3");

  auto report = ledger::verify_chain(store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);

  // The maintenance flag is down again once archival commits.
  CHECK_FALSE(db->exec("DELETE FROM audit_records").has_value());
}

// ── persistence ─────────────────────────────────────────────────────────────

TEST_CASE("SqliteLedgerStore: chain survives reopening the file", "[sqlite][ledger]") {
  const auto dir = std::filesystem::temp_directory_path() / "auditchain_test_sqlite_reopen";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const std::string path = (dir / "ledger.db").string();

  core::ManualClock clock(core::parse_iso8601("2026-01-15T10:30:00Z").value());
  std::string tip_hash;
  {
    auto opened = storage::sqlite::SqliteDb::open(path);
    REQUIRE(opened.has_value());
    REQUIRE(opened.value()->ensure_schema_v2().has_value());
    storage::sqlite::SqliteLedgerStore store(opened.value());
    core::DeterministicIdGenerator ids;
    ledger::ChainAppender appender(store, clock, ids);
    for (int i = 0; i < 3; ++i) {
      auto record = appender.append(sqlite_event("doc-" + std::to_string(i)));
      REQUIRE(record.has_value());
      tip_hash = record.value().record_hash;
    }
  }

  auto reopened = storage::sqlite::SqliteDb::open(path);
  REQUIRE(reopened.has_value());
  REQUIRE(reopened.value()->ensure_schema_v2().has_value());
  auto reader = storage::sqlite::SqliteDb::open(path);
  REQUIRE(reader.has_value());
  storage::sqlite::SqliteLedgerStore store(reopened.value(), reader.value());

  core::SystemIdGenerator ids;
  ledger::ChainAppender appender(store, clock, ids);
  auto next = appender.append(sqlite_event("doc-3"));
  REQUIRE(next.has_value());
  CHECK(next.value().previous_hash == tip_hash);

  auto report = ledger::verify_chain(store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().records_checked == 4);
}
