#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/core/time.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/chain_verifier.h"
#include "auditchain/ledger/immutability_guard.h"
#include "auditchain/ledger/record_hash.h"
#include "auditchain/storage/inmemory_ledger_store.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace auditchain;
using core::LedgerErrorCode;

static constexpr std::chrono::milliseconds kTimeout{100};

static core::Timestamp at(const char* text) {
  return core::parse_iso8601(text).value();
}

static domain::AuditRecord raw_record(std::string id, std::optional<std::string> workspace,
                               std::string previous_hash, core::Timestamp created_at) {
  domain::AuditRecord record;
  record.id = std::move(id);
  record.created_at = created_at;
  record.workspace_id = std::move(workspace);
  record.action = "document.create";
  record.resource_type = "document";
  record.resource_id = "doc-1";
  record.previous_hash = std::move(previous_hash);
  record.record_hash = ledger::compute_record_hash(record);
  return record;
}

// ── transactions ────────────────────────────────────────────────────────────

TEST_CASE("InMemoryLedgerStore: uncommitted inserts are invisible and rolled back",
          "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  const auto scope = domain::ChainScope::workspace("ws-1");
  {
    auto tx = store.begin(scope, kTimeout);
    REQUIRE(tx.has_value());
    auto inserted = tx.value()->insert_record(
        raw_record("r-1", "ws-1", std::string(ledger::kGenesisHash), at("2026-01-01")));
    REQUIRE(inserted.has_value());

    auto tip = tx.value()->read_tip();
    REQUIRE(tip.has_value());
    CHECK(tip.value().source == storage::ChainTip::Source::kRecord);

    auto outside = store.read_window(scope, std::nullopt);
    REQUIRE(outside.has_value());
    CHECK(outside.value().records.empty());
  }

  auto after = store.read_window(scope, std::nullopt);
  REQUIRE(after.has_value());
  CHECK(after.value().records.empty());
}

TEST_CASE("InMemoryLedgerStore: tip starts at genesis", "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  auto tx = store.begin(domain::ChainScope::global(), kTimeout);
  REQUIRE(tx.has_value());
  auto tip = tx.value()->read_tip();
  REQUIRE(tip.has_value());
  CHECK(tip.value().hash == ledger::kGenesisHash);
  CHECK(tip.value().source == storage::ChainTip::Source::kGenesis);
  CHECK_FALSE(tip.value().created_at.has_value());
}

TEST_CASE("InMemoryLedgerStore: second record linking to the same hash is a write conflict",
          "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  const auto scope = domain::ChainScope::workspace("ws-1");
  const std::string genesis(ledger::kGenesisHash);

  auto tx = store.begin(scope, kTimeout);
  REQUIRE(tx.has_value());
  REQUIRE(tx.value()->insert_record(raw_record("r-1", "ws-1", genesis, at("2026-01-01")))
              .has_value());
  auto fork = tx.value()->insert_record(raw_record("r-2", "ws-1", genesis, at("2026-01-02")));
  REQUIRE_FALSE(fork.has_value());
  CHECK(fork.error().code == LedgerErrorCode::kWriteConflict);
}

TEST_CASE("InMemoryLedgerStore: record of another scope is rejected", "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  auto tx = store.begin(domain::ChainScope::workspace("ws-1"), kTimeout);
  REQUIRE(tx.has_value());
  auto wrong = tx.value()->insert_record(
      raw_record("r-1", "ws-2", std::string(ledger::kGenesisHash), at("2026-01-01")));
  REQUIRE_FALSE(wrong.has_value());
  CHECK(wrong.error().code == LedgerErrorCode::kInvalidInput);
}

TEST_CASE("InMemoryLedgerStore: finished transaction refuses further work",
          "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  auto tx = store.begin(domain::ChainScope::global(), kTimeout);
  REQUIRE(tx.has_value());
  REQUIRE(tx.value()->commit().has_value());
  CHECK_FALSE(tx.value()->read_tip().has_value());
  CHECK_FALSE(tx.value()->commit().has_value());
}

TEST_CASE("InMemoryLedgerStore: commit releases the scope lock", "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  const auto scope = domain::ChainScope::workspace("ws-1");
  auto first = store.begin(scope, kTimeout);
  REQUIRE(first.has_value());

  auto blocked = store.begin(scope, std::chrono::milliseconds{10});
  REQUIRE_FALSE(blocked.has_value());
  CHECK(blocked.error().code == LedgerErrorCode::kWriteConflict);

  REQUIRE(first.value()->commit().has_value());
  CHECK(store.begin(scope, kTimeout).has_value());
}

TEST_CASE("InMemoryLedgerStore: empty workspace id is not a scope", "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  auto tx = store.begin(domain::ChainScope::workspace(""), kTimeout);
  REQUIRE_FALSE(tx.has_value());
  CHECK(tx.error().code == LedgerErrorCode::kInvalidInput);
}

TEST_CASE("InMemoryLedgerStore: malformed records and checkpoints are rejected",
          "[storage][inmemory]") {
  storage::InMemoryLedgerStore store;
  auto tx = store.begin(domain::ChainScope::workspace("ws-1"), kTimeout);
  REQUIRE(tx.has_value());

  auto record = raw_record("r-1", "ws-1", "not-a-hash", at("2026-01-01"));
  auto bad_link = tx.value()->insert_record(record);
  REQUIRE_FALSE(bad_link.has_value());
  CHECK(bad_link.error().code == LedgerErrorCode::kInvalidInput);

  domain::ArchiveCheckpoint checkpoint;
  checkpoint.id = "cp-1";
  checkpoint.workspace_id = "ws-1";
  checkpoint.last_record_hash = "ABC";
  checkpoint.last_record_created_at = at("2026-01-01");
  auto bad_checkpoint = tx.value()->insert_checkpoint(checkpoint);
  REQUIRE_FALSE(bad_checkpoint.has_value());
  CHECK(bad_checkpoint.error().code == LedgerErrorCode::kInvalidInput);
}

// ── long chains ─────────────────────────────────────────────────────────────

TEST_CASE("InMemoryLedgerStore: long chain stays linked and rejects late forks",
          "[storage][inmemory]") {
  core::ManualClock clock(at("2026-03-01T00:00:00Z"));
  core::DeterministicIdGenerator ids;
  storage::InMemoryLedgerStore store;
  ledger::ChainAppender appender(store, clock, ids);
  const auto scope = domain::ChainScope::workspace("ws-1");

  constexpr int kRecords = 3000;
  std::string early_hash;
  std::string first_id;
  for (int i = 0; i < kRecords; ++i) {
    domain::AuditEventInput event;
    event.workspace_id = (i % 2 == 0) ? std::optional<std::string>("ws-1") : std::nullopt;
    event.action = "document.update";
    event.resource_type = "document";
    event.resource_id = "doc-" + std::to_string(i);
    auto appended = appender.append(event);
    REQUIRE(appended.has_value());
    if (i == 0) {
      first_id = appended.value().id;
    }
    if (i == 10) {
      early_hash = appended.value().previous_hash;
    }
  }

  auto report = ledger::verify_chain(store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().records_checked == kRecords);
  CHECK(report.value().scopes_checked == 2);

  auto tx = store.begin(scope, kTimeout);
  REQUIRE(tx.has_value());
  auto fork = tx.value()->insert_record(raw_record("late-fork", "ws-1", early_hash,
                                                   at("2026-03-02T00:00:00Z")));
  REQUIRE_FALSE(fork.has_value());
  CHECK(fork.error().code == LedgerErrorCode::kWriteConflict);

  auto duplicate = tx.value()->insert_record(
      raw_record(first_id, "ws-1", std::string(64, 'a'), at("2026-03-02T00:00:00Z")));
  REQUIRE_FALSE(duplicate.has_value());
  CHECK(duplicate.error().code == LedgerErrorCode::kStorageError);
}

TEST_CASE("InMemoryLedgerStore: tip follows the chain across archival deletion",
          "[storage][inmemory]") {
  core::ManualClock clock(at("2026-03-01T00:00:00Z"));
  core::DeterministicIdGenerator ids;
  storage::InMemoryLedgerStore store;
  ledger::ChainAppender appender(store, clock, ids);
  ledger::ImmutabilityGuard guard(appender, ids);
  const auto scope = domain::ChainScope::workspace("ws-1");

  std::vector<std::string> old_ids;
  for (int i = 0; i < 4; ++i) {
    domain::AuditEventInput event;
    event.workspace_id = "ws-1";
    event.action = "document.create";
    event.resource_type = "document";
    auto appended = appender.append(event);
    REQUIRE(appended.has_value());
    old_ids.push_back(appended.value().id);
  }

  auto tx = store.begin(scope, kTimeout);
  REQUIRE(tx.has_value());
  ledger::MaintenanceRequest request;
  request.reason = "archive";
  auto outcome = guard.run_maintenance(
      *tx.value(), request,
      [&](const storage::MaintenanceWindow& window) -> core::LedgerResult<bool> {
        auto removed = tx.value()->delete_records(old_ids, window);
        if (!removed.has_value()) {
          return core::LedgerResult<bool>::err(removed.error());
        }
        return core::LedgerResult<bool>::ok(removed.value() == old_ids.size());
      });
  REQUIRE(outcome.has_value());
  CHECK(outcome.value());
  REQUIRE(tx.value()->commit().has_value());

  auto window = store.read_window(scope, std::nullopt);
  REQUIRE(window.has_value());
  REQUIRE(window.value().records.size() == 2);
  const std::string last_hash = window.value().records.back().record_hash;

  auto next = store.begin(scope, kTimeout);
  REQUIRE(next.has_value());
  auto tip = next.value()->read_tip();
  REQUIRE(tip.has_value());
  CHECK(tip.value().hash == last_hash);
  CHECK(tip.value().source == storage::ChainTip::Source::kRecord);

  auto remaining = next.value()->select_older_than(at("2027-01-01"));
  REQUIRE(remaining.has_value());
  CHECK(remaining.value().size() == 2);
}

// ── reads ───────────────────────────────────────────────────────────────────

TEST_CASE("InMemoryLedgerStore: query filters and orders newest first", "[storage][inmemory]") {
  core::ManualClock clock(at("2026-03-01T00:00:00Z"));
  core::DeterministicIdGenerator ids;
  storage::InMemoryLedgerStore store;
  ledger::ChainAppender appender(store, clock, ids);

  for (int i = 0; i < 5; ++i) {
    domain::AuditEventInput event;
    event.actor_user_id = i % 2 == 0 ? "alice" : "bob";
    event.workspace_id = "ws-1";
    event.action = i < 3 ? "document.create" : "document.delete";
    event.resource_type = "document";
    event.resource_id = "doc-" + std::to_string(i);
    REQUIRE(appender.append(event).has_value());
    clock.advance(std::chrono::hours{24});
  }

  storage::RecordQuery by_action;
  by_action.action = "document.create";
  auto creates = store.query(by_action);
  REQUIRE(creates.has_value());
  REQUIRE(creates.value().size() == 3);
  CHECK(creates.value().front().resource_id == "doc-2");
  CHECK(creates.value().back().resource_id == "doc-0");

  storage::RecordQuery by_actor;
  by_actor.actor_user_id = "bob";
  auto bobs = store.query(by_actor);
  REQUIRE(bobs.has_value());
  CHECK(bobs.value().size() == 2);

  storage::RecordQuery by_range;
  by_range.start = at("2026-03-02");
  by_range.end = at("2026-03-03");
  auto ranged = store.query(by_range);
  REQUIRE(ranged.has_value());
  CHECK(ranged.value().size() == 2);

  storage::RecordQuery paged;
  paged.limit = 2;
  paged.offset = 1;
  auto page = store.query(paged);
  REQUIRE(page.has_value());
  REQUIRE(page.value().size() == 2);
  CHECK(page.value()[0].resource_id == "doc-3");
  CHECK(page.value()[1].resource_id == "doc-2");
}

TEST_CASE("InMemoryLedgerStore: storage size grows with records", "[storage][inmemory]") {
  core::ManualClock clock(at("2026-03-01T00:00:00Z"));
  core::DeterministicIdGenerator ids;
  storage::InMemoryLedgerStore store;
  ledger::ChainAppender appender(store, clock, ids);

  auto empty = store.storage_size_bytes();
  REQUIRE(empty.has_value());
  CHECK(empty.value() == 0);

  domain::AuditEventInput event;
  event.action = "auth.login";
  event.resource_type = "user";
  REQUIRE(appender.append(event).has_value());

  auto grown = store.storage_size_bytes();
  REQUIRE(grown.has_value());
  CHECK(grown.value() > 0);
}
