#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/core/time.h"
#include "auditchain/ledger/archive_manager.h"
#include "auditchain/ledger/archive_sink.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/chain_verifier.h"
#include "auditchain/ledger/immutability_guard.h"
#include "auditchain/ledger/ledger_actions.h"
#include "auditchain/storage/inmemory_ledger_store.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace auditchain;
using core::LedgerErrorCode;

static core::Timestamp day(const char* text) {
  return core::parse_iso8601(text).value();
}

// Ten records in ws-1 dated 2025-01-01 .. 2025-01-10, then the clock moves to 2026.
struct ArchiveFixture {
  core::ManualClock clock{day("2025-01-01")};
  core::DeterministicIdGenerator ids;
  storage::InMemoryLedgerStore store;
  ledger::ChainAppender appender{store, clock, ids};
  ledger::ImmutabilityGuard guard{appender, ids};
  ledger::ArchiveManager archiver{store, appender, guard, ids, clock};
  const domain::ChainScope scope = domain::ChainScope::workspace("ws-1");

  ArchiveFixture() {
    for (int i = 0; i < 10; ++i) {
      domain::AuditEventInput event;
      event.actor_user_id = "user-1";
      event.workspace_id = "ws-1";
      event.action = "document.update";
      event.resource_type = "document";
      event.resource_id = "doc-" + std::to_string(i);
      REQUIRE(appender.append(event).has_value());
      clock.advance(std::chrono::hours{24});
    }
    clock.set(day("2026-01-01"));
  }

  std::vector<domain::AuditRecord> records() const {
    auto window = store.read_window(scope, std::nullopt);
    REQUIRE(window.has_value());
    return window.value().records;
  }

  ledger::VerificationReport verify() const {
    auto report = ledger::verify_chain(store, scope, std::nullopt);
    REQUIRE(report.has_value());
    return report.value();
  }
};

static ledger::ArchiveRequest request_for(const domain::ChainScope& scope, const char* cutoff) {
  ledger::ArchiveRequest request;
  request.scope = scope;
  request.older_than = day(cutoff);
  request.actor_user_id = "admin-1";
  return request;
}

// ── archival ────────────────────────────────────────────────────────────────

TEST_CASE("ArchiveManager: archived chain still verifies through its checkpoint",
          "[ledger][archive]") {
  ArchiveFixture f;
  const auto before = f.records();
  const auto anchor = before[4];

  auto outcome = f.archiver.archive(request_for(f.scope, "2025-01-06"));
  REQUIRE(outcome.has_value());
  CHECK(outcome.value().records_archived == 5);
  CHECK_FALSE(outcome.value().dry_run);
  REQUIRE(outcome.value().checkpoint.has_value());
  const auto& checkpoint = outcome.value().checkpoint.value();
  CHECK(checkpoint.last_record_id == anchor.id);
  CHECK(checkpoint.last_record_hash == anchor.record_hash);
  CHECK(checkpoint.last_record_created_at == anchor.created_at);
  CHECK(checkpoint.records_archived == 5);
  CHECK(checkpoint.workspace_id == std::optional<std::string>{"ws-1"});
  CHECK(checkpoint.created_by == std::optional<std::string>{"admin-1"});
  CHECK(outcome.value().oldest_archived == before[0].created_at);
  CHECK(outcome.value().newest_archived == anchor.created_at);

  const auto after = f.records();
  // Five survivors plus maintenance_started, records_archived, maintenance_ended.
  REQUIRE(after.size() == 8);
  CHECK(after[0].id == before[5].id);
  CHECK(after[0].previous_hash == checkpoint.last_record_hash);
  CHECK(after[5].action == ledger::kActionMaintenanceStarted);
  CHECK(after[6].action == ledger::kActionRecordsArchived);
  CHECK(after[6].resource_id == checkpoint.id);
  CHECK(after[7].action == ledger::kActionMaintenanceEnded);

  CHECK(f.verify().valid);
}

TEST_CASE("ArchiveManager: without the checkpoint the gap is an unknown origin",
          "[ledger][archive]") {
  ArchiveFixture f;
  const auto before = f.records();
  REQUIRE(f.archiver.archive(request_for(f.scope, "2025-01-06")).has_value());

  auto window = f.store.read_window(f.scope, std::nullopt);
  REQUIRE(window.has_value());
  REQUIRE(window.value().checkpoints.size() == 1);
  window.value().checkpoints.clear();

  const auto findings = ledger::verify_window(window.value());
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].record_id == before[5].id);
  CHECK(findings[0].error_message == "Chain origin not found");
}

TEST_CASE("ArchiveManager: successive archivals chain their checkpoints", "[ledger][archive]") {
  ArchiveFixture f;
  REQUIRE(f.archiver.archive(request_for(f.scope, "2025-01-04")).has_value());
  auto second = f.archiver.archive(request_for(f.scope, "2025-01-08"));
  REQUIRE(second.has_value());
  CHECK(second.value().records_archived == 4);

  auto window = f.store.read_window(f.scope, std::nullopt);
  REQUIRE(window.has_value());
  CHECK(window.value().checkpoints.size() == 2);
  CHECK(f.verify().valid);
}

TEST_CASE("ArchiveManager: archiving every record anchors the maintenance records",
          "[ledger][archive]") {
  ArchiveFixture f;
  auto outcome = f.archiver.archive(request_for(f.scope, "2025-12-31"));
  REQUIRE(outcome.has_value());
  CHECK(outcome.value().records_archived == 10);

  const auto after = f.records();
  REQUIRE(after.size() == 3);
  CHECK(after[0].action == ledger::kActionMaintenanceStarted);
  CHECK(after[0].previous_hash == outcome.value().checkpoint.value().last_record_hash);
  CHECK(f.verify().valid);

  // New events keep extending the same chain.
  domain::AuditEventInput event;
  event.workspace_id = "ws-1";
  event.action = "document.create";
  event.resource_type = "document";
  event.resource_id = "doc-new";
  auto appended = f.appender.append(event);
  REQUIRE(appended.has_value());
  CHECK(appended.value().previous_hash == after[2].record_hash);
  CHECK(f.verify().valid);
}

// ── no-ops ──────────────────────────────────────────────────────────────────

TEST_CASE("ArchiveManager: dry run reports without changing anything", "[ledger][archive]") {
  ArchiveFixture f;
  auto request = request_for(f.scope, "2025-01-06");
  request.dry_run = true;

  auto outcome = f.archiver.archive(request);
  REQUIRE(outcome.has_value());
  CHECK(outcome.value().dry_run);
  CHECK(outcome.value().records_archived == 5);
  CHECK(outcome.value().checkpoint.has_value());

  CHECK(f.records().size() == 10);
  auto window = f.store.read_window(f.scope, std::nullopt);
  REQUIRE(window.has_value());
  CHECK(window.value().checkpoints.empty());
}

TEST_CASE("ArchiveManager: nothing old enough is a no-op", "[ledger][archive]") {
  ArchiveFixture f;
  auto outcome = f.archiver.archive(request_for(f.scope, "2024-06-01"));
  REQUIRE(outcome.has_value());
  CHECK(outcome.value().records_archived == 0);
  CHECK_FALSE(outcome.value().checkpoint.has_value());
  CHECK(f.records().size() == 10);
}

TEST_CASE("ArchiveManager: other scopes are untouched", "[ledger][archive]") {
  ArchiveFixture f;
  domain::AuditEventInput event;
  event.action = "auth.login";
  event.resource_type = "user";
  event.resource_id = "user-1";
  f.clock.set(day("2025-01-02"));
  REQUIRE(f.appender.append(event).has_value());
  f.clock.set(day("2026-01-01"));

  REQUIRE(f.archiver.archive(request_for(f.scope, "2025-01-06")).has_value());
  auto global = f.store.read_window(domain::ChainScope::global(), std::nullopt);
  REQUIRE(global.has_value());
  CHECK(global.value().records.size() == 1);
}

// ── export failure ──────────────────────────────────────────────────────────

class RejectingSink final : public ledger::IArchiveSink {
 public:
  core::Result<ledger::ArchiveReceipt, std::string> store(
      const domain::ChainScope&, const std::vector<domain::AuditRecord>&) override {
    return core::Result<ledger::ArchiveReceipt, std::string>::err("bucket unavailable");
  }
};

TEST_CASE("ArchiveManager: export failure deletes nothing", "[ledger][archive]") {
  ArchiveFixture f;
  RejectingSink sink;
  ledger::ArchiveManager archiver(f.store, f.appender, f.guard, f.ids, f.clock, &sink);

  auto outcome = archiver.archive(request_for(f.scope, "2025-01-06"));
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().code == LedgerErrorCode::kStorageError);
  CHECK(f.records().size() == 10);
}

// ── retention ───────────────────────────────────────────────────────────────

TEST_CASE("retention_cutoff: calendar months before now", "[ledger][archive]") {
  CHECK(core::format_iso8601_millis(ledger::retention_cutoff(day("2026-03-15T08:00:00Z"), 12)) ==
        "2025-03-15T08:00:00.000Z");
  CHECK(core::format_iso8601_millis(ledger::retention_cutoff(day("2026-03-31T00:00:00Z"), 1)) ==
        "2026-02-28T00:00:00.000Z");
}
