#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/core/time.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/chain_verifier.h"
#include "auditchain/ledger/record_hash.h"
#include "auditchain/storage/inmemory_ledger_store.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace auditchain;

static core::Timestamp at(const char* text) {
  return core::parse_iso8601(text).value();
}

static domain::AuditEventInput event_for(const std::optional<std::string>& workspace,
                                         int n) {
  domain::AuditEventInput event;
  event.actor_user_id = "user-1";
  event.workspace_id = workspace;
  event.action = "document.update";
  event.resource_type = "document";
  event.resource_id = "doc-" + std::to_string(n);
  return event;
}

// A store with `count` records appended to `workspace`, one second apart.
struct VerifierChainFixture {
  core::ManualClock clock{at("2026-01-01T00:00:00Z")};
  core::DeterministicIdGenerator ids;
  storage::InMemoryLedgerStore store;
  ledger::ChainAppender appender{store, clock, ids};

  void append(const std::optional<std::string>& workspace, int count) {
    for (int i = 0; i < count; ++i) {
      REQUIRE(appender.append(event_for(workspace, i)).has_value());
      clock.advance(std::chrono::seconds{1});
    }
  }

  storage::ChainWindow window(const std::optional<std::string>& workspace) {
    auto w = store.read_window(domain::ChainScope{workspace}, std::nullopt);
    REQUIRE(w.has_value());
    return w.value();
  }
};

// ── clean chains ────────────────────────────────────────────────────────────

TEST_CASE("verify_window: empty window has no findings", "[ledger][verifier]") {
  storage::ChainWindow window;
  CHECK(ledger::verify_window(window).empty());
}

TEST_CASE("verify_window: appended chain verifies clean", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 10);
  const auto window = f.window("ws-1");
  REQUIRE(window.records.size() == 10);
  CHECK(window.records.front().previous_hash == ledger::kGenesisHash);
  CHECK(ledger::verify_window(window).empty());
}

// ── tamper detection: exactly the tampered record ───────────────────────────

TEST_CASE("verify_window: altered content is reported once on the altered record",
          "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 5);
  auto window = f.window("ws-1");
  window.records[2].action = "document.delete";

  const auto findings = ledger::verify_window(window);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].record_id == window.records[2].id);
  CHECK(findings[0].error_message == "Record hash mismatch");
  CHECK_FALSE(findings[0].is_valid);
}

TEST_CASE("verify_window: overwritten record_hash is reported once", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 5);
  auto window = f.window("ws-1");
  window.records[2].record_hash = std::string(64, 'f');

  const auto findings = ledger::verify_window(window);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].record_id == window.records[2].id);
  CHECK(findings[0].reason == domain::FindingReason::kRecordHashMismatch);
}

TEST_CASE("verify_window: broken link is reported once on the relinked record",
          "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 5);
  auto window = f.window("ws-1");
  window.records[3].previous_hash = std::string(64, 'a');

  const auto findings = ledger::verify_window(window);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].record_id == window.records[3].id);
  CHECK(findings[0].error_message == "Previous hash mismatch");
}

TEST_CASE("verify_window: deleted middle record breaks its successor's link",
          "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 5);
  auto window = f.window("ws-1");
  const std::string successor = window.records[3].id;
  window.records.erase(window.records.begin() + 2);

  const auto findings = ledger::verify_window(window);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].record_id == successor);
  CHECK(findings[0].reason == domain::FindingReason::kPreviousHashMismatch);
}

// ── chain origin and checkpoints ────────────────────────────────────────────

TEST_CASE("verify_window: unknown origin without a checkpoint", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 5);
  auto window = f.window("ws-1");
  window.records.erase(window.records.begin(), window.records.begin() + 2);

  const auto findings = ledger::verify_window(window);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].record_id == window.records[0].id);
  CHECK(findings[0].error_message == "Chain origin not found");
}

TEST_CASE("verify_window: checkpoint anchors the first surviving record", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 5);
  auto window = f.window("ws-1");

  domain::ArchiveCheckpoint checkpoint;
  checkpoint.id = "cp-1";
  checkpoint.workspace_id = "ws-1";
  checkpoint.last_record_id = window.records[1].id;
  checkpoint.last_record_created_at = window.records[1].created_at;
  checkpoint.last_record_hash = window.records[1].record_hash;
  checkpoint.records_archived = 2;
  window.checkpoints.push_back(checkpoint);
  window.records.erase(window.records.begin(), window.records.begin() + 2);

  CHECK(ledger::verify_window(window).empty());
}

TEST_CASE("verify_window: first record linked to the wrong checkpoint", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 6);
  auto window = f.window("ws-1");

  // Two checkpoints; the survivor links to the older one.
  domain::ArchiveCheckpoint older;
  older.id = "cp-old";
  older.last_record_id = window.records[1].id;
  older.last_record_created_at = window.records[1].created_at;
  older.last_record_hash = window.records[1].record_hash;
  older.records_archived = 2;
  domain::ArchiveCheckpoint newer = older;
  newer.id = "cp-new";
  newer.last_record_id = window.records[3].id;
  newer.last_record_created_at = window.records[3].created_at;
  newer.last_record_hash = window.records[3].record_hash;
  window.checkpoints = {older, newer};

  window.records.erase(window.records.begin(), window.records.begin() + 4);
  window.records[0].previous_hash = older.last_record_hash;
  window.records[0].record_hash = ledger::compute_record_hash(window.records[0]);
  window.records[1].previous_hash = window.records[0].record_hash;
  window.records[1].record_hash = ledger::compute_record_hash(window.records[1]);

  const auto findings = ledger::verify_window(window);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].reason == domain::FindingReason::kPreviousHashMismatch);
}

TEST_CASE("verify_window: truncated window links to its predecessor", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 10);
  auto window = f.store.read_window(domain::ChainScope::workspace("ws-1"), 5);
  REQUIRE(window.has_value());
  CHECK(window.value().records.size() == 5);
  REQUIRE(window.value().predecessor.has_value());
  CHECK(ledger::verify_window(window.value()).empty());
}

// ── verify_chain ────────────────────────────────────────────────────────────

TEST_CASE("verify_chain: every scope is verified independently", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append(std::nullopt, 3);
  f.append("ws-1", 4);
  f.append("ws-2", 2);

  auto report = ledger::verify_chain(f.store, std::nullopt, std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().scopes_checked == 3);
  CHECK(report.value().records_checked == 9);
  CHECK(report.value().findings.empty());
}

TEST_CASE("verify_chain: bounded scan checks only the newest records", "[ledger][verifier]") {
  VerifierChainFixture f;
  f.append("ws-1", 20);

  auto report = ledger::verify_chain(f.store, domain::ChainScope::workspace("ws-1"), 5);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().scopes_checked == 1);
  CHECK(report.value().records_checked == 5);
}

TEST_CASE("verify_chain: scope with no records verifies clean", "[ledger][verifier]") {
  storage::InMemoryLedgerStore store;
  auto report = ledger::verify_chain(store, domain::ChainScope::workspace("none"), std::nullopt);
  REQUIRE(report.has_value());
  CHECK(report.value().valid);
  CHECK(report.value().records_checked == 0);
}
