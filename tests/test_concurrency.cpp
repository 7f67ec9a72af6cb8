#include "auditchain/core/clock.h"
#include "auditchain/core/id_generator.h"
#include "auditchain/ledger/chain_appender.h"
#include "auditchain/ledger/chain_verifier.h"
#include "auditchain/storage/inmemory_ledger_store.h"
#include "auditchain/storage/sqlite/sqlite_db.h"
#include "auditchain/storage/sqlite/sqlite_ledger_store.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace auditchain;

static domain::AuditEventInput concurrent_event(int writer, int n) {
  domain::AuditEventInput event;
  event.actor_user_id = "writer-" + std::to_string(writer);
  event.workspace_id = "ws-shared";
  event.action = "document.update";
  event.resource_type = "document";
  event.resource_id = "doc-" + std::to_string(n);
  return event;
}

// Appends with a bounded number of retries on WriteConflict.
static bool append_with_retries(ledger::ChainAppender& appender,
                                const domain::AuditEventInput& event) {
  for (int attempt = 0; attempt < 20; ++attempt) {
    auto result = appender.append(event);
    if (result.has_value()) {
      return true;
    }
    if (!core::is_retryable(result.error().code)) {
      return false;
    }
  }
  return false;
}

static void check_single_chain(const storage::IChainReader& reader, std::size_t expected) {
  auto window = reader.read_window(domain::ChainScope::workspace("ws-shared"), std::nullopt);
  REQUIRE(window.has_value());
  const auto& records = window.value().records;
  CHECK(records.size() == expected);

  std::set<std::string> links;
  for (const auto& record : records) {
    links.insert(record.previous_hash);
  }
  CHECK(links.size() == records.size());
  for (std::size_t i = 1; i < records.size(); ++i) {
    CHECK(records[i].created_at > records[i - 1].created_at);
  }
  CHECK(ledger::verify_window(window.value()).empty());
}

TEST_CASE("Concurrent appenders on one store never fork the chain", "[concurrency][inmemory]") {
  constexpr int kWriters = 8;
  constexpr int kPerWriter = 50;

  core::SystemClock clock;
  core::SystemIdGenerator ids;
  storage::InMemoryLedgerStore store;
  ledger::ChainAppender appender(store, clock, ids,
                                 ledger::AppenderOptions{std::chrono::milliseconds{5000}});

  std::atomic<int> failures{0};
  std::vector<std::thread> writers;
  writers.reserve(kWriters);
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      for (int n = 0; n < kPerWriter; ++n) {
        if (!append_with_retries(appender, concurrent_event(w, n))) {
          ++failures;
        }
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }

  CHECK(failures.load() == 0);
  check_single_chain(store, kWriters * kPerWriter);
}

TEST_CASE("Appenders on separate SQLite connections serialize on the file",
          "[concurrency][sqlite]") {
  constexpr int kWriters = 3;
  constexpr int kPerWriter = 20;

  const auto dir = std::filesystem::temp_directory_path() / "auditchain_test_concurrency";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const std::string path = (dir / "ledger.db").string();

  {
    auto setup = storage::sqlite::SqliteDb::open(path);
    REQUIRE(setup.has_value());
    REQUIRE(setup.value()->ensure_schema_v2().has_value());
  }

  // One connection per writer, as separate server processes would have.
  std::vector<std::shared_ptr<storage::sqlite::SqliteDb>> connections;
  for (int w = 0; w < kWriters; ++w) {
    auto db = storage::sqlite::SqliteDb::open(path);
    REQUIRE(db.has_value());
    connections.push_back(db.value());
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> writers;
  writers.reserve(kWriters);
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      core::SystemClock clock;
      core::SystemIdGenerator ids;
      storage::sqlite::SqliteLedgerStore store(connections[static_cast<std::size_t>(w)]);
      ledger::ChainAppender appender(store, clock, ids,
                                     ledger::AppenderOptions{std::chrono::milliseconds{5000}});
      for (int n = 0; n < kPerWriter; ++n) {
        if (!append_with_retries(appender, concurrent_event(w, n))) {
          ++failures;
        }
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }

  CHECK(failures.load() == 0);
  storage::sqlite::SqliteLedgerStore verifier(connections.front());
  check_single_chain(verifier, kWriters * kPerWriter);
}
