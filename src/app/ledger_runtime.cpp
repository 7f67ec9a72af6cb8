#include "auditchain/app/ledger_runtime.h"

#include "auditchain/storage/inmemory_ledger_store.h"
#include "auditchain/storage/sqlite/sqlite_db.h"
#include "auditchain/storage/sqlite/sqlite_ledger_store.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace auditchain::app {

namespace {

using OpenResult = core::Result<std::unique_ptr<storage::ILedgerStore>, std::string>;

OpenResult open_sqlite_store(const std::string& path, bool separate_reader) {
  auto db_result = storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    return OpenResult::err(db_result.error());
  }
  auto db = db_result.value();

  // ensure_schema_v2 chains v1; all schema migrations are idempotent.
  auto schema_result = db->ensure_schema_v2();
  if (!schema_result.has_value()) {
    return OpenResult::err("Failed to initialize schema: " + schema_result.error());
  }

  std::shared_ptr<storage::sqlite::SqliteDb> reader;
  if (separate_reader && !db->is_memory()) {
    auto reader_result = storage::sqlite::SqliteDb::open(path);
    if (!reader_result.has_value()) {
      return OpenResult::err("Failed to open reader connection: " + reader_result.error());
    }
    reader = reader_result.value();
  }

  return OpenResult::ok(
      std::make_unique<storage::sqlite::SqliteLedgerStore>(std::move(db), std::move(reader)));
}

}  // namespace

LedgerRuntime::~LedgerRuntime() = default;

core::Result<std::unique_ptr<LedgerRuntime>, std::string> LedgerRuntime::open(
    const RuntimeOptions& options, std::unique_ptr<shipping::ILogShipper> shipper,
    std::ostream& log) {
  using R = core::Result<std::unique_ptr<LedgerRuntime>, std::string>;

  std::unique_ptr<LedgerRuntime> runtime(new LedgerRuntime());

  if (options.db_path.has_value()) {
    auto store_result = open_sqlite_store(options.db_path.value(), options.separate_reader);
    if (!store_result.has_value()) {
      return R::err(store_result.error());
    }
    runtime->store_ = std::move(store_result.value());
    runtime->persistent_ = true;
  } else {
    runtime->store_ = std::make_unique<storage::InMemoryLedgerStore>();
  }

  if (options.archive_dir.has_value()) {
    std::error_code ec;
    std::filesystem::create_directories(options.archive_dir.value(), ec);
    if (ec) {
      return R::err("Failed to create archive directory '" + options.archive_dir.value() +
                    "': " + ec.message());
    }
    runtime->sink_ =
        std::make_unique<ledger::JsonlFileArchiveSink>(options.archive_dir.value(), runtime->clock_);
  }

  runtime->shipper_ =
      shipper != nullptr ? std::move(shipper) : std::make_unique<shipping::NullLogShipper>();

  runtime->appender_ = std::make_unique<ledger::ChainAppender>(
      *runtime->store_, runtime->clock_, runtime->ids_,
      ledger::AppenderOptions{options.ledger.lock_timeout});
  runtime->guard_ = std::make_unique<ledger::ImmutabilityGuard>(*runtime->appender_, runtime->ids_);
  runtime->archiver_ = std::make_unique<ledger::ArchiveManager>(
      *runtime->store_, *runtime->appender_, *runtime->guard_, runtime->ids_, runtime->clock_,
      runtime->sink_.get());
  runtime->ledger_ = std::make_unique<ledger::AuditLedger>(*runtime->appender_, *runtime->archiver_,
                                                           *runtime->store_, *runtime->shipper_,
                                                           options.ledger, log);

  return R::ok(std::move(runtime));
}

}  // namespace auditchain::app
