#include "auditchain/ledger/archive_manager.h"

#include "auditchain/ledger/ledger_actions.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace auditchain::ledger {

using core::LedgerError;
using core::LedgerErrorCode;
using json = nlohmann::json;

namespace {

LedgerError inconsistency(const std::string& step, const LedgerError& cause) {
  return LedgerError{LedgerErrorCode::kArchivalInconsistency,
                     step + " failed (" + std::string(core::to_string(cause.code)) +
                         "): " + cause.message};
}

}  // namespace

ArchiveManager::ArchiveManager(storage::ILedgerStore& store, ChainAppender& appender,
                               ImmutabilityGuard& guard, core::IIdGenerator& ids,
                               core::IClock& clock, IArchiveSink* sink)
    : store_(store), appender_(appender), guard_(guard), ids_(ids), clock_(clock), sink_(sink) {}

core::LedgerResult<ArchiveOutcome> ArchiveManager::archive(const ArchiveRequest& request) {
  using R = core::LedgerResult<ArchiveOutcome>;

  auto begun = store_.begin(request.scope, appender_.options().lock_timeout);
  if (!begun.has_value()) {
    return R::err(begun.error());
  }
  auto& tx = begun.value();

  auto selected = tx->select_older_than(request.older_than);
  if (!selected.has_value()) {
    return R::err(selected.error());
  }
  const auto& records = selected.value();

  ArchiveOutcome outcome;
  outcome.dry_run = request.dry_run;
  if (records.empty()) {
    return R::ok(outcome);
  }

  const auto& newest = records.back();
  domain::ArchiveCheckpoint checkpoint;
  checkpoint.id = ids_.next();
  checkpoint.last_record_id = newest.id;
  checkpoint.last_record_created_at = newest.created_at;
  checkpoint.last_record_hash = newest.record_hash;
  checkpoint.records_archived = static_cast<std::int64_t>(records.size());
  checkpoint.workspace_id = request.scope.workspace_id;
  checkpoint.archived_at = clock_.now();
  checkpoint.created_by = request.actor_user_id;

  outcome.records_archived = records.size();
  outcome.oldest_archived = records.front().created_at;
  outcome.newest_archived = newest.created_at;

  if (request.dry_run) {
    outcome.checkpoint = checkpoint;
    return R::ok(outcome);
  }

  if (sink_ != nullptr) {
    auto receipt = sink_->store(request.scope, records);
    if (!receipt.has_value()) {
      return core::ledger_error<ArchiveOutcome>(LedgerErrorCode::kStorageError,
                                                "archive export failed: " + receipt.error());
    }
    checkpoint.archive_location = receipt.value().location;
    checkpoint.archive_checksum = receipt.value().checksum;
  }

  std::vector<std::string> ids;
  ids.reserve(records.size());
  for (const auto& record : records) {
    ids.push_back(record.id);
  }

  MaintenanceRequest maintenance;
  maintenance.actor_user_id = request.actor_user_id;
  maintenance.reason = "archive";
  maintenance.details = json{{"older_than", core::format_iso8601_millis(request.older_than)},
                             {"records", records.size()}};

  auto maintained = guard_.run_maintenance(
      *tx, maintenance,
      [&](const storage::MaintenanceWindow& window) -> core::LedgerResult<bool> {
        auto inserted = tx->insert_checkpoint(checkpoint);
        if (!inserted.has_value()) {
          return core::LedgerResult<bool>::err(inconsistency("checkpoint insert", inserted.error()));
        }

        domain::AuditEventInput event;
        event.actor_user_id = request.actor_user_id;
        event.workspace_id = request.scope.workspace_id;
        event.action = std::string(kActionRecordsArchived);
        event.resource_type = std::string(kLedgerResourceType);
        event.resource_id = checkpoint.id;
        event.details = json{
            {"records_archived", checkpoint.records_archived},
            {"oldest_record", core::format_iso8601_millis(records.front().created_at)},
            {"newest_record", core::format_iso8601_millis(newest.created_at)},
            {"older_than", core::format_iso8601_millis(request.older_than)},
            {"archive_location", checkpoint.archive_location.has_value()
                                     ? json(checkpoint.archive_location.value())
                                     : json(nullptr)},
            {"checkpoint_id", checkpoint.id},
        };
        auto logged = appender_.append_in(*tx, event);
        if (!logged.has_value()) {
          return core::LedgerResult<bool>::err(inconsistency("archive event", logged.error()));
        }

        auto removed = tx->delete_records(ids, window);
        if (!removed.has_value()) {
          if (removed.error().code == LedgerErrorCode::kImmutabilityViolation) {
            return core::LedgerResult<bool>::err(removed.error());
          }
          return core::LedgerResult<bool>::err(inconsistency("record deletion", removed.error()));
        }
        if (removed.value() != ids.size()) {
          return core::ledger_error<bool>(
              LedgerErrorCode::kArchivalInconsistency,
              "deleted " + std::to_string(removed.value()) + " of " + std::to_string(ids.size()) +
                  " selected records");
        }
        return core::LedgerResult<bool>::ok(true);
      });

  if (!maintained.has_value()) {
    // Roll back before touching the chain again.
    tx.reset();
    const LedgerError error = maintained.error();
    if (error.code == LedgerErrorCode::kImmutabilityViolation) {
      auto violation = guard_.record_violation(request.scope, request.actor_user_id, error.message);
      if (!violation.has_value()) {
        std::cerr << "WARNING: failed to record immutability violation: "
                  << violation.error().message << "\n";
      }
    }
    return R::err(error);
  }

  auto committed = tx->commit();
  if (!committed.has_value()) {
    return R::err(inconsistency("archive commit", committed.error()));
  }

  outcome.checkpoint = std::move(checkpoint);
  return R::ok(outcome);
}

core::Timestamp retention_cutoff(core::Timestamp now, int months) {
  return core::subtract_months(now, months);
}

}  // namespace auditchain::ledger
