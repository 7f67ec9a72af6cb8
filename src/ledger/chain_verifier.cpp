#include "auditchain/ledger/chain_verifier.h"

#include "auditchain/ledger/record_hash.h"

#include <algorithm>

namespace auditchain::ledger {

using domain::ArchiveCheckpoint;
using domain::AuditRecord;
using domain::Finding;
using domain::FindingReason;

namespace {

Finding make_finding(const AuditRecord& record, FindingReason reason, std::string detail) {
  Finding finding;
  finding.record_id = record.id;
  finding.is_valid = false;
  finding.error_message = std::string(domain::to_message(reason));
  finding.reason = reason;
  finding.created_at = record.created_at;
  finding.detail = std::move(detail);
  return finding;
}

// Newest checkpoint whose anchored record is not after created_at.
const ArchiveCheckpoint* nearest_checkpoint(const std::vector<ArchiveCheckpoint>& checkpoints,
                                            core::Timestamp created_at) {
  const ArchiveCheckpoint* best = nullptr;
  for (const auto& checkpoint : checkpoints) {
    if (checkpoint.last_record_created_at > created_at) {
      continue;
    }
    if (best == nullptr || checkpoint.last_record_created_at >= best->last_record_created_at) {
      best = &checkpoint;
    }
  }
  return best;
}

bool is_known_origin(const std::string& previous_hash,
                     const std::vector<ArchiveCheckpoint>& checkpoints) {
  if (previous_hash == kGenesisHash) {
    return true;
  }
  return std::any_of(checkpoints.begin(), checkpoints.end(), [&](const ArchiveCheckpoint& c) {
    return c.last_record_hash == previous_hash;
  });
}

}  // namespace

std::vector<Finding> verify_window(const storage::ChainWindow& window) {
  std::vector<Finding> findings;

  const AuditRecord* prev = window.predecessor.has_value() ? &window.predecessor.value() : nullptr;
  std::string prev_recomputed = prev != nullptr ? compute_record_hash(*prev) : std::string{};

  for (const auto& record : window.records) {
    if (prev == nullptr) {
      const ArchiveCheckpoint* anchor = nearest_checkpoint(window.checkpoints, record.created_at);
      const std::string expected =
          anchor != nullptr ? anchor->last_record_hash : std::string(kGenesisHash);

      if (record.previous_hash != expected) {
        if (is_known_origin(record.previous_hash, window.checkpoints)) {
          findings.push_back(make_finding(record, FindingReason::kPreviousHashMismatch,
                                          "expected " + expected + ", found " +
                                              record.previous_hash));
        } else {
          findings.push_back(make_finding(record, FindingReason::kChainOriginNotFound,
                                          "previous_hash " + record.previous_hash +
                                              " matches neither genesis nor any checkpoint"));
        }
        prev = &record;
        prev_recomputed = compute_record_hash(record);
        continue;
      }
    } else if (record.previous_hash != prev->record_hash &&
               record.previous_hash != prev_recomputed) {
      findings.push_back(make_finding(record, FindingReason::kPreviousHashMismatch,
                                      "expected " + prev->record_hash + " (record " + prev->id +
                                          "), found " + record.previous_hash));
      prev = &record;
      prev_recomputed = compute_record_hash(record);
      continue;
    }

    std::string recomputed = compute_record_hash(record);
    if (recomputed != record.record_hash) {
      findings.push_back(make_finding(record, FindingReason::kRecordHashMismatch,
                                      "stored " + record.record_hash + ", computed " + recomputed));
    }
    prev = &record;
    prev_recomputed = std::move(recomputed);
  }

  return findings;
}

core::LedgerResult<VerificationReport> verify_chain(const storage::IChainReader& reader,
                                                    const std::optional<domain::ChainScope>& scope,
                                                    std::optional<std::size_t> limit) {
  std::vector<domain::ChainScope> scopes;
  if (scope.has_value()) {
    scopes.push_back(scope.value());
  } else {
    auto listed = reader.list_scopes();
    if (!listed.has_value()) {
      return core::LedgerResult<VerificationReport>::err(listed.error());
    }
    scopes = std::move(listed.value());
  }

  VerificationReport report;
  for (const auto& s : scopes) {
    auto window = reader.read_window(s, limit);
    if (!window.has_value()) {
      return core::LedgerResult<VerificationReport>::err(window.error());
    }
    report.records_checked += window.value().records.size();
    ++report.scopes_checked;

    auto findings = verify_window(window.value());
    report.findings.insert(report.findings.end(), std::make_move_iterator(findings.begin()),
                           std::make_move_iterator(findings.end()));
  }

  std::stable_sort(report.findings.begin(), report.findings.end(),
                   [](const Finding& a, const Finding& b) {
                     if (a.created_at != b.created_at) {
                       return a.created_at < b.created_at;
                     }
                     return a.record_id < b.record_id;
                   });
  report.valid = report.findings.empty();
  return core::LedgerResult<VerificationReport>::ok(std::move(report));
}

}  // namespace auditchain::ledger
