#pragma once

#include "auditchain/core/result.h"
#include "auditchain/domain/chain_scope.h"
#include "auditchain/domain/finding.h"
#include "auditchain/storage/ledger_store.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace auditchain::ledger {

// verify_window replays one scope snapshot and returns every violation.
//
// For each record, in order:
//   1. Link check against the preceding record in the window, else the
//      window's predecessor, else the nearest checkpoint at or before the
//      record, else kGenesisHash. A link to a predecessor holds when
//      previous_hash equals either its stored record_hash or its recomputed
//      hash, so a record altered in place is reported once, on itself.
//      The first record with no predecessor whose previous_hash matches
//      neither genesis nor any checkpoint of the scope is
//      "Chain origin not found".
//   2. When the link holds, recompute the hash and compare with record_hash.
//
// At most one finding per record. Pure: no I/O, safe to call concurrently.
[[nodiscard]] std::vector<domain::Finding> verify_window(const storage::ChainWindow& window);

// VerificationReport adds the scan size to the findings for admin surfaces.
struct VerificationReport {
  bool valid{true};                       // NOLINT(readability-identifier-naming)
  std::size_t records_checked{0};         // NOLINT(readability-identifier-naming)
  std::size_t scopes_checked{0};          // NOLINT(readability-identifier-naming)
  std::vector<domain::Finding> findings;  // NOLINT(readability-identifier-naming)
};

// verify_chain reads each requested scope through reader and verifies it.
// scope == nullopt verifies every scope independently; limit applies per scope.
// Findings are ordered by (created_at, record_id).
[[nodiscard]] core::LedgerResult<VerificationReport> verify_chain(
    const storage::IChainReader& reader, const std::optional<domain::ChainScope>& scope,
    std::optional<std::size_t> limit);

}  // namespace auditchain::ledger
