#pragma once

#include "auditchain/core/time.h"
#include "auditchain/domain/chain_scope.h"

#include <cstdint>
#include <optional>
#include <string>

namespace auditchain::domain {

// ArchiveCheckpoint anchors a chain across records removed by archival.
// The first surviving record after the gap links to last_record_hash.
// Checkpoints are written once and never updated or deleted.
struct ArchiveCheckpoint {
  std::string id;                           // NOLINT(readability-identifier-naming)
  std::string last_record_id;               // NOLINT(readability-identifier-naming)
  core::Timestamp last_record_created_at;   // NOLINT(readability-identifier-naming)
  std::string last_record_hash;             // NOLINT(readability-identifier-naming)
  std::int64_t records_archived{0};         // NOLINT(readability-identifier-naming)
  std::optional<std::string> workspace_id;  // NOLINT(readability-identifier-naming)
  core::Timestamp archived_at;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> archive_location;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> archive_checksum;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> created_by;        // NOLINT(readability-identifier-naming)

  [[nodiscard]] ChainScope scope() const { return ChainScope{workspace_id}; }
};

}  // namespace auditchain::domain
