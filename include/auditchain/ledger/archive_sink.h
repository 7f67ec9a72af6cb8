#pragma once

#include "auditchain/core/clock.h"
#include "auditchain/core/result.h"
#include "auditchain/domain/audit_record.h"
#include "auditchain/domain/chain_scope.h"

#include <filesystem>
#include <string>
#include <vector>

namespace auditchain::ledger {

struct ArchiveReceipt {
  std::string location;  // NOLINT(readability-identifier-naming)
  std::string checksum;  // NOLINT(readability-identifier-naming)
};

// IArchiveSink receives records before archival deletes them.
// A failed store() aborts the archival run; nothing is deleted.
class IArchiveSink {
 public:
  virtual ~IArchiveSink() = default;

  [[nodiscard]] virtual core::Result<ArchiveReceipt, std::string> store(
      const domain::ChainScope& scope, const std::vector<domain::AuditRecord>& records) = 0;

 protected:
  IArchiveSink() = default;
  IArchiveSink(const IArchiveSink&) = default;
  IArchiveSink& operator=(const IArchiveSink&) = default;
  IArchiveSink(IArchiveSink&&) = default;
  IArchiveSink& operator=(IArchiveSink&&) = default;
};

// JsonlFileArchiveSink writes one JSON record per line to a new file under
// directory and reports the file's SHA-256 as the checksum.
//
// The content goes to <name>.partial first and is fsynced, renamed to <name>
// and the directory fsynced, all before store() returns a receipt.
class JsonlFileArchiveSink final : public IArchiveSink {
 public:
  JsonlFileArchiveSink(std::filesystem::path directory, core::IClock& clock);

  [[nodiscard]] core::Result<ArchiveReceipt, std::string> store(
      const domain::ChainScope& scope, const std::vector<domain::AuditRecord>& records) override;

 private:
  std::filesystem::path directory_;
  core::IClock& clock_;
};

}  // namespace auditchain::ledger
