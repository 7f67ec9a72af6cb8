#pragma once

#include "auditchain/domain/audit_record.h"

#include <string>

namespace auditchain::shipping {

struct ShipResult {
  bool delivered{false};  // NOLINT(readability-identifier-naming)
  std::string error;      // NOLINT(readability-identifier-naming)
};

// ILogShipper forwards committed records to an external log system.
//
// Called after commit only. Implementations must not throw; a failure is
// reported in ShipResult and never affects the chain.
class ILogShipper {
 public:
  virtual ~ILogShipper() = default;

  [[nodiscard]] virtual ShipResult ship(const domain::AuditRecord& record) = 0;

  // "disabled", "ok" or "error", for health reporting.
  [[nodiscard]] virtual std::string status() const = 0;

 protected:
  ILogShipper() = default;
  ILogShipper(const ILogShipper&) = default;
  ILogShipper& operator=(const ILogShipper&) = default;
  ILogShipper(ILogShipper&&) = default;
  ILogShipper& operator=(ILogShipper&&) = default;
};

// Shipping not configured.
class NullLogShipper final : public ILogShipper {
 public:
  [[nodiscard]] ShipResult ship(const domain::AuditRecord& /*record*/) override {
    return ShipResult{true, ""};
  }
  [[nodiscard]] std::string status() const override { return "disabled"; }
};

}  // namespace auditchain::shipping
