#pragma once

#include <string>
#include <utility>

namespace auditchain::ledger {
class ImmutabilityGuard;
}  // namespace auditchain::ledger

namespace auditchain::storage {

class ILedgerTransaction;

// MaintenanceWindow is the capability required to delete committed records.
//
// Only ImmutabilityGuard can create one, it is bound to exactly one open
// transaction, and it is closed before run_maintenance() returns. A store
// rejects deletion unless window.covers(transaction) holds.
class MaintenanceWindow {
 public:
  ~MaintenanceWindow() = default;

  MaintenanceWindow(const MaintenanceWindow&) = delete;
  MaintenanceWindow& operator=(const MaintenanceWindow&) = delete;
  MaintenanceWindow(MaintenanceWindow&&) = delete;
  MaintenanceWindow& operator=(MaintenanceWindow&&) = delete;

  [[nodiscard]] bool is_open() const { return open_; }
  [[nodiscard]] bool covers(const ILedgerTransaction& tx) const { return open_ && &tx == tx_; }
  [[nodiscard]] const std::string& id() const { return id_; }

 private:
  friend class ledger::ImmutabilityGuard;

  MaintenanceWindow(const ILedgerTransaction& tx, std::string id)
      : tx_(&tx), id_(std::move(id)) {}

  void close() { open_ = false; }

  const ILedgerTransaction* tx_;
  std::string id_;
  bool open_{true};
};

}  // namespace auditchain::storage
