#pragma once

#include <optional>
#include <string>

namespace auditchain::server {

// AuditChainVerifyMode controls hash-chain verification at startup.
// kOff  - no verification performed (default)
// kWarn - verify every scope; print a WARNING per finding and keep serving
// kFail - verify every scope; refuse to start if any finding is reported
enum class AuditChainVerifyMode {
  kOff,   // NOLINT(readability-identifier-naming)
  kWarn,  // NOLINT(readability-identifier-naming)
  kFail,  // NOLINT(readability-identifier-naming)
};

// LedgerServerConfig holds all parsed startup flags for the ledger server.
// Every field has an explicit default; optional fields mean "not configured".
struct LedgerServerConfig {
  std::optional<std::string> db_path;      // NOLINT(readability-identifier-naming)
  bool separate_reader{false};             // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> archive_dir;  // NOLINT(readability-identifier-naming)
  int lock_timeout_ms{2000};               // NOLINT(readability-identifier-naming)
  int append_attempts{3};                  // NOLINT(readability-identifier-naming)
  AuditChainVerifyMode verify_on_startup{  // NOLINT(readability-identifier-naming)
                                         AuditChainVerifyMode::kOff};
  // Set to false by any flag handler that rejected its value.
  bool flags_valid{true};  // NOLINT(readability-identifier-naming)
};

LedgerServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace auditchain::server
