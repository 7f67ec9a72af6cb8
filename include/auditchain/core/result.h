#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace auditchain::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// LedgerErrorCode is the closed set of failures a ledger operation can report.
// Verification findings are data, not errors, and never appear here.
enum class LedgerErrorCode {
  kWriteConflict,          // scope lock not acquired in time, or a competing link; retryable
  kStorageError,           // durable store failure; fatal to the request
  kImmutabilityViolation,  // mutation of a committed record outside maintenance
  kArchivalInconsistency,  // checkpoint and deletion could not commit together
  kInvalidInput,           // malformed event or a scope mismatch
};

struct LedgerError {
  LedgerErrorCode code{LedgerErrorCode::kStorageError};  // NOLINT(readability-identifier-naming)
  std::string message;                                   // NOLINT(readability-identifier-naming)
};

[[nodiscard]] constexpr std::string_view to_string(LedgerErrorCode code) noexcept {
  switch (code) {
    case LedgerErrorCode::kWriteConflict:
      return "WriteConflict";
    case LedgerErrorCode::kStorageError:
      return "StorageError";
    case LedgerErrorCode::kImmutabilityViolation:
      return "ImmutabilityViolation";
    case LedgerErrorCode::kArchivalInconsistency:
      return "ArchivalInconsistency";
    case LedgerErrorCode::kInvalidInput:
      return "InvalidInput";
  }
  return "Unknown";
}

[[nodiscard]] constexpr bool is_retryable(LedgerErrorCode code) noexcept {
  return code == LedgerErrorCode::kWriteConflict;
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] T& value() { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

// Shorthand for the ledger's error channel.
template <typename T>
using LedgerResult = Result<T, LedgerError>;

template <typename T>
[[nodiscard]] LedgerResult<T> ledger_error(LedgerErrorCode code, std::string message) {
  return LedgerResult<T>::err(LedgerError{code, std::move(message)});
}

}  // namespace auditchain::core
