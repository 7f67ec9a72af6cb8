#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace auditchain::core {

using Clock = std::chrono::system_clock;

// Ledger timestamps carry millisecond precision end to end; the canonical hash
// encoding has exactly three fractional digits, so nothing finer is ever stored.
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

inline Timestamp now_utc() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return ts.time_since_epoch().count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// format_iso8601_millis renders ts as YYYY-MM-DDTHH:MM:SS.mmmZ (UTC).
[[nodiscard]] std::string format_iso8601_millis(Timestamp ts);

// parse_iso8601 accepts:
//   YYYY-MM-DD
//   YYYY-MM-DDTHH:MM:SSZ
//   YYYY-MM-DDTHH:MM:SS.mmmZ   (1 to 3 fractional digits)
// Only UTC ('Z') is accepted. Returns nullopt on any malformed or out-of-range field.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

// subtract_months moves ts back by calendar months, clamping the day to the
// end of the target month (2026-03-31 minus 1 month is 2026-02-28).
[[nodiscard]] Timestamp subtract_months(Timestamp ts, int months);

}  // namespace auditchain::core
