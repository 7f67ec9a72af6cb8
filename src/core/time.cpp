#include "auditchain/core/time.h"

#include <array>
#include <cstdio>

namespace auditchain::core {

namespace {

bool parse_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::string format_iso8601_millis(const Timestamp ts) {
  using namespace std::chrono;

  const auto day_point = floor<days>(ts);
  const year_month_day ymd{day_point};
  const hh_mm_ss<milliseconds> tod{ts - day_point};

  std::array<char, 32> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                static_cast<int>(tod.minutes().count()), static_cast<int>(tod.seconds().count()),
                static_cast<int>(tod.subseconds().count()));
  return std::string{buffer.data()};
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
  using namespace std::chrono;

  int y = 0;
  int mo = 0;
  int d = 0;
  if (!parse_digits(text, 0, 4, y) || text.size() < 10 || text[4] != '-' ||
      !parse_digits(text, 5, 2, mo) || text[7] != '-' || !parse_digits(text, 8, 2, d)) {
    return std::nullopt;
  }

  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                           day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  const Timestamp midnight = time_point_cast<milliseconds>(sys_days{ymd});

  if (text.size() == 10) {
    return midnight;
  }

  int hh = 0;
  int mm = 0;
  int ss = 0;
  if (text.size() < 20 || (text[10] != 'T' && text[10] != 't') || !parse_digits(text, 11, 2, hh) ||
      text[13] != ':' || !parse_digits(text, 14, 2, mm) || text[16] != ':' ||
      !parse_digits(text, 17, 2, ss)) {
    return std::nullopt;
  }
  if (hh > 23 || mm > 59 || ss > 59) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  int millis = 0;
  if (text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0 || digits > 3) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  if (pos + 1 != text.size() || (text[pos] != 'Z' && text[pos] != 'z')) {
    return std::nullopt;
  }

  return midnight + hours{hh} + minutes{mm} + seconds{ss} + milliseconds{millis};
}

Timestamp subtract_months(const Timestamp ts, const int months) {
  using namespace std::chrono;

  const auto day_point = floor<days>(ts);
  const auto time_of_day = ts - day_point;
  const year_month_day ymd{day_point};

  year_month_day target = ymd - std::chrono::months{months};
  if (!target.ok()) {
    target = year_month_day_last{target.year(), month_day_last{target.month()}};
  }
  return time_point_cast<milliseconds>(sys_days{target}) + time_of_day;
}

}  // namespace auditchain::core
