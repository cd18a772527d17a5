//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/timestamp.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>

namespace evnorm {

namespace {

using namespace std::chrono;

/// Consumes exactly `n` digits.
template <class Iterator>
auto parse_digits(Iterator& f, const Iterator& l, size_t n, unsigned& x)
  -> bool {
  auto result = 0u;
  for (auto i = size_t{0}; i < n; ++i, ++f) {
    if (f == l or *f < '0' or *f > '9') {
      return false;
    }
    result = result * 10 + static_cast<unsigned>(*f - '0');
  }
  x = result;
  return true;
}

template <class Iterator>
auto parse_char(Iterator& f, const Iterator& l, char c) -> bool {
  if (f == l or *f != c) {
    return false;
  }
  ++f;
  return true;
}

auto make_time(int y, unsigned mo, unsigned d, unsigned h, unsigned mi,
               unsigned s) -> std::optional<time> {
  const auto ymd = year_month_day{year{y}, month{mo}, day{d}};
  if (not ymd.ok() or h > 23 or mi > 59 or s > 60) {
    return std::nullopt;
  }
  // Leap seconds collapse onto the following second.
  return time{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s};
}

} // namespace

auto parse_rfc3339(std::string_view str) -> std::optional<time> {
  auto f = str.begin();
  const auto l = str.end();
  auto y = 0u;
  auto mo = 0u;
  auto d = 0u;
  auto h = 0u;
  auto mi = 0u;
  auto s = 0u;
  // clang-format off
  if (not (parse_digits(f, l, 4, y) and parse_char(f, l, '-')
           and parse_digits(f, l, 2, mo) and parse_char(f, l, '-')
           and parse_digits(f, l, 2, d))) {
    return std::nullopt;
  }
  // clang-format on
  if (f == l or (*f != 'T' and *f != 't')) {
    return std::nullopt;
  }
  ++f;
  // clang-format off
  if (not (parse_digits(f, l, 2, h) and parse_char(f, l, ':')
           and parse_digits(f, l, 2, mi) and parse_char(f, l, ':')
           and parse_digits(f, l, 2, s))) {
    return std::nullopt;
  }
  // clang-format on
  auto fraction = nanoseconds{0};
  if (f != l and *f == '.') {
    ++f;
    auto digits = 0;
    auto value = int64_t{0};
    while (f != l and *f >= '0' and *f <= '9') {
      if (digits == 9) {
        return std::nullopt;
      }
      value = value * 10 + (*f - '0');
      ++digits;
      ++f;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 9; ++digits) {
      value *= 10;
    }
    fraction = nanoseconds{value};
  }
  auto offset = minutes{0};
  if (f == l) {
    return std::nullopt;
  }
  if (*f == 'Z' or *f == 'z') {
    ++f;
  } else if (*f == '+' or *f == '-') {
    const auto sign = *f == '-' ? -1 : 1;
    ++f;
    auto oh = 0u;
    auto om = 0u;
    // clang-format off
    if (not (parse_digits(f, l, 2, oh) and parse_char(f, l, ':')
             and parse_digits(f, l, 2, om))
        or oh > 23 or om > 59) {
      return std::nullopt;
    }
    // clang-format on
    offset = sign * (hours{oh} + minutes{om});
  } else {
    return std::nullopt;
  }
  if (f != l) {
    return std::nullopt;
  }
  auto result = make_time(static_cast<int>(y), mo, d, h, mi, s);
  if (not result) {
    return std::nullopt;
  }
  return *result + fraction - offset;
}

auto parse_epoch(std::string_view str) -> std::optional<time> {
  auto value = int64_t{0};
  const auto* const first = str.data();
  const auto* const last = str.data() + str.size();
  if (str.empty() or str.size() > 19 or str.front() == '-') {
    return std::nullopt;
  }
  auto [ptr, err] = std::from_chars(first, last, value);
  if (err != std::errc{} or ptr != last) {
    return std::nullopt;
  }
  if (str.size() <= 10) {
    return time{seconds{value}};
  }
  if (str.size() <= 13) {
    return time{milliseconds{value}};
  }
  if (str.size() <= 16) {
    return time{microseconds{value}};
  }
  return time{nanoseconds{value}};
}

auto parse_month(std::string_view str) -> std::optional<unsigned> {
  static constexpr auto months = std::array<std::string_view, 12>{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
  };
  for (auto i = 0u; i < months.size(); ++i) {
    if (months[i] == str) {
      return i + 1;
    }
  }
  return std::nullopt;
}

auto resolve(const bsd_timestamp& ts, std::optional<time> reference,
             minutes utc_offset) -> std::optional<time> {
  auto to_utc = [&](int y) -> std::optional<time> {
    auto local = make_time(y, ts.month, ts.day, ts.hour, ts.minute, ts.second);
    if (not local) {
      return std::nullopt;
    }
    return *local - utc_offset;
  };
  if (ts.year) {
    return to_utc(*ts.year);
  }
  if (not reference) {
    return std::nullopt;
  }
  const auto ref_local = *reference + utc_offset;
  const auto ref_year
    = static_cast<int>(year_month_day{floor<days>(ref_local)}.year());
  auto result = to_utc(ref_year);
  // A timestamp in the near future is clock skew; one further out belongs to
  // the previous year, e.g., a December message received in January.
  if (not result or *result > *reference + days{1}) {
    if (auto previous = to_utc(ref_year - 1)) {
      return previous;
    }
  }
  return result;
}

auto to_string(time x) -> std::string {
  const auto day_point = floor<days>(x);
  const auto ymd = year_month_day{day_point};
  const auto hms = hh_mm_ss<nanoseconds>{x - day_point};
  auto result = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                            static_cast<int>(ymd.year()),
                            static_cast<unsigned>(ymd.month()),
                            static_cast<unsigned>(ymd.day()),
                            hms.hours().count(), hms.minutes().count(),
                            hms.seconds().count());
  if (auto ns = hms.subseconds().count(); ns != 0) {
    auto fraction = fmt::format("{:09}", ns);
    fraction.erase(fraction.find_last_not_of('0') + 1);
    result += '.';
    result += fraction;
  }
  result += 'Z';
  return result;
}

} // namespace evnorm
