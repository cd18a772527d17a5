//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/detail/string.hpp"
#include "evnorm/error.hpp"
#include "evnorm/logger.hpp"
#include "evnorm/syslog.hpp"
#include "evnorm/timestamp.hpp"

#include <algorithm>

namespace evnorm {

namespace {

auto is_digit(char c) -> bool {
  return c >= '0' and c <= '9';
}

/// Parses a BSD timestamp: `Mmm dd hh:mm:ss` or `Mmm dd yyyy hh:mm:ss`, where
/// a single-digit day may be padded with a space.
struct bsd_timestamp_parser {
  bool with_year = false;

  template <class Iterator>
  auto parse_number(Iterator& f, const Iterator& l, size_t min_digits,
                    size_t max_digits, unsigned& x) const -> bool {
    auto digits = size_t{0};
    auto result = 0u;
    while (f != l and digits < max_digits and is_digit(*f)) {
      result = result * 10 + static_cast<unsigned>(*f - '0');
      ++digits;
      ++f;
    }
    x = result;
    return digits >= min_digits;
  }

  template <class Iterator>
  auto parse(Iterator& f, const Iterator& l, bsd_timestamp& x) const -> bool {
    auto i = f;
    if (l - i < 3) {
      return false;
    }
    auto month = parse_month(std::string_view{&*i, 3});
    if (not month) {
      return false;
    }
    x.month = *month;
    i += 3;
    // One or more spaces separate month and day.
    if (i == l or *i != ' ') {
      return false;
    }
    while (i != l and *i == ' ') {
      ++i;
    }
    if (not parse_number(i, l, 1, 2, x.day)) {
      return false;
    }
    if (i == l or *i++ != ' ') {
      return false;
    }
    if (with_year) {
      auto year = 0u;
      if (not parse_number(i, l, 4, 4, year) or i == l or *i++ != ' ') {
        return false;
      }
      x.year = static_cast<int>(year);
    } else {
      x.year = std::nullopt;
    }
    // clang-format off
    if (not (parse_number(i, l, 2, 2, x.hour)
             and i != l and *i++ == ':'
             and parse_number(i, l, 2, 2, x.minute)
             and i != l and *i++ == ':'
             and parse_number(i, l, 2, 2, x.second))) {
      return false;
    }
    // clang-format on
    // The timestamp must end at a word boundary.
    if (i != l and not detail::is_blank(*i)) {
      return false;
    }
    f = i;
    return true;
  }
};

/// The outcome of matching a `TAG[PID]:` token.
struct tag {
  std::optional<std::string> app_name;
  std::optional<std::string> proc_id;
};

auto is_tag_char(char c) -> bool {
  return (c >= 'A' and c <= 'Z') or (c >= 'a' and c <= 'z') or is_digit(c)
         or c == '.' or c == '_' or c == '/' or c == '-';
}

/// Matches a whitespace-delimited token against `TAG[PID]:` and `TAG:`.
auto parse_tag(std::string_view token) -> std::optional<tag> {
  if (not token.ends_with(':')) {
    return std::nullopt;
  }
  token.remove_suffix(1);
  auto result = tag{};
  if (token.ends_with(']')) {
    const auto open = token.find('[');
    if (open == std::string_view::npos or open + 2 > token.size() - 1) {
      return std::nullopt;
    }
    const auto pid = token.substr(open + 1, token.size() - open - 2);
    if (pid.find_first_of("[]") != std::string_view::npos) {
      return std::nullopt;
    }
    result.proc_id = std::string{pid};
    token = token.substr(0, open);
  }
  if (not std::all_of(token.begin(), token.end(), is_tag_char)) {
    return std::nullopt;
  }
  if (not token.empty()) {
    result.app_name = std::string{token};
  }
  return result;
}

/// Splits off the next blank-delimited token.
auto next_token(std::string_view str) -> std::pair<std::string_view, size_t> {
  auto end = size_t{0};
  while (end < str.size() and not detail::is_blank(str[end])) {
    ++end;
  }
  return {str.substr(0, end), end};
}

auto skip_one_blank(std::string_view str) -> std::string_view {
  if (not str.empty() and detail::is_blank(str.front())) {
    str.remove_prefix(1);
  }
  return str;
}

auto skip_blanks(std::string_view str) -> std::string_view {
  while (not str.empty() and detail::is_blank(str.front())) {
    str.remove_prefix(1);
  }
  return str;
}

void parse_timestamp(std::string_view text, std::string_view& str, event& x,
                     const syslog_options& opts) {
  const auto offset = [&](std::string_view s) {
    return text.size() - s.size();
  };
  const auto begin = offset(str);
  for (auto with_year : {false, true}) {
    auto ts = bsd_timestamp{};
    auto f = str.begin();
    if (not bsd_timestamp_parser{with_year}.parse(f, str.end(), ts)) {
      continue;
    }
    str.remove_prefix(f - str.begin());
    const auto source = location{begin, offset(str)};
    if (not ts.year and not opts.reference_time) {
      diagnostic::note("timestamp without year left unset")
        .primary(source)
        .hint("provide a reference time to resolve the year")
        .emit(x.diagnostics);
      return;
    }
    x.timestamp = resolve(ts, opts.reference_time, opts.utc_offset);
    if (not x.timestamp) {
      diagnostic::warning("invalid date in timestamp")
        .primary(source)
        .emit(x.diagnostics);
    }
    return;
  }
  const auto [token, length] = next_token(str);
  if (auto ts = parse_rfc3339(token)) {
    x.timestamp = *ts;
    str.remove_prefix(length);
  }
}

} // namespace

auto parse_rfc3164(std::string_view text, const syslog_options& opts)
  -> caf::expected<event> {
  if (text.empty()) {
    return caf::make_error(ec::parse_error, "rfc3164: empty message");
  }
  auto result = event{};
  result.kind = record_kind::rfc3164;
  auto str = text;
  if (auto prival = detail::consume_pri(str)) {
    detail::apply_priority(result, *prival,
                           location{0, text.size() - str.size()});
  }
  str = skip_blanks(str);
  parse_timestamp(text, str, result, opts);
  str = skip_blanks(str);
  // A tag may directly follow the timestamp, otherwise it must follow the
  // hostname. Without a tag there is no header to speak of.
  const auto [first, first_length] = next_token(str);
  if (auto t = parse_tag(first)) {
    result.app_name = std::move(t->app_name);
    result.proc_id = std::move(t->proc_id);
    result.message = std::string{skip_one_blank(str.substr(first_length))};
    return result;
  }
  const auto remainder = skip_blanks(str.substr(first_length));
  const auto [second, second_length] = next_token(remainder);
  if (not first.empty() and not second.empty()) {
    if (auto t = parse_tag(second)) {
      result.hostname = opts.lowercase_hostname ? detail::to_lower(first)
                                                : std::string{first};
      result.app_name = std::move(t->app_name);
      result.proc_id = std::move(t->proc_id);
      result.message
        = std::string{skip_one_blank(remainder.substr(second_length))};
      return result;
    }
  }
  EVNORM_DEBUG("rfc3164: no tag found, keeping the remainder as message");
  result.message = std::string{str};
  return result;
}

} // namespace evnorm
