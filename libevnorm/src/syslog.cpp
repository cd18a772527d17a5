//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/syslog.hpp"

#include "evnorm/defaults.hpp"
#include "evnorm/detail/assert.hpp"
#include "evnorm/detail/string.hpp"
#include "evnorm/error.hpp"
#include "evnorm/logger.hpp"

#include <array>

namespace evnorm {

auto to_string(syslog_facility x) -> std::string_view {
  static constexpr auto names = std::array<std::string_view, 24>{
    "kern",   "user",   "mail",     "daemon",  "auth",         "syslog",
    "lpr",    "news",   "uucp",     "cron",    "authpriv",     "ftp",
    "ntp",    "security", "console", "solaris-cron", "local0",  "local1",
    "local2", "local3", "local4",   "local5",  "local6",       "local7",
  };
  const auto index = static_cast<size_t>(x);
  EVNORM_ASSERT(index < names.size());
  return names[index];
}

auto to_string(syslog_severity x) -> std::string_view {
  static constexpr auto names = std::array<std::string_view, 8>{
    "emergency", "alert",  "critical",      "error",
    "warning",   "notice", "informational", "debug",
  };
  const auto index = static_cast<size_t>(x);
  EVNORM_ASSERT(index < names.size());
  return names[index];
}

auto make_priority(uint16_t prival) -> std::optional<priority> {
  if (prival > defaults::syslog::max_prival) {
    return std::nullopt;
  }
  return priority{
    .facility = static_cast<uint8_t>(prival / 8),
    .severity = static_cast<uint8_t>(prival % 8),
  };
}

auto escape_param_value(std::string_view str) -> std::string {
  auto result = std::string{};
  result.reserve(str.size());
  for (auto c : str) {
    if (c == '"' or c == '\\' or c == ']') {
      result += '\\';
    }
    result += c;
  }
  return result;
}

auto unescape_param_value(std::string_view str) -> std::string {
  auto result = std::string{};
  result.reserve(str.size());
  for (auto i = size_t{0}; i < str.size(); ++i) {
    if (str[i] == '\\' and i + 1 < str.size()) {
      const auto next = str[i + 1];
      if (next == '"' or next == '\\' or next == ']') {
        result += next;
        ++i;
        continue;
      }
    }
    result += str[i];
  }
  return result;
}

namespace detail {

auto consume_pri(std::string_view& str) -> std::optional<uint16_t> {
  if (str.size() < 3 or str.front() != '<') {
    return std::nullopt;
  }
  auto prival = uint16_t{0};
  auto i = size_t{1};
  for (; i < str.size() and i <= 3; ++i) {
    const auto c = str[i];
    if (c < '0' or c > '9') {
      break;
    }
    prival = static_cast<uint16_t>(prival * 10 + (c - '0'));
  }
  if (i == 1 or i >= str.size() or str[i] != '>') {
    return std::nullopt;
  }
  str.remove_prefix(i + 1);
  return prival;
}

void apply_priority(event& x, uint16_t prival, location source) {
  if (auto pri = make_priority(prival)) {
    x.facility = pri->facility;
    x.severity = pri->severity;
    return;
  }
  EVNORM_DEBUG("ignoring out-of-range PRI {}", prival);
  diagnostic::warning("PRI value {} is out of range", prival)
    .primary(source)
    .hint("PRI must not exceed {}", defaults::syslog::max_prival)
    .emit(x.diagnostics);
}

} // namespace detail

auto parse_syslog(std::string_view text, const syslog_options&)
  -> caf::expected<event> {
  auto result = event{};
  result.kind = record_kind::syslog;
  auto str = text;
  if (str.starts_with("<>")) {
    str.remove_prefix(2);
  } else if (auto prival = detail::consume_pri(str)) {
    detail::apply_priority(result, *prival,
                           location{0, text.size() - str.size()});
  } else {
    return caf::make_error(ec::parse_error,
                           "syslog message must start with a PRI");
  }
  while (not str.empty() and detail::is_blank(str.front())) {
    str.remove_prefix(1);
  }
  result.message = std::string{str};
  return result;
}

} // namespace evnorm
