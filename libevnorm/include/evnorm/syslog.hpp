//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/event.hpp"

#include <caf/expected.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace evnorm {

/// The facility part of a syslog PRI.
enum class syslog_facility : uint8_t {
  kern = 0,
  user,
  mail,
  daemon,
  auth,
  syslog,
  lpr,
  news,
  uucp,
  cron,
  authpriv,
  ftp,
  ntp,
  security,
  console,
  solaris_cron,
  local0,
  local1,
  local2,
  local3,
  local4,
  local5,
  local6,
  local7,
};

/// @relates syslog_facility
auto to_string(syslog_facility x) -> std::string_view;

/// The severity part of a syslog PRI.
enum class syslog_severity : uint8_t {
  emergency = 0,
  alert,
  critical,
  error,
  warning,
  notice,
  informational,
  debug,
};

/// @relates syslog_severity
auto to_string(syslog_severity x) -> std::string_view;

/// A decoded PRIVAL.
struct priority {
  uint8_t facility = 0;
  uint8_t severity = 0;

  friend auto operator==(const priority&, const priority&) -> bool = default;
};

/// Splits a PRIVAL into facility and severity.
/// @returns The priority, or `std::nullopt` if `prival` exceeds 191.
auto make_priority(uint16_t prival) -> std::optional<priority>;

/// Options that control the syslog grammars.
struct syslog_options {
  /// Lowercase the HOSTNAME field.
  bool lowercase_hostname = false;

  /// The clock reading that year-less RFC 3164 timestamps are resolved
  /// against. Without it, such timestamps remain unset.
  std::optional<time> reference_time = {};

  /// The offset of the sender's local time from UTC, applied to timestamps
  /// that carry no zone.
  std::chrono::minutes utc_offset = std::chrono::minutes{0};
};

/// Parses the `<PRI>MSG` base form of syslog.
/// @param text The raw message.
/// @param opts The grammar options.
/// @returns An event of kind `syslog`, or an error if `text` does not start
/// with a PRI.
auto parse_syslog(std::string_view text, const syslog_options& opts = {})
  -> caf::expected<event>;

/// Parses a BSD syslog message. The grammar degrades gracefully: missing
/// parts of the header leave the corresponding fields unset, and unparsable
/// text ends up in the message.
/// @param text The raw message.
/// @param opts The grammar options.
/// @returns An event of kind `rfc3164`, or an error for empty input.
auto parse_rfc3164(std::string_view text, const syslog_options& opts = {})
  -> caf::expected<event>;

/// Parses a structured syslog message.
/// @param text The raw message.
/// @param opts The grammar options.
/// @returns An event of kind `rfc5424`, or an error if the header is
/// malformed.
auto parse_rfc5424(std::string_view text, const syslog_options& opts = {})
  -> caf::expected<event>;

/// Escapes `"`, `\` and `]` in a PARAM-VALUE.
auto escape_param_value(std::string_view str) -> std::string;

/// Reverses `escape_param_value`. A backslash that does not precede one of
/// the escaped characters is kept literally.
auto unescape_param_value(std::string_view str) -> std::string;

namespace detail {

/// Consumes a `<PRI>` prefix consisting of one to three digits.
/// @param str The text to consume from; advanced past the prefix on success
/// and left untouched otherwise.
/// @returns The PRIVAL, or `std::nullopt` if `str` does not start with a
/// numeric PRI.
auto consume_pri(std::string_view& str) -> std::optional<uint16_t>;

/// Stores a PRIVAL in an event. Out-of-range values leave facility and
/// severity unset and add a warning.
/// @param x The event to modify.
/// @param prival The decoded PRIVAL.
/// @param source The location of the PRI in the raw message.
void apply_priority(event& x, uint16_t prival, location source);

} // namespace detail

} // namespace evnorm
