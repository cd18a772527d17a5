//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace evnorm {

/// Parses an RFC 3339 timestamp, e.g., `2023-05-09T02:33:52.123Z`. The
/// fractional part may have up to nine digits; a `Z` or a numeric offset is
/// mandatory.
auto parse_rfc3339(std::string_view str) -> std::optional<time>;

/// Parses a UNIX timestamp consisting of digits only. The unit follows from
/// the number of digits: up to 10 digits are seconds, up to 13 milliseconds,
/// up to 16 microseconds, and anything longer nanoseconds.
auto parse_epoch(std::string_view str) -> std::optional<time>;

/// The components of a BSD syslog timestamp such as `Oct 11 22:14:15`, which
/// by itself names neither a year nor a time zone.
struct bsd_timestamp {
  std::optional<int> year;
  unsigned month = 0;
  unsigned day = 0;
  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;

  friend auto operator==(const bsd_timestamp&, const bsd_timestamp&) -> bool
    = default;
};

/// Maps a three-letter English month abbreviation to 1-12.
auto parse_month(std::string_view str) -> std::optional<unsigned>;

/// Turns a BSD timestamp into an absolute point in time.
/// @param ts The parsed timestamp components.
/// @param reference The clock reading to derive a missing year from. The
/// timestamp falls into the year of *reference*, unless that would put it
/// more than one day after *reference*, in which case it belongs to the
/// previous year.
/// @param utc_offset The offset of the sender's local time from UTC.
/// @returns The point in time, or `std::nullopt` if the components do not
/// form a valid date or the year is unknown and there is no reference.
auto resolve(const bsd_timestamp& ts, std::optional<time> reference,
             std::chrono::minutes utc_offset) -> std::optional<time>;

/// Renders a point in time as ISO 8601 in UTC with the minimal number of
/// fractional digits, e.g., `2023-05-09T02:33:52.123Z`.
auto to_string(time x) -> std::string;

} // namespace evnorm
