//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/data.hpp"
#include "evnorm/diagnostics.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evnorm {

/// Names the grammar that produced an event. Kinds form a refinement chain:
/// `rfc3164` and `rfc5424` refine `syslog`, which refines `envelope`.
enum class record_kind : uint8_t {
  /// Raw text without any parsed header.
  envelope,
  /// The `<PRI>MSG` base form of syslog.
  syslog,
  /// A BSD syslog message.
  rfc3164,
  /// A structured syslog message.
  rfc5424,
};

/// The number of record kinds.
inline constexpr auto record_kind_count = size_t{4};

/// @relates record_kind
auto to_string(record_kind x) -> std::string_view;

/// Returns the kind that `x` directly refines, if any.
/// @relates record_kind
auto parent(record_kind x) -> std::optional<record_kind>;

/// Checks whether an event of kind `actual` can be handed to something that
/// requires kind `required`.
/// @returns `true` iff `actual` equals `required` or transitively refines it.
/// @relates record_kind
auto satisfies(record_kind actual, record_kind required) -> bool;

/// An SD-ELEMENT of an RFC 5424 message.
struct structured_data_element {
  std::string id;
  std::vector<std::pair<std::string, std::string>> params;

  /// Looks up the first parameter with the given name.
  auto find(std::string_view name) const -> const std::string*;

  friend auto operator==(const structured_data_element&,
                         const structured_data_element&) -> bool
    = default;
};

/// Identifies the plugin family that most specifically matched an event.
struct structure_classification {
  std::string vendor;
  std::string product;
  std::string msgclass;

  /// The event_data keys that the classifying plugin supplied.
  std::vector<std::string> fields;

  /// Checks whether two classifications name the same triple, ignoring the
  /// supplied fields.
  auto same_class(const structure_classification& other) const -> bool;

  friend auto operator==(const structure_classification&,
                         const structure_classification&) -> bool
    = default;
};

/// A rejected write to `event_data` because the key was already present.
struct field_collision {
  std::string key;

  /// The value that was not written.
  data rejected;

  /// The classification of the rejected writer.
  structure_classification writer;

  friend auto operator==(const field_collision&, const field_collision&)
    -> bool
    = default;
};

/// The canonical representation of a decoded message.
struct event {
  record_kind kind = record_kind::envelope;

  std::optional<time> timestamp;
  std::optional<uint8_t> facility;
  std::optional<uint8_t> severity;

  /// The VERSION of an RFC 5424 header.
  std::optional<uint16_t> version;

  std::optional<std::string> hostname;
  std::optional<std::string> app_name;
  std::optional<std::string> proc_id;
  std::optional<std::string> msg_id;
  std::vector<structured_data_element> structured_data;

  /// The free-text remainder after the header; may be empty.
  std::string message;

  /// Set by the first plugin that classifies the event.
  std::optional<structure_classification> classification;

  /// The attributes accumulated across all matching plugins.
  record event_data;

  // -- data quality -----------------------------------------------------------

  std::vector<field_collision> collisions;
  std::vector<structure_classification> rejected_classifications;
  std::vector<diagnostic> diagnostics;

  friend auto operator==(const event&, const event&) -> bool = default;
};

} // namespace evnorm

template <>
struct fmt::formatter<evnorm::record_kind> : fmt::formatter<std::string_view> {
  auto format(evnorm::record_kind x, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(evnorm::to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<evnorm::structured_data_element> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const evnorm::structured_data_element& x,
              fmt::format_context& ctx) const -> fmt::format_context::iterator;
};

template <>
struct fmt::formatter<evnorm::structure_classification> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const evnorm::structure_classification& x,
              fmt::format_context& ctx) const -> fmt::format_context::iterator;
};

template <>
struct fmt::formatter<evnorm::event> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const evnorm::event& x, fmt::format_context& ctx) const
    -> fmt::format_context::iterator;
};
