//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/event.hpp"

#include "evnorm/detail/assert.hpp"
#include "evnorm/syslog.hpp"
#include "evnorm/timestamp.hpp"

namespace evnorm {

auto to_string(record_kind x) -> std::string_view {
  switch (x) {
    case record_kind::envelope:
      return "envelope";
    case record_kind::syslog:
      return "syslog";
    case record_kind::rfc3164:
      return "rfc3164";
    case record_kind::rfc5424:
      return "rfc5424";
  }
  EVNORM_UNREACHABLE();
}

auto parent(record_kind x) -> std::optional<record_kind> {
  switch (x) {
    case record_kind::envelope:
      return std::nullopt;
    case record_kind::syslog:
      return record_kind::envelope;
    case record_kind::rfc3164:
    case record_kind::rfc5424:
      return record_kind::syslog;
  }
  EVNORM_UNREACHABLE();
}

auto satisfies(record_kind actual, record_kind required) -> bool {
  for (auto kind = std::optional{actual}; kind; kind = parent(*kind)) {
    if (*kind == required) {
      return true;
    }
  }
  return false;
}

auto structured_data_element::find(std::string_view name) const
  -> const std::string* {
  for (const auto& [key, value] : params) {
    if (key == name) {
      return &value;
    }
  }
  return nullptr;
}

auto structure_classification::same_class(
  const structure_classification& other) const -> bool {
  return vendor == other.vendor and product == other.product
         and msgclass == other.msgclass;
}

} // namespace evnorm

auto fmt::formatter<evnorm::structured_data_element>::format(
  const evnorm::structured_data_element& x, fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  auto out = fmt::format_to(ctx.out(), "[{}", x.id);
  for (const auto& [name, value] : x.params) {
    out = fmt::format_to(out, " {}=\"{}\"", name,
                         evnorm::escape_param_value(value));
  }
  *out++ = ']';
  return out;
}

auto fmt::formatter<evnorm::structure_classification>::format(
  const evnorm::structure_classification& x, fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  return fmt::format_to(ctx.out(), "{}/{}/{}", x.vendor, x.product,
                        x.msgclass);
}

auto fmt::formatter<evnorm::event>::format(const evnorm::event& x,
                                           fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  auto out = fmt::format_to(ctx.out(), "{}{{", x.kind);
  auto field = [&](std::string_view name, const auto& value) {
    out = fmt::format_to(out, " {}: {}", name, value);
  };
  auto optional_field = [&](std::string_view name, const auto& value) {
    if (value) {
      field(name, *value);
    }
  };
  if (x.timestamp) {
    field("timestamp", evnorm::to_string(*x.timestamp));
  }
  if (x.facility) {
    field("facility", static_cast<int>(*x.facility));
  }
  if (x.severity) {
    field("severity", static_cast<int>(*x.severity));
  }
  optional_field("version", x.version);
  optional_field("hostname", x.hostname);
  optional_field("app_name", x.app_name);
  optional_field("proc_id", x.proc_id);
  optional_field("msg_id", x.msg_id);
  for (const auto& element : x.structured_data) {
    field("sd", element);
  }
  out = fmt::format_to(out, " message: \"{}\"", x.message);
  optional_field("classification", x.classification);
  for (const auto& [key, value] : x.event_data) {
    out = fmt::format_to(out, " {}={}", key, value);
  }
  if (not x.collisions.empty()) {
    field("collisions", x.collisions.size());
  }
  if (not x.diagnostics.empty()) {
    field("diagnostics", x.diagnostics.size());
  }
  *out++ = ' ';
  *out++ = '}';
  return out;
}
