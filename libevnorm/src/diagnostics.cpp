//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/diagnostics.hpp"

#include "evnorm/error.hpp"

namespace evnorm {

auto to_string(severity x) -> std::string_view {
  switch (x) {
    case severity::error:
      return "error";
    case severity::warning:
      return "warning";
    case severity::note:
      return "note";
  }
  EVNORM_UNREACHABLE();
}

auto diagnostic::to_error() const -> caf::error {
  return caf::make_error(ec::diagnostic, fmt::to_string(*this));
}

} // namespace evnorm

auto fmt::formatter<evnorm::diagnostic>::format(const evnorm::diagnostic& x,
                                                fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  auto out = fmt::format_to(ctx.out(), "{}: {}", evnorm::to_string(x.severity),
                            x.message);
  for (const auto& annotation : x.annotations) {
    if (not annotation.source) {
      continue;
    }
    out = fmt::format_to(out, " (at {}..{}", annotation.source.begin,
                         annotation.source.end);
    if (not annotation.text.empty()) {
      out = fmt::format_to(out, ": {}", annotation.text);
    }
    *out++ = ')';
  }
  for (const auto& note : x.notes) {
    switch (note.kind) {
      case evnorm::diagnostic_note_kind::note:
        out = fmt::format_to(out, "; note: {}", note.message);
        break;
      case evnorm::diagnostic_note_kind::hint:
        out = fmt::format_to(out, "; hint: {}", note.message);
        break;
    }
  }
  return out;
}
