//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/detail/assert.hpp"
#include "evnorm/error.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/// Similar to `EVNORM_ASSERT(...)`, but throws a `diagnostic` instead of
/// aborting. Unlike `EVNORM_ASSERT(...)`, this assertion is always checked,
/// hence the expression is allowed to have side-effects.
#define EVNORM_DIAG_ASSERT(x)                                                  \
  do {                                                                         \
    if (not(x)) {                                                              \
      ::evnorm::diagnostic::error("internal error: assertion `{}` failed at "  \
                                  "{}:{}",                                     \
                                  #x, __FILE__, __LINE__)                      \
        .throw_();                                                             \
    }                                                                          \
  } while (false)

namespace evnorm {

enum class severity { error, warning, note };

auto to_string(severity x) -> std::string_view;

/// A half-open byte range in the raw message that a diagnostic refers to.
struct location {
  size_t begin = 0;
  size_t end = 0;

  static const location unknown;

  explicit operator bool() const {
    return *this != unknown;
  }

  friend auto operator==(const location&, const location&) -> bool = default;
};

inline const location location::unknown = {};

struct diagnostic_annotation {
  /// True if the source represents the underlying reason for the outer
  /// diagnostic, false if it is only related to it.
  bool primary{};

  /// An message for explanations, can be empty.
  std::string text;

  /// The location that this annotation is associated to, can be unknown.
  location source;

  friend auto operator==(const diagnostic_annotation&,
                         const diagnostic_annotation&) -> bool
    = default;
};

enum class diagnostic_note_kind {
  /// Generic note, not further specified.
  note,
  /// Recommendation on how to solve the problem.
  hint,
};

/// Additional information related to a parent diagnostic.
struct diagnostic_note {
  /// The type of this note.
  diagnostic_note_kind kind;

  /// The (required) message of this note.
  std::string message;

  friend auto operator==(const diagnostic_note&, const diagnostic_note&) -> bool
    = default;
};

/// A structured description of a recoverable problem, e.g., a malformed part
/// of a message that the decoder skipped.
struct [[nodiscard]] diagnostic {
  /// The severity of the diagnostic.
  enum severity severity;

  /// Description of the diagnostic, should not be empty.
  std::string message;

  /// Annotations that are directly related to the message.
  std::vector<diagnostic_annotation> annotations;

  /// Additional notes which have their own message.
  std::vector<diagnostic_note> notes;

  template <class... Ts>
  static auto builder(enum severity s, fmt::format_string<Ts...> str,
                      Ts&&... xs) -> diagnostic_builder;

  template <class... Ts>
  static auto
  error(fmt::format_string<Ts...> str, Ts&&... xs) -> diagnostic_builder;

  static auto error(const caf::error& err) -> diagnostic_builder;

  template <class... Ts>
  static auto
  warning(fmt::format_string<Ts...> str, Ts&&... xs) -> diagnostic_builder;

  template <class... Ts>
  static auto
  note(fmt::format_string<Ts...> str, Ts&&... xs) -> diagnostic_builder;

  auto modify() && -> diagnostic_builder;

  /// Wraps the diagnostic in an error object.
  auto to_error() const -> caf::error;

  friend auto operator==(const diagnostic&, const diagnostic&) -> bool
    = default;
};

/// Utility class to construct a `diagnostic`.
class [[nodiscard]] diagnostic_builder {
public:
  explicit diagnostic_builder(diagnostic start) : result_{std::move(start)} {
  }

  diagnostic_builder(enum severity severity, std::string message)
    : result_{severity, std::move(message), {}, {}} {
  }

  // -- annotations -----------------------------------------------------------

  auto primary(location source, std::string text
                                = "") && -> diagnostic_builder {
    result_.annotations.push_back(
      diagnostic_annotation{true, std::move(text), source});
    return std::move(*this);
  }

  auto secondary(location source, std::string text
                                  = "") && -> diagnostic_builder {
    result_.annotations.push_back(
      diagnostic_annotation{false, std::move(text), source});
    return std::move(*this);
  }

  // -- notes -----------------------------------------------------------------

  auto severity(enum severity s) && -> diagnostic_builder {
    result_.severity = s;
    return std::move(*this);
  }

  auto note(std::string str) && -> diagnostic_builder {
    if (not str.empty()) {
      result_.notes.push_back(
        diagnostic_note{diagnostic_note_kind::note, std::move(str)});
    }
    return std::move(*this);
  }

  template <class... Ts>
    requires(sizeof...(Ts) > 0)
  auto
  note(fmt::format_string<Ts...> str, Ts&&... xs) && -> diagnostic_builder {
    return std::move(*this).note(
      fmt::format(std::move(str), std::forward<Ts>(xs)...));
  }

  auto hint(std::string str) && -> diagnostic_builder {
    if (not str.empty()) {
      result_.notes.push_back(
        diagnostic_note{diagnostic_note_kind::hint, std::move(str)});
    }
    return std::move(*this);
  }

  template <class... Ts>
    requires(sizeof...(Ts) > 0)
  auto
  hint(fmt::format_string<Ts...> str, Ts&&... xs) && -> diagnostic_builder {
    return std::move(*this).hint(
      fmt::format(std::move(str), std::forward<Ts>(xs)...));
  }

  auto inner() -> diagnostic& {
    return result_;
  }

  // -- finalizing ------------------------------------------------------------

  auto done() && -> diagnostic {
    return std::move(result_);
  }

  auto to_error() && -> caf::error {
    return std::move(*this).done().to_error();
  }

  /// Appends the diagnostic to a list, e.g., the diagnostics of an event.
  void emit(std::vector<diagnostic>& diagnostics) && {
    diagnostics.push_back(std::move(result_));
  }

  [[noreturn]] void throw_() && {
    throw std::move(result_);
  }

private:
  diagnostic result_;
};

template <class... Ts>
auto diagnostic::builder(enum severity s, fmt::format_string<Ts...> str,
                         Ts&&... xs) -> diagnostic_builder {
  return diagnostic_builder{s, fmt::format(std::move(str),
                                           std::forward<Ts>(xs)...)};
}

template <class... Ts>
auto diagnostic::error(fmt::format_string<Ts...> str, Ts&&... xs)
  -> diagnostic_builder {
  return builder(severity::error, std::move(str), std::forward<Ts>(xs)...);
}

inline auto diagnostic::error(const caf::error& err) -> diagnostic_builder {
  EVNORM_ASSERT(err);
  return diagnostic_builder{severity::error, render(err)};
}

template <class... Ts>
auto diagnostic::warning(fmt::format_string<Ts...> str, Ts&&... xs)
  -> diagnostic_builder {
  return builder(severity::warning, std::move(str), std::forward<Ts>(xs)...);
}

template <class... Ts>
auto diagnostic::note(fmt::format_string<Ts...> str, Ts&&... xs)
  -> diagnostic_builder {
  return builder(severity::note, std::move(str), std::forward<Ts>(xs)...);
}

inline auto diagnostic::modify() && -> diagnostic_builder {
  return diagnostic_builder{std::move(*this)};
}

} // namespace evnorm

template <>
struct fmt::formatter<evnorm::diagnostic> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const evnorm::diagnostic& x, fmt::format_context& ctx) const
    -> fmt::format_context::iterator;
};
