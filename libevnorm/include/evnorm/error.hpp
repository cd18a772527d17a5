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

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <source_location>
#include <string>
#include <type_traits>

namespace evnorm {

/// evnorm's error codes.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// Requested file does not exist.
  no_such_file,
  /// Failure during parsing.
  parse_error,
  /// Encountered two incompatible versions.
  version_error,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// A function received an invalid argument.
  invalid_argument,
  /// The configuration was invalid.
  invalid_configuration,
  /// The error wraps a diagnostic.
  diagnostic,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

template <class Inspector>
auto inspect(Inspector& f, ec& x) -> bool {
  using underlying = std::underlying_type_t<ec>;
  if constexpr (Inspector::is_loading) {
    auto tmp = underlying{};
    if (not f.apply(tmp)) {
      return false;
    }
    x = static_cast<ec>(tmp);
    return true;
  } else {
    auto tmp = static_cast<underlying>(x);
    return f.apply(tmp);
  }
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

inline void check(const caf::error& err, std::source_location location
                                         = std::source_location::current()) {
  if (err) [[unlikely]] {
    detail::panic_impl(render(err), location);
  }
}

template <class T>
[[nodiscard]] auto
check(caf::expected<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  if (not result) [[unlikely]] {
    detail::panic_impl(render(result.error()), location);
  }
  return std::move(result.value());
}

} // namespace evnorm

CAF_ERROR_CODE_ENUM(evnorm::ec)
