//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/config.hpp"

#include <source_location>
#include <string_view>

namespace evnorm::detail {

/// Prints `message` together with the source location and aborts.
[[noreturn]] void panic_impl(std::string_view message,
                             std::source_location location
                             = std::source_location::current());

[[noreturn]] void
assertion_failure(const char* expression, std::string_view explanation,
                  std::source_location location
                  = std::source_location::current());

} // namespace evnorm::detail

#define EVNORM_PANIC(message) ::evnorm::detail::panic_impl(message)

/// Checks an internal invariant. Unlike diagnostics, a failed assertion is a
/// bug in evnorm itself and therefore aborts the process.
#if EVNORM_ENABLE_ASSERTIONS
#  define EVNORM_ASSERT(expr, ...)                                             \
    do {                                                                       \
      if (not static_cast<bool>(expr)) [[unlikely]] {                          \
        ::evnorm::detail::assertion_failure(#expr, "" __VA_ARGS__);            \
      }                                                                        \
    } while (false)
#else
#  define EVNORM_ASSERT(expr, ...)                                             \
    do {                                                                       \
      static_cast<void>(sizeof(expr));                                         \
    } while (false)
#endif

#define EVNORM_UNREACHABLE()                                                   \
  ::evnorm::detail::panic_impl("unreachable code path was reached")
