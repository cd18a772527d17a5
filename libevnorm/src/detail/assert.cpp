//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/detail/assert.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace evnorm::detail {

void panic_impl(std::string_view message, std::source_location location) {
  fmt::print(stderr, "internal error at {}:{} in {}\n{}\n",
             location.file_name(), location.line(), location.function_name(),
             message);
  std::fflush(stderr);
  std::abort();
}

void assertion_failure(const char* expression, std::string_view explanation,
                       std::source_location location) {
  if (explanation.empty()) {
    panic_impl(fmt::format("assertion `{}` failed", expression), location);
  }
  panic_impl(fmt::format("assertion `{}` failed: {}", expression, explanation),
             location);
}

} // namespace evnorm::detail
