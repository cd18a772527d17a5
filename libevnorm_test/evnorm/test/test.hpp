//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#ifdef SUITE
#  define CAF_SUITE SUITE
#endif

#include <caf/deep_to_string.hpp>
#include <caf/expected.hpp>
#include <caf/test/reporter.hpp>
#include <caf/test/requirement_failed.hpp>
#include <caf/test/test.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <optional>
#include <set>
#include <string>
#include <type_traits>

namespace evnorm::test::detail {

template <class T>
struct is_optional : std::false_type {};

template <class T>
struct is_optional<std::optional<T>> : std::true_type {};

template <class T>
auto stringify(const T& value) -> std::string {
  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return std::string{"null"};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{value};
  } else if constexpr (std::is_convertible_v<T, std::string_view>) {
    return std::string{std::string_view{value}};
  } else if constexpr (is_optional<T>::value) {
    return value ? stringify(*value) : std::string{"nullopt"};
  } else if constexpr (requires { to_string(value); }) {
    return std::string{to_string(value)};
  } else if constexpr (fmt::is_formattable<T>::value) {
    return fmt::to_string(value);
  } else {
    return caf::deep_to_string(value);
  }
}

template <class T0, class T1>
auto check_eq(const T0& lhs, const T1& rhs,
              caf::detail::source_location location
              = caf::detail::source_location::current()) -> bool {
  // Adapted from CAF, but without safety checks.
  if (lhs == rhs) {
    caf::test::reporter::instance().pass(location);
    return true;
  }
  caf::test::reporter::instance().fail(
    caf::test::binary_predicate::eq, stringify(lhs), stringify(rhs), location);
  return false;
}

template <class T0, class T1>
void require_eq(const T0& lhs, const T1& rhs,
                caf::detail::source_location location
                = caf::detail::source_location::current()) {
  if (not check_eq(lhs, rhs, location)) {
    caf::test::requirement_failed::raise(location);
  }
}

} // namespace evnorm::test::detail

// -- logging macros -----------------------------------------------------------

// The new testing framework does not have `CAF_MESSAGE` anymore.
#define MESSAGE(...) fmt::print("{}\n", fmt::format(__VA_ARGS__))

// -- macros for checking results ----------------------------------------------
// Checks that abort the current test on failure
#define REQUIRE(x)                                                             \
  ::caf::test::runnable::current().require(static_cast<bool>(x))
#define REQUIRE_EQUAL(x, y) ::evnorm::test::detail::require_eq((x), (y))
#define REQUIRE_NOERROR(x)                                                     \
  do {                                                                         \
    if (not(x)) {                                                              \
      ::caf::test::runnable::current().fail("Unexpected error {} in: {}",      \
                                            ::evnorm::render((x).error()),     \
                                            __FILE__);                         \
    }                                                                          \
  } while (false)
#define REQUIRE_SUCCESS(x)                                                     \
  do {                                                                         \
    if (auto err__ = (x)) {                                                    \
      ::caf::test::runnable::current().fail("Unexpected error {} in: {}",      \
                                            ::evnorm::render(err__),           \
                                            __FILE__);                         \
    }                                                                          \
  } while (false)
#define REQUIRE_ERROR(x) REQUIRE_EQUAL(not(x), true)
#define FAIL ::caf::test::runnable::current().fail
// Checks that continue with the current test on failure
#define CHECK(x) ::caf::test::runnable::current().check(static_cast<bool>(x))
#define CHECK_EQUAL(x, y) ::evnorm::test::detail::check_eq((x), (y))
#define CHECK_NOT_EQUAL(x, y) CHECK((x) != (y))
#define CHECK_ERROR(x) CHECK_EQUAL(not(x), true)

// -- global state -------------------------------------------------------------

namespace evnorm::test {

template <class T>
auto unbox(std::optional<T> x) -> T {
  if (not x) {
    FAIL("x == none");
  }
  return std::move(*x);
}

template <class T>
auto unbox(caf::expected<T> x) -> T {
  if (not x) {
    FAIL("expected<T> contains an error: {}", render(x.error()));
  }
  return std::move(*x);
}

template <class T>
auto unbox(T* x) -> T {
  if (not x) {
    FAIL("T* contains nullptr");
  }
  return *x;
}

// Holds global configuration options passed on the command line after the
// special -- delimiter.
extern std::set<std::string> config;

} // namespace evnorm::test

namespace evnorm {

using test::unbox;

} // namespace evnorm
