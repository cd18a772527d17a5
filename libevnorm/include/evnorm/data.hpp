//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/detail/stable_map.hpp"

#include <caf/none.hpp>
#include <fmt/format.h>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace evnorm {

namespace detail {

struct invalid_data_type {};

template <class T>
constexpr auto to_data_type() {
  if constexpr (std::is_same_v<T, bool>) {
    return bool{};
  } else if constexpr (std::is_floating_point_v<T>) {
    return double{};
  } else if constexpr (std::is_integral_v<T> and std::is_unsigned_v<T>) {
    return uint64_t{};
  } else if constexpr (std::is_integral_v<T>) {
    return int64_t{};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{};
  } else if constexpr (std::is_same_v<T, caf::none_t>
                       or std::is_same_v<T, duration>
                       or std::is_same_v<T, time>) {
    return T{};
  } else {
    return invalid_data_type{};
  }
}

} // namespace detail

/// Converts a C++ type to the corresponding data alternative.
/// @relates data
template <class T>
using to_data_type = decltype(detail::to_data_type<std::decay_t<T>>());

/// A type-erased value of an event attribute.
class data {
public:
  using variant = std::variant<caf::none_t, bool, int64_t, uint64_t, double,
                               duration, time, std::string>;

  /// Default-constructs empty data.
  data() = default;

  /// Constructs data from optional data.
  /// @param x The optional data instance.
  template <class T>
  data(std::optional<T> x) : data{x ? data{std::move(*x)} : data{}} {
    // nop
  }

  /// Constructs data from a `std::chrono::duration`.
  /// @param x The duration to construct data from.
  template <class Rep, class Period>
  data(std::chrono::duration<Rep, Period> x)
    : data_{std::chrono::duration_cast<duration>(x)} {
    // nop
  }

  /// Constructs data.
  /// @param x The instance to construct data from.
  template <class T>
    requires(not std::same_as<to_data_type<T>, detail::invalid_data_type>)
  data(T&& x) : data_{to_data_type<T>(std::forward<T>(x))} {
    // nop
  }

  /// @cond PRIVATE

  [[nodiscard]] auto get_data() & -> variant& {
    return data_;
  }

  [[nodiscard]] auto get_data() const& -> const variant& {
    return data_;
  }

  /// @endcond

  friend auto operator==(const data& lhs, const data& rhs) -> bool;

private:
  variant data_;
};

/// The mapping from attribute name to value that events accumulate.
using record = detail::stable_map<std::string, data>;

/// @returns `true` if `x` holds no value.
/// @relates data
auto is_null(const data& x) -> bool;

/// Retrieves a pointer to the alternative `T` of `x`, or `nullptr`.
/// @relates data
template <class T>
auto try_as(const data& x) -> const T* {
  return std::get_if<T>(&x.get_data());
}

/// Retrieves a pointer to the alternative `T` of `x`, or `nullptr`.
/// @relates data
template <class T>
auto try_as(data& x) -> T* {
  return std::get_if<T>(&x.get_data());
}

/// Guesses the most specific data alternative for a string value: booleans,
/// integers, reals, and RFC 3339 timestamps. Anything else remains a string.
/// @relates data
auto infer_data(std::string_view str) -> data;

} // namespace evnorm

template <>
struct fmt::formatter<evnorm::data> : fmt::formatter<std::string_view> {
  auto format(const evnorm::data& x, fmt::format_context& ctx) const
    -> fmt::format_context::iterator;
};
