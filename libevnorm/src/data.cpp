//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/data.hpp"

#include "evnorm/timestamp.hpp"

#include <charconv>
#include <type_traits>

namespace evnorm {

auto operator==(const data& lhs, const data& rhs) -> bool {
  return lhs.get_data() == rhs.get_data();
}

auto is_null(const data& x) -> bool {
  return std::holds_alternative<caf::none_t>(x.get_data());
}

auto infer_data(std::string_view str) -> data {
  if (str.empty()) {
    return std::string{};
  }
  if (str == "true") {
    return true;
  }
  if (str == "false") {
    return false;
  }
  const auto* const first = str.data();
  const auto* const last = str.data() + str.size();
  // Leading zeros carry meaning in identifiers and codes, so we keep them.
  const auto digits = str.front() == '-' ? str.substr(1) : str;
  const auto leading_zero = digits.size() > 1 and digits.front() == '0'
                            and digits[1] != '.';
  if (not leading_zero) {
    if (str.front() == '-') {
      auto value = int64_t{0};
      auto [ptr, err] = std::from_chars(first, last, value);
      if (err == std::errc{} and ptr == last) {
        return value;
      }
    } else {
      auto value = uint64_t{0};
      auto [ptr, err] = std::from_chars(first, last, value);
      if (err == std::errc{} and ptr == last) {
        if (value <= static_cast<uint64_t>(INT64_MAX)) {
          return static_cast<int64_t>(value);
        }
        return value;
      }
    }
    if (str.find('.') != std::string_view::npos) {
      auto value = 0.0;
      auto [ptr, err]
        = std::from_chars(first, last, value, std::chars_format::fixed);
      if (err == std::errc{} and ptr == last) {
        return value;
      }
    }
  }
  if (auto ts = parse_rfc3339(str)) {
    return *ts;
  }
  return std::string{str};
}

} // namespace evnorm

auto fmt::formatter<evnorm::data>::format(const evnorm::data& x,
                                          fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  return std::visit(
    [&](const auto& value) -> fmt::format_context::iterator {
      using type = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<type, caf::none_t>) {
        return fmt::format_to(ctx.out(), "null");
      } else if constexpr (std::is_same_v<type, evnorm::duration>) {
        return fmt::format_to(ctx.out(), "{}ns", value.count());
      } else if constexpr (std::is_same_v<type, evnorm::time>) {
        return fmt::format_to(ctx.out(), "{}", evnorm::to_string(value));
      } else if constexpr (std::is_same_v<type, std::string>) {
        return fmt::format_to(ctx.out(), "\"{}\"", value);
      } else {
        return fmt::format_to(ctx.out(), "{}", value);
      }
    },
    x.get_data());
}
