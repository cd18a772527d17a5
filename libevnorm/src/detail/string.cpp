//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/detail/string.hpp"

#include <cctype>

namespace evnorm::detail {

auto trim(std::string_view str) -> std::string_view {
  constexpr auto whitespace = std::string_view{" \t\r\n\v\f"};
  const auto first = str.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = str.find_last_not_of(whitespace);
  return str.substr(first, last - first + 1);
}

auto to_lower(std::string_view str) -> std::string {
  auto result = std::string{str};
  for (auto& c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

auto hex_to_byte(std::string_view str) -> std::optional<char> {
  if (str.empty() or str.size() > 2) {
    return std::nullopt;
  }
  auto result = 0;
  for (auto c : str) {
    result <<= 4;
    if (c >= '0' and c <= '9') {
      result |= c - '0';
    } else if (c >= 'a' and c <= 'f') {
      result |= c - 'a' + 10;
    } else if (c >= 'A' and c <= 'F') {
      result |= c - 'A' + 10;
    } else {
      return std::nullopt;
    }
  }
  return static_cast<char>(result);
}

auto find_unescaped(std::string_view str, char c, size_t pos) -> size_t {
  for (auto i = pos; i < str.size(); ++i) {
    if (str[i] == '\\') {
      ++i;
      continue;
    }
    if (str[i] == c) {
      return i;
    }
  }
  return std::string_view::npos;
}

auto find_header(std::string_view message, std::string_view prefix)
  -> size_t {
  if (message.starts_with(prefix)) {
    return 0;
  }
  const auto space = message.find_first_of(" \t");
  if (space == std::string_view::npos or space == 0) {
    return std::string_view::npos;
  }
  const auto start = message.find_first_not_of(" \t", space);
  if (start == std::string_view::npos
      or not message.substr(start).starts_with(prefix)) {
    return std::string_view::npos;
  }
  return start;
}

auto split_escaped(std::string_view str, char sep, size_t max_splits)
  -> std::vector<std::string_view> {
  auto result = std::vector<std::string_view>{};
  auto begin = size_t{0};
  while (result.size() < max_splits) {
    const auto pos = find_unescaped(str, sep, begin);
    if (pos == std::string_view::npos) {
      break;
    }
    result.push_back(str.substr(begin, pos - begin));
    begin = pos + 1;
  }
  result.push_back(str.substr(begin));
  return result;
}

} // namespace evnorm::detail
