//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/kv.hpp"

#include "evnorm/detail/string.hpp"

#include <cctype>

namespace evnorm {

namespace {

auto is_space(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto trim_right(std::string_view str) -> std::string_view {
  while (not str.empty() and is_space(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

} // namespace

auto parse_key_value(std::string_view str) -> kv_pairs {
  auto result = kv_pairs{};
  if (str.find('=') == std::string_view::npos) {
    return result;
  }
  const auto size = str.size();
  auto i = size_t{0};
  while (i < size) {
    while (i < size and is_space(str[i])) {
      ++i;
    }
    const auto key_begin = i;
    while (i < size and str[i] != '=' and not is_space(str[i])) {
      ++i;
    }
    const auto key = str.substr(key_begin, i - key_begin);
    if (key.empty() or i >= size or str[i] != '=') {
      // Not a pair, skip the token.
      while (i < size and not is_space(str[i])) {
        ++i;
      }
      continue;
    }
    ++i;
    auto value = std::string{};
    if (i < size and str[i] == '"') {
      ++i;
      while (i < size and str[i] != '"') {
        if (str[i] == '\\' and i + 1 < size) {
          value += str[i + 1];
          i += 2;
        } else {
          value += str[i++];
        }
      }
      // Skip the closing quote.
      ++i;
    } else {
      const auto value_begin = i;
      while (i < size and not is_space(str[i])) {
        ++i;
      }
      value = std::string{str.substr(value_begin, i - value_begin)};
    }
    result.emplace_back(std::string{key}, std::move(value));
  }
  return result;
}

auto parse_extension(std::string_view str) -> kv_pairs {
  struct separator {
    size_t key_begin;
    size_t eq;
  };
  auto separators = std::vector<separator>{};
  for (auto eq = detail::find_unescaped(str, '=');
       eq != std::string_view::npos;
       eq = detail::find_unescaped(str, '=', eq + 1)) {
    const auto floor = separators.empty() ? size_t{0}
                                          : separators.back().eq + 1;
    auto key_begin = eq;
    while (key_begin > floor and not is_space(str[key_begin - 1])) {
      --key_begin;
    }
    // An `=` without a key in front of it, or one that directly follows the
    // previous value without whitespace, belongs to the value.
    if (key_begin == eq or (key_begin == floor and not separators.empty())) {
      continue;
    }
    separators.push_back({key_begin, eq});
  }
  auto result = kv_pairs{};
  result.reserve(separators.size());
  for (auto i = size_t{0}; i < separators.size(); ++i) {
    const auto& [key_begin, eq] = separators[i];
    const auto value_end
      = i + 1 < separators.size() ? separators[i + 1].key_begin : str.size();
    auto value = trim_right(str.substr(eq + 1, value_end - eq - 1));
    result.emplace_back(std::string{str.substr(key_begin, eq - key_begin)},
                        unescape_extension_value(value));
  }
  return result;
}

auto unescape_extension_value(std::string_view str) -> std::string {
  auto result = std::string{};
  result.reserve(str.size());
  for (auto i = size_t{0}; i < str.size(); ++i) {
    if (str[i] != '\\' or i + 1 == str.size()) {
      result += str[i];
      continue;
    }
    switch (str[i + 1]) {
      case '=':
        result += '=';
        break;
      case '\\':
        result += '\\';
        break;
      case 'n':
        result += '\n';
        break;
      case 'r':
        result += '\r';
        break;
      default:
        result += str[i];
        result += str[i + 1];
        break;
    }
    ++i;
  }
  return result;
}

} // namespace evnorm
