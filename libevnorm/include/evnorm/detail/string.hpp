//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evnorm::detail {

/// Checks whether a character is a blank as understood by the message
/// grammars, i.e., a space or a horizontal tab.
constexpr auto is_blank(char c) -> bool {
  return c == ' ' or c == '\t';
}

/// Checks whether a character is a printable US-ASCII character other than
/// space (`%d33-126`).
constexpr auto is_print_ascii(char c) -> bool {
  return c >= 33 and c <= 126;
}

/// Removes leading and trailing whitespace.
auto trim(std::string_view str) -> std::string_view;

/// Returns a copy of `str` with all ASCII letters in lowercase.
auto to_lower(std::string_view str) -> std::string;

/// Converts one or two hexadecimal digits into the byte they denote.
auto hex_to_byte(std::string_view str) -> std::optional<char>;

/// Finds the first occurrence of `c` in `str` that is not preceded by an
/// escaping backslash, starting at `pos`.
/// @returns The position of the occurrence or `std::string_view::npos`.
auto find_unescaped(std::string_view str, char c, size_t pos = 0) -> size_t;

/// Locates a header such as `CEF:` either at the start of a message or right
/// after its first word, where devices commonly put their hostname.
/// @returns The position of the header or `std::string_view::npos`.
auto find_header(std::string_view message, std::string_view prefix) -> size_t;

/// Splits a string at every unescaped occurrence of `sep`.
/// @param str The string to split.
/// @param sep The separator.
/// @param max_splits The maximum number of splits to perform; the remainder
/// ends up in the last element.
/// @returns The pieces of `str`, with escape sequences left intact.
auto split_escaped(std::string_view str, char sep,
                   size_t max_splits = std::string_view::npos)
  -> std::vector<std::string_view>;

} // namespace evnorm::detail
