//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evnorm {

/// An ordered list of extracted key-value pairs. Keys may repeat.
using kv_pairs = std::vector<std::pair<std::string, std::string>>;

/// Splits a message of the form `k1=v1 k2="v 2" ...` into pairs.
///
/// Values are either unquoted and end at the next whitespace, or enclosed in
/// double quotes, in which case a backslash escapes the following character.
/// Tokens without `=` are skipped.
///
/// @param str The message to split.
/// @returns The pairs in order of appearance; empty if there are none.
auto parse_key_value(std::string_view str) -> kv_pairs;

/// Splits an extension of the form `k1=v 1 k2=v2`, where values may contain
/// spaces and end at the last whitespace before the next key. An `=` within
/// a value must be escaped as `\=`.
///
/// Values are unescaped: `\=`, `\\`, `\n` and `\r` turn into the character
/// they denote; other escape sequences are kept literally.
///
/// @param str The extension to split.
/// @returns The pairs in order of appearance; empty if there are none.
auto parse_extension(std::string_view str) -> kv_pairs;

/// Resolves the escape sequences of an extension value.
auto unescape_extension_value(std::string_view str) -> std::string;

} // namespace evnorm
