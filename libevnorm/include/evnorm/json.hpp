//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/data.hpp"

#include <caf/expected.hpp>

#include <string_view>

namespace evnorm {

/// Parses a message that consists of exactly one JSON object.
///
/// Nested objects are flattened into dotted keys, e.g., `{"a": {"b": 1}}`
/// becomes `a.b = 1`. Arrays are kept as their minified JSON text. For
/// duplicate keys, the first occurrence wins.
///
/// @param str The message, optionally surrounded by whitespace.
/// @returns The flattened object, or `ec::parse_error` if `str` is no JSON
/// object.
auto parse_json_object(std::string_view str) -> caf::expected<record>;

} // namespace evnorm
