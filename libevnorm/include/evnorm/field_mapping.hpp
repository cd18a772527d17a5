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

#include <caf/error.hpp>

#include <span>
#include <string>
#include <string_view>

namespace evnorm {

/// Classifies an event and merges attributes into its `event_data`.
///
/// The first classification of an event wins; a later, different one ends up
/// in `rejected_classifications`. Likewise, the first value for a key wins and
/// every later write to that key is recorded in `collisions`.
///
/// @param x The event to modify.
/// @param names The attribute names.
/// @param values The attribute values, positionally matching `names`.
/// @param vendor The vendor of the classification.
/// @param product The product of the classification.
/// @param msgclass The message class of the classification.
/// @returns `ec::invalid_argument` if `names` and `values` differ in length,
/// in which case `x` remains unchanged.
auto apply_field_mapping(event& x, std::span<const std::string> names,
                         std::span<const data> values, std::string_view vendor,
                         std::string_view product, std::string_view msgclass)
  -> caf::error;

/// Classifies an event and merges a record into its `event_data`.
/// @relates apply_field_mapping
auto apply_field_mapping(event& x, const record& fields,
                         std::string_view vendor, std::string_view product,
                         std::string_view msgclass) -> caf::error;

} // namespace evnorm
