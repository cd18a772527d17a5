//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <filesystem>
#include <string_view>

namespace evnorm {

/// Parses a YAML document into settings. Scalars are typed best-effort as
/// booleans, integers, reals, or strings.
/// @param str The YAML document, which must have a map at its root.
/// @returns The settings, or an error describing the failure.
auto from_yaml(std::string_view str) -> caf::expected<caf::settings>;

/// Reads a YAML configuration file.
/// @param file The path to the file.
/// @returns The settings, or an error describing the failure.
auto load_config_file(const std::filesystem::path& file)
  -> caf::expected<caf::settings>;

} // namespace evnorm
