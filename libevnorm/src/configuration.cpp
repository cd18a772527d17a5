//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/configuration.hpp"

#include "evnorm/detail/assert.hpp"
#include "evnorm/error.hpp"
#include "evnorm/logger.hpp"

#include <caf/config_value.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <fstream>
#include <sstream>

namespace evnorm {

namespace {

auto parse_scalar(const std::string& str) -> caf::config_value {
  if (str == "true") {
    return caf::config_value{true};
  }
  if (str == "false") {
    return caf::config_value{false};
  }
  const auto* first = str.data();
  const auto* last = str.data() + str.size();
  auto integer = int64_t{0};
  if (auto [ptr, err] = std::from_chars(first, last, integer);
      err == std::errc{} and ptr == last) {
    return caf::config_value{integer};
  }
  auto real = 0.0;
  if (auto [ptr, err] = std::from_chars(first, last, real);
      err == std::errc{} and ptr == last) {
    return caf::config_value{real};
  }
  // Take the input as-is if nothing worked.
  return caf::config_value{str};
}

auto parse(const YAML::Node& node) -> caf::config_value {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return caf::config_value{};
    case YAML::NodeType::Scalar:
      return parse_scalar(node.as<std::string>());
    case YAML::NodeType::Sequence: {
      auto xs = caf::config_value::list{};
      xs.reserve(node.size());
      for (const auto& element : node) {
        xs.push_back(parse(element));
      }
      return caf::config_value{std::move(xs)};
    }
    case YAML::NodeType::Map: {
      auto xs = caf::settings{};
      for (const auto& pair : node) {
        xs[pair.first.as<std::string>()] = parse(pair.second);
      }
      return caf::config_value{std::move(xs)};
    }
  }
  EVNORM_UNREACHABLE();
}

} // namespace

auto from_yaml(std::string_view str) -> caf::expected<caf::settings> {
  try {
    auto node = YAML::Load(std::string{str});
    if (node.IsNull()) {
      return caf::settings{};
    }
    if (not node.IsMap()) {
      return caf::make_error(ec::invalid_configuration,
                             "configuration must be a YAML map");
    }
    auto value = parse(node);
    auto* result = caf::get_if<caf::settings>(&value);
    EVNORM_ASSERT(result != nullptr);
    return std::move(*result);
  } catch (const YAML::Exception& e) {
    return caf::make_error(
      ec::parse_error,
      fmt::format("failed to parse YAML at line {}, column {}: {}",
                  e.mark.line + 1, e.mark.column + 1, e.msg));
  }
}

auto load_config_file(const std::filesystem::path& file)
  -> caf::expected<caf::settings> {
  auto in = std::ifstream{file};
  if (not in) {
    return caf::make_error(ec::no_such_file,
                           fmt::format("failed to open configuration file {}",
                                       file.string()));
  }
  auto contents = std::stringstream{};
  contents << in.rdbuf();
  auto result = from_yaml(contents.str());
  if (not result) {
    return add_context(result.error(), "in configuration file {}",
                       file.string());
  }
  EVNORM_VERBOSE("loaded configuration file {}", file.string());
  return result;
}

} // namespace evnorm
