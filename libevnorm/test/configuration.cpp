//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/configuration.hpp"

#include "evnorm/error.hpp"
#include "evnorm/test/test.hpp"

#include <caf/settings.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace evnorm;

namespace {

constexpr auto example = R"__(
evnorm:
  console-verbosity: debug
  disable-plugins:
    - leef
  decoder:
    syntax: rfc5424
    lowercase-hostname: true
    utc-offset: -120
plugins:
  kv:
    min-pairs: 2
    ratio: 0.5
)__";

} // namespace

TEST("yaml configuration scalars are typed") {
  auto cfg = unbox(from_yaml(example));
  CHECK_EQUAL(caf::get_or(cfg, "evnorm.console-verbosity", ""), "debug");
  CHECK_EQUAL(caf::get_or(cfg, "evnorm.decoder.syntax", ""), "rfc5424");
  CHECK(caf::get_or(cfg, "evnorm.decoder.lowercase-hostname", false));
  CHECK_EQUAL(caf::get_or(cfg, "evnorm.decoder.utc-offset", int64_t{0}),
              int64_t{-120});
  CHECK_EQUAL(caf::get_or(cfg, "plugins.kv.min-pairs", int64_t{0}),
              int64_t{2});
  CHECK_EQUAL(caf::get_or(cfg, "plugins.kv.ratio", 0.0), 0.5);
  auto disabled = caf::get_or(cfg, "evnorm.disable-plugins",
                              std::vector<std::string>{});
  CHECK_EQUAL(disabled, (std::vector<std::string>{"leef"}));
  CHECK(caf::get_if<caf::settings>(&cfg, "plugins.kv") != nullptr);
}

TEST("yaml configuration may be empty") {
  auto cfg = unbox(from_yaml(""));
  CHECK(cfg.empty());
}

TEST("yaml configuration requires a map") {
  CHECK_EQUAL(from_yaml("- a\n- b\n").error(), ec::invalid_configuration);
  CHECK_EQUAL(from_yaml("scalar").error(), ec::invalid_configuration);
}

TEST("yaml configuration reports syntax errors") {
  CHECK_EQUAL(from_yaml("a: [1, 2").error(), ec::parse_error);
}

TEST("configuration file loading") {
  const auto dir = std::filesystem::temp_directory_path();
  const auto file = dir / "evnorm-configuration-test.yaml";
  {
    auto out = std::ofstream{file};
    out << example;
  }
  auto cfg = unbox(load_config_file(file));
  CHECK_EQUAL(caf::get_or(cfg, "evnorm.decoder.syntax", ""), "rfc5424");
  std::filesystem::remove(file);
  CHECK_EQUAL(load_config_file(file).error(), ec::no_such_file);
}
