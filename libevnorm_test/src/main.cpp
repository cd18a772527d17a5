//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/error.hpp"
#include "evnorm/logger.hpp"
#include "evnorm/plugin.hpp"
#include "evnorm/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>
#include <caf/test/unit_test.hpp>

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace evnorm::test {

extern std::set<std::string> config;

} // namespace evnorm::test

namespace {

// Retrieves arguments after the '--' delimiter.
auto get_test_args(int argc, const char* const* argv)
  -> std::vector<std::string> {
  // Parse everything after after '--'.
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end) {
    return {};
  }
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  std::string evnorm_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (not test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(evnorm_loglevel, "evnorm-verbosity",
                          "console verbosity for libevnorm")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
    evnorm::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  caf::init_global_meta_objects<caf::id_block::evnorm_types>();
  caf::core::init_global_meta_objects();
  // The builtins run with their default configuration.
  if (auto err = evnorm::plugins::registry().initialize({})) {
    fmt::print(stderr, "failed to initialize plugins: {}\n",
               evnorm::render(err));
    return EXIT_FAILURE;
  }
  caf::settings log_settings;
  caf::put(log_settings, "evnorm.console-verbosity", evnorm_loglevel);
  caf::put(log_settings, "evnorm.console-format", "%^[%s:%#] %v%$");
  auto log_context = evnorm::create_log_context(log_settings);
  if (not log_context) {
    fmt::print(stderr, "failed to create log context: {}\n",
               evnorm::render(log_context.error()));
    return EXIT_FAILURE;
  }
  // Run the unit tests.
  auto result = caf::test::main(argc, argv);
  return result;
}
