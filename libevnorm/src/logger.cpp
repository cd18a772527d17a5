//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/logger.hpp"

#include "evnorm/defaults.hpp"
#include "evnorm/detail/assert.hpp"

#include <caf/settings.hpp>
#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace evnorm {

auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)()>> {
  if (not detail::setup_spdlog(cfg)) {
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up logging");
  }
  return {caf::detail::make_scope_guard(
    std::addressof(detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
auto loglevel_to_int(std::string x, int default_value) -> int {
  for (auto& ch : x) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (x == "quiet") {
    return EVNORM_LOG_LEVEL_QUIET;
  }
  if (x == "error") {
    return EVNORM_LOG_LEVEL_ERROR;
  }
  if (x == "warning") {
    return EVNORM_LOG_LEVEL_WARNING;
  }
  if (x == "info") {
    return EVNORM_LOG_LEVEL_INFO;
  }
  if (x == "verbose") {
    return EVNORM_LOG_LEVEL_VERBOSE;
  }
  if (x == "debug") {
    return EVNORM_LOG_LEVEL_DEBUG;
  }
  if (x == "trace") {
    return EVNORM_LOG_LEVEL_TRACE;
  }
  return default_value;
}

namespace {

/// Converts an evnorm log level to spdlog level
auto evnorm_loglevel_to_spd(const int value) -> spdlog::level::level_enum {
  switch (value) {
    case EVNORM_LOG_LEVEL_QUIET:
      return spdlog::level::off;
    case EVNORM_LOG_LEVEL_CRITICAL:
      return spdlog::level::critical;
    case EVNORM_LOG_LEVEL_ERROR:
      return spdlog::level::err;
    case EVNORM_LOG_LEVEL_WARNING:
      return spdlog::level::warn;
    case EVNORM_LOG_LEVEL_INFO:
      return spdlog::level::info;
    case EVNORM_LOG_LEVEL_VERBOSE:
      return spdlog::level::debug;
    case EVNORM_LOG_LEVEL_DEBUG:
    case EVNORM_LOG_LEVEL_TRACE:
      return spdlog::level::trace;
  }
  EVNORM_PANIC("unhandled log level");
}

/// Reads a verbosity option, falling back to `fallback` if it is absent.
/// @returns -1 if the configured value is not a known verbosity.
auto get_verbosity(const caf::settings& cfg, std::string_view key,
                   const char* fallback) -> int {
  auto value = caf::get_or(cfg, key, std::string{fallback});
  auto result = loglevel_to_int(value, -1);
  if (result < 0) {
    fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
               value);
  }
  return result;
}

} // namespace

namespace detail {

auto setup_spdlog(const caf::settings& cfg) -> bool try {
  if (logger()->name() != "/dev/null") {
    EVNORM_ERROR("Log already up");
    return false;
  }
  const auto console_verbosity
    = get_verbosity(cfg, "evnorm.console-verbosity",
                    defaults::logger::console_verbosity);
  auto file_verbosity = get_verbosity(cfg, "evnorm.file-verbosity",
                                      defaults::logger::file_verbosity);
  if (console_verbosity < 0 or file_verbosity < 0) {
    return false;
  }
  auto log_file = caf::get_or(cfg, "evnorm.log-file",
                              std::string{defaults::logger::log_file});
  const auto verbosity = std::max(file_verbosity, console_verbosity);
  spdlog::init_thread_pool(defaults::logger::queue_size,
                           defaults::logger::logger_threads);
  std::vector<spdlog::sink_ptr> sinks;
  // Add console sink.
  auto sink_type = caf::get_or(cfg, "evnorm.console-sink",
                               std::string{defaults::logger::console_sink});
  auto console_sink = [&]() -> spdlog::sink_ptr {
    if (sink_type == "stderr") {
      return std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(
        spdlog::color_mode::automatic);
    }
    if (sink_type == "syslog") {
      auto syslog_sink = std::make_shared<spdlog::sinks::syslog_sink_mt>(
        "evnorm", /*options = */ 0, LOG_USER, /*enable_formatting = */ true);
      return std::static_pointer_cast<spdlog::sinks::sink>(syslog_sink);
    }
    fmt::print(stderr,
               "failed to start logger; evnorm.console-sink '{}' is invalid "
               "(expected 'stderr' or 'syslog')\n",
               sink_type);
    return nullptr;
  }();
  if (not console_sink) {
    return false;
  }
  auto console_format
    = caf::get_or(cfg, "evnorm.console-format",
                  std::string{defaults::logger::console_format});
  console_sink->set_pattern(console_format);
  console_sink->set_level(evnorm_loglevel_to_spd(console_verbosity));
  sinks.push_back(console_sink);
  // Add file sink.
  if (file_verbosity != EVNORM_LOG_LEVEL_QUIET) {
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_level(evnorm_loglevel_to_spd(file_verbosity));
    auto file_format = caf::get_or(cfg, "evnorm.file-format",
                                   std::string{defaults::logger::file_format});
    file_sink->set_pattern(file_format);
    sinks.push_back(file_sink);
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "evnorm", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(evnorm_loglevel_to_spd(verbosity));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  fmt::print(stderr, "failed to start logger; {}\n", err.what());
  return false;
}

void shutdown_spdlog() {
  EVNORM_DEBUG("shut down logging");
  spdlog::shutdown();
}

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static std::shared_ptr<spdlog::logger> evnorm_logger
    = spdlog::async_factory::template create<spdlog::sinks::null_sink_mt>(
      "/dev/null");
  return evnorm_logger;
}

} // namespace detail
} // namespace evnorm
