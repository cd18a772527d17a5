//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/config.hpp"
#include "evnorm/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/fwd.hpp>

#include <string>

// EVNORM_INFO -> spdlog::info
// EVNORM_VERBOSE -> spdlog::debug
// EVNORM_DEBUG -> spdlog::trace

#if EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif EVNORM_LOG_LEVEL == EVNORM_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include "evnorm/detail/logger.hpp"

namespace evnorm::detail {

template <class... Ts>
constexpr void discard_args(Ts&&...) noexcept {
  // nop
}

} // namespace evnorm::detail

#define EVNORM_DISCARD_ARGS(...) ::evnorm::detail::discard_args(__VA_ARGS__)

#if EVNORM_LOG_LEVEL >= EVNORM_LOG_LEVEL_DEBUG

#  define EVNORM_DEBUG(...)                                                    \
    SPDLOG_LOGGER_TRACE(::evnorm::detail::logger(), __VA_ARGS__)

#else // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_DEBUG

#  define EVNORM_DEBUG(...) EVNORM_DISCARD_ARGS(__VA_ARGS__)

#endif // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_DEBUG

#if EVNORM_LOG_LEVEL >= EVNORM_LOG_LEVEL_VERBOSE

#  define EVNORM_VERBOSE(...)                                                  \
    SPDLOG_LOGGER_DEBUG(::evnorm::detail::logger(), __VA_ARGS__)

#else // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_VERBOSE

#  define EVNORM_VERBOSE(...) EVNORM_DISCARD_ARGS(__VA_ARGS__)

#endif // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_VERBOSE

#if EVNORM_LOG_LEVEL >= EVNORM_LOG_LEVEL_INFO

#  define EVNORM_INFO(...)                                                     \
    SPDLOG_LOGGER_INFO(::evnorm::detail::logger(), __VA_ARGS__)

#else // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_INFO

#  define EVNORM_INFO(...) EVNORM_DISCARD_ARGS(__VA_ARGS__)

#endif // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_INFO

#if EVNORM_LOG_LEVEL >= EVNORM_LOG_LEVEL_WARNING

#  define EVNORM_WARN(...)                                                     \
    SPDLOG_LOGGER_WARN(::evnorm::detail::logger(), __VA_ARGS__)

#else // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_WARNING

#  define EVNORM_WARN(...) EVNORM_DISCARD_ARGS(__VA_ARGS__)

#endif // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_WARNING

#if EVNORM_LOG_LEVEL >= EVNORM_LOG_LEVEL_ERROR

#  define EVNORM_ERROR(...)                                                    \
    SPDLOG_LOGGER_ERROR(::evnorm::detail::logger(), __VA_ARGS__)

#else // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_ERROR

#  define EVNORM_ERROR(...) EVNORM_DISCARD_ARGS(__VA_ARGS__)

#endif // EVNORM_LOG_LEVEL < EVNORM_LOG_LEVEL_ERROR

namespace evnorm {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to turn log level strings from the config, like 'debug', into a log
/// level int.
auto loglevel_to_int(std::string x, int default_value = EVNORM_LOG_LEVEL_QUIET)
  -> int;

/// Replaces the default logger with the sinks that `cfg` configures.
/// @param cfg The settings to read the `evnorm.*` logger options from.
/// @returns A guard that shuts down logging when it goes out of scope.
[[nodiscard]] auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)()>>;

} // namespace evnorm
