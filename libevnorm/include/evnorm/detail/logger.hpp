//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace evnorm::detail {

/// Installs the configured sinks in place of the default logger.
/// @returns `false` if the logger was already set up or if the configuration
/// is invalid.
[[nodiscard]] auto setup_spdlog(const caf::settings& cfg) -> bool;

/// Flushes and destroys all loggers.
void shutdown_spdlog();

/// Get an spdlog logger.
/// @returns The process-wide logger, which discards all messages until
/// `setup_spdlog` replaced it.
auto logger() -> std::shared_ptr<spdlog::logger>&;

} // namespace evnorm::detail
