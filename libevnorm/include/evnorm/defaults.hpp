//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <cstdint>

// Global constants and default values.

namespace evnorm::defaults {

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Log filename.
inline constexpr const char* log_file = "evnorm.log";

/// Log format for file output.
inline constexpr const char* file_format
  = "[%Y-%m-%dT%T.%e%z] [%n] [%l] [%s:%#] %v";

/// Log format for console output.
inline constexpr const char* console_format = "%^[%T.%e] %v%$";

/// Verbosity for writing to console.
inline constexpr const char* console_verbosity = "info";

/// Verbosity for writing to file.
inline constexpr const char* file_verbosity = "quiet";

/// The console sink type, either `stderr` or `syslog`.
inline constexpr const char* console_sink = "stderr";

/// Maximum number of log messages in the logger queue.
inline constexpr const size_t queue_size = 8'192;

/// Number of logger threads.
inline constexpr const size_t logger_threads = 1;

} // namespace logger

// -- constants for the syslog grammars ----------------------------------------

namespace syslog {

/// The largest valid PRIVAL, i.e., facility 23 and severity 7.
inline constexpr uint16_t max_prival = 191;

/// The longest valid HOSTNAME of an RFC 5424 message.
inline constexpr size_t max_hostname_length = 255;

/// The longest valid APP-NAME of an RFC 5424 message.
inline constexpr size_t max_app_name_length = 48;

/// The longest valid PROCID of an RFC 5424 message.
inline constexpr size_t max_proc_id_length = 128;

/// The longest valid MSGID of an RFC 5424 message.
inline constexpr size_t max_msg_id_length = 32;

/// The longest valid SD-ID and PARAM-NAME of an RFC 5424 message.
inline constexpr size_t max_sd_name_length = 32;

} // namespace syslog

// -- constants for the key-value plugin ---------------------------------------

namespace kv {

/// The pattern that every key must fully match.
inline constexpr const char* key_pattern = "[A-Za-z_][A-Za-z0-9_.:@/-]*";

/// The minimum number of valid pairs for a message to count as key-value.
inline constexpr const int64_t min_pairs = 1;

} // namespace kv

// -- constants for the JSON plugin --------------------------------------------

namespace json {

/// The deepest nesting of objects that the JSON plugin flattens.
inline constexpr const size_t max_recursion = 100;

} // namespace json

} // namespace evnorm::defaults
