//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/event.hpp"
#include "evnorm/plugin.hpp"

#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <chrono>
#include <optional>
#include <string_view>

namespace evnorm {

/// Selects the grammar that turns raw text into an event.
enum class syntax : uint8_t {
  /// Try RFC 5424, then RFC 3164, and fall back to the raw envelope.
  automatic,
  rfc5424,
  rfc3164,
  /// The `<PRI>MSG` base form.
  syslog,
  /// No header at all; the raw text becomes the message.
  envelope,
};

/// @relates syntax
auto to_string(syntax x) -> std::string_view;

/// @relates syntax
auto parse_syntax(std::string_view str) -> std::optional<syntax>;

/// Options that control the decoder.
struct decoder_options {
  enum syntax syntax = syntax::automatic;
  bool lowercase_hostname = false;

  /// The clock reading to resolve year-less timestamps against. If unset, the
  /// decoder uses the current time.
  std::optional<time> reference_time = {};

  std::chrono::minutes utc_offset = std::chrono::minutes{0};

  /// Reads the options from `evnorm.decoder.*`.
  /// @returns The options, or `ec::invalid_configuration` for unknown values.
  static auto from_settings(const caf::settings& cfg)
    -> caf::expected<decoder_options>;
};

/// Turns raw text into events by running a grammar followed by the staged
/// chain of message plugins.
///
/// A decoder holds no per-message state, so a single instance can decode
/// concurrently from multiple threads.
class decoder {
public:
  /// Creates a decoder and freezes `registry`.
  explicit decoder(decoder_options options = {},
                   plugin_registry& registry = plugins::registry());

  /// Decodes a single message.
  /// @param raw The raw message.
  /// @returns The enriched event, or an error if the configured grammar
  /// rejects the message. The automatic syntax never fails.
  auto decode(std::string_view raw) const -> caf::expected<event>;

  /// Runs the staged plugin chain over an event. Every applicable plugin of
  /// every stage runs, regardless of whether a previous one matched.
  /// @param x The event to enrich.
  /// @param cache The parsing cache for the message of `x`.
  /// @returns The number of plugins that matched.
  auto enrich(event& x, parsing_cache& cache) const -> size_t;

  auto options() const -> const decoder_options& {
    return options_;
  }

private:
  auto parse(std::string_view raw) const -> caf::expected<event>;

  decoder_options options_;
  const plugin_registry* registry_;
};

} // namespace evnorm
