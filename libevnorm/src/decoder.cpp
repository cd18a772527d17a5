//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/decoder.hpp"

#include "evnorm/detail/assert.hpp"
#include "evnorm/diagnostics.hpp"
#include "evnorm/error.hpp"
#include "evnorm/logger.hpp"
#include "evnorm/parsing_cache.hpp"
#include "evnorm/syslog.hpp"

#include <exception>

namespace evnorm {

auto to_string(syntax x) -> std::string_view {
  switch (x) {
    case syntax::automatic:
      return "automatic";
    case syntax::rfc5424:
      return "rfc5424";
    case syntax::rfc3164:
      return "rfc3164";
    case syntax::syslog:
      return "syslog";
    case syntax::envelope:
      return "envelope";
  }
  EVNORM_UNREACHABLE();
}

auto parse_syntax(std::string_view str) -> std::optional<syntax> {
  for (auto x : {syntax::automatic, syntax::rfc5424, syntax::rfc3164,
                 syntax::syslog, syntax::envelope}) {
    if (to_string(x) == str) {
      return x;
    }
  }
  return std::nullopt;
}

auto decoder_options::from_settings(const caf::settings& cfg)
  -> caf::expected<decoder_options> {
  auto result = decoder_options{};
  if (const auto* str
      = caf::get_if<std::string>(&cfg, "evnorm.decoder.syntax")) {
    auto parsed = parse_syntax(*str);
    if (not parsed) {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("evnorm.decoder.syntax '{}' is "
                                         "invalid",
                                         *str));
    }
    result.syntax = *parsed;
  }
  if (auto x = caf::get_as<bool>(cfg, "evnorm.decoder.lowercase-hostname")) {
    result.lowercase_hostname = *x;
  } else if (caf::get_if(&cfg, "evnorm.decoder.lowercase-hostname")) {
    return caf::make_error(ec::invalid_configuration,
                           "evnorm.decoder.lowercase-hostname must be a "
                           "boolean");
  }
  if (auto x = caf::get_as<int64_t>(cfg, "evnorm.decoder.utc-offset")) {
    if (*x < -24 * 60 or *x > 24 * 60) {
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("evnorm.decoder.utc-offset {} is out "
                                         "of range",
                                         *x));
    }
    result.utc_offset = std::chrono::minutes{*x};
  } else if (caf::get_if(&cfg, "evnorm.decoder.utc-offset")) {
    return caf::make_error(ec::invalid_configuration,
                           "evnorm.decoder.utc-offset must be an integer "
                           "number of minutes");
  }
  return result;
}

decoder::decoder(decoder_options options, plugin_registry& registry)
  : options_{std::move(options)}, registry_{&registry} {
  registry.freeze();
}

auto decoder::decode(std::string_view raw) const -> caf::expected<event> {
  auto result = parse(raw);
  if (not result) {
    return result;
  }
  // Every message gets its own cache.
  auto cache = parsing_cache{};
  const auto matches = enrich(*result, cache);
  EVNORM_DEBUG("decoded {} message with {} matching plugins", result->kind,
               matches);
  return result;
}

auto decoder::parse(std::string_view raw) const -> caf::expected<event> {
  auto opts = syslog_options{
    .lowercase_hostname = options_.lowercase_hostname,
    .reference_time = options_.reference_time,
    .utc_offset = options_.utc_offset,
  };
  if (not opts.reference_time) {
    opts.reference_time = std::chrono::time_point_cast<duration>(
      std::chrono::system_clock::now());
  }
  switch (options_.syntax) {
    case syntax::rfc5424:
      return parse_rfc5424(raw, opts);
    case syntax::rfc3164:
      return parse_rfc3164(raw, opts);
    case syntax::syslog:
      return parse_syslog(raw, opts);
    case syntax::envelope: {
      auto result = event{};
      result.message = std::string{raw};
      return result;
    }
    case syntax::automatic: {
      auto result = parse_rfc5424(raw, opts);
      if (result) {
        return result;
      }
      EVNORM_DEBUG("falling back to rfc3164: {}", render(result.error()));
      result = parse_rfc3164(raw, opts);
      if (result) {
        return result;
      }
      EVNORM_DEBUG("falling back to envelope: {}", render(result.error()));
      auto envelope = event{};
      envelope.message = std::string{raw};
      return envelope;
    }
  }
  EVNORM_UNREACHABLE();
}

auto decoder::enrich(event& x, parsing_cache& cache) const -> size_t {
  if (x.message.empty()) {
    return 0;
  }
  auto matches = size_t{0};
  // Rolls back the partial writes of a failed plugin, records the failure on
  // the event, and moves on to the next plugin.
  auto snapshot = event{};
  auto isolate = [&](const message_plugin& plugin, std::string_view what) {
    x = std::move(snapshot);
    EVNORM_WARN("plugin `{}` failed: {}", plugin.name(), what);
    diagnostic::warning("plugin `{}` failed", plugin.name())
      .note(std::string{what})
      .emit(x.diagnostics);
  };
  for (auto stage : plugin_stages) {
    for (const auto* plugin : registry_->message_plugins(x.kind, stage)) {
      snapshot = x;
      try {
        if (plugin->try_decode(x, cache)) {
          EVNORM_DEBUG("plugin `{}` matched in stage {}", plugin->name(),
                       to_string(stage));
          ++matches;
        }
      } catch (const diagnostic& diag) {
        isolate(*plugin, diag.message);
      } catch (const std::exception& err) {
        isolate(*plugin, err.what());
      } catch (...) {
        isolate(*plugin, "unknown exception");
      }
    }
  }
  return matches;
}

} // namespace evnorm
