//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include <evnorm/data.hpp>
#include <evnorm/defaults.hpp>
#include <evnorm/detail/assert.hpp>
#include <evnorm/detail/string.hpp>
#include <evnorm/diagnostics.hpp>
#include <evnorm/error.hpp>
#include <evnorm/event.hpp>
#include <evnorm/field_mapping.hpp>
#include <evnorm/kv.hpp>
#include <evnorm/logger.hpp>
#include <evnorm/parsing_cache.hpp>
#include <evnorm/plugin.hpp>

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>
#include <re2/re2.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace evnorm::plugins::kv {

namespace {

auto make_key_regex(std::string_view pattern)
  -> caf::expected<std::unique_ptr<re2::RE2>> {
  auto regex = std::make_unique<re2::RE2>(
    re2::StringPiece{pattern.data(), pattern.size()},
    re2::RE2::CannedOptions::Quiet);
  if (not regex->ok()) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("could not parse key pattern `{}`: {}",
                                       pattern, regex->error()));
  }
  return regex;
}

/// Matches messages that consist of `key=value` pairs and that no other
/// plugin classified yet.
class plugin final : public virtual message_plugin {
public:
  plugin() {
    auto regex = make_key_regex(defaults::kv::key_pattern);
    EVNORM_ASSERT(regex);
    key_regex_ = std::move(*regex);
  }

  auto initialize(const caf::settings& plugin_config,
                  const caf::settings& global_config) -> caf::error override {
    (void)global_config;
    if (const auto* value = caf::get_if(&plugin_config, "infer-types")) {
      const auto* flag = caf::get_if<bool>(value);
      if (not flag) {
        return caf::make_error(ec::invalid_configuration,
                               "plugins.kv.infer-types must be a boolean");
      }
      infer_types_ = *flag;
    }
    if (const auto* value = caf::get_if(&plugin_config, "key-pattern")) {
      const auto* pattern = caf::get_if<std::string>(value);
      if (not pattern) {
        return caf::make_error(ec::invalid_configuration,
                               "plugins.kv.key-pattern must be a string");
      }
      auto regex = make_key_regex(*pattern);
      if (not regex) {
        return std::move(regex.error());
      }
      key_regex_ = std::move(*regex);
    }
    if (const auto* value = caf::get_if(&plugin_config, "min-pairs")) {
      const auto* min_pairs = caf::get_if<int64_t>(value);
      if (not min_pairs or *min_pairs < 1) {
        return caf::make_error(ec::invalid_configuration,
                               "plugins.kv.min-pairs must be a positive "
                               "integer");
      }
      min_pairs_ = *min_pairs;
    }
    return {};
  }

  auto name() const -> std::string override {
    return "kv";
  }

  auto stage() const -> plugin_stage override {
    return plugin_stage::unprocessed_structured;
  }

  auto try_decode(event& x, parsing_cache& cache) const -> bool override {
    if (x.classification) {
      return false;
    }
    if (detail::find_header(x.message, "CEF:") != std::string_view::npos
        or detail::find_header(x.message, "LEEF:") != std::string_view::npos) {
      return false;
    }
    const auto& pairs = cache.get_or_compute("kv", x.message, parse_key_value);
    auto names = std::vector<std::string>{};
    auto values = std::vector<data>{};
    for (const auto& [key, value] : pairs) {
      if (not re2::RE2::FullMatch(key, *key_regex_)) {
        EVNORM_DEBUG("kv plugin ignores invalid key `{}`", key);
        continue;
      }
      names.push_back(key);
      values.push_back(infer_types_ ? infer_data(value) : data{value});
    }
    if (static_cast<int64_t>(names.size()) < min_pairs_) {
      return false;
    }
    if (auto err = apply_field_mapping(x, names, values, "generic",
                                       "unknown_kv", "unknown")) {
      diagnostic::error(err).throw_();
    }
    return true;
  }

private:
  bool infer_types_ = false;
  int64_t min_pairs_ = defaults::kv::min_pairs;
  std::unique_ptr<re2::RE2> key_regex_;
};

} // namespace

} // namespace evnorm::plugins::kv

EVNORM_REGISTER_PLUGIN(evnorm::plugins::kv::plugin)
