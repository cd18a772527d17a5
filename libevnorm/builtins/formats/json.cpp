//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include <evnorm/data.hpp>
#include <evnorm/diagnostics.hpp>
#include <evnorm/error.hpp>
#include <evnorm/event.hpp>
#include <evnorm/field_mapping.hpp>
#include <evnorm/json.hpp>
#include <evnorm/logger.hpp>
#include <evnorm/parsing_cache.hpp>
#include <evnorm/plugin.hpp>

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <string>

namespace evnorm::plugins::json {

namespace {

/// Matches messages that consist of a single JSON object and that no other
/// plugin classified yet.
class plugin final : public virtual message_plugin {
public:
  auto initialize(const caf::settings& plugin_config,
                  const caf::settings& global_config) -> caf::error override {
    (void)global_config;
    if (const auto* value = caf::get_if(&plugin_config, "infer-types")) {
      const auto* flag = caf::get_if<bool>(value);
      if (not flag) {
        return caf::make_error(ec::invalid_configuration,
                               "plugins.json.infer-types must be a boolean");
      }
      infer_types_ = *flag;
    }
    return {};
  }

  auto name() const -> std::string override {
    return "json";
  }

  auto stage() const -> plugin_stage override {
    return plugin_stage::unprocessed_structured;
  }

  auto try_decode(event& x, parsing_cache& cache) const -> bool override {
    if (x.classification) {
      return false;
    }
    const auto& parsed
      = cache.get_or_compute("json", x.message, parse_json_object);
    if (not parsed) {
      EVNORM_DEBUG("json plugin declines message: {}", render(parsed.error()));
      return false;
    }
    if (parsed->empty()) {
      return false;
    }
    auto fields = *parsed;
    if (infer_types_) {
      for (auto& [key, value] : fields) {
        if (const auto* str = try_as<std::string>(value)) {
          value = infer_data(*str);
        }
      }
    }
    if (auto err = apply_field_mapping(x, fields, "generic", "unknown_json",
                                       "unknown")) {
      diagnostic::error(err).throw_();
    }
    return true;
  }

private:
  bool infer_types_ = false;
};

} // namespace

} // namespace evnorm::plugins::json

EVNORM_REGISTER_PLUGIN(evnorm::plugins::json::plugin)
