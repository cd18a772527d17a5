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
#include <evnorm/kv.hpp>
#include <evnorm/logger.hpp>
#include <evnorm/parsing_cache.hpp>
#include <evnorm/plugin.hpp>
#include <evnorm/timestamp.hpp>

#include <caf/error.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

// FortiGate firewalls emit key-value messages such as:
//
//   date=2023-05-09 time=02:33:52 devname="fw01" devid="FG100F" eventtime=
//   1683599632123456789 logid="0000000013" type="traffic" subtype="forward"
//
// Every message carries a ten-digit log ID and names its log type and subtype.
namespace evnorm::plugins::fortigate {

namespace {

/// Looks up the first value of `key`.
auto lookup(const kv_pairs& pairs, std::string_view key)
  -> const std::string* {
  const auto it = std::find_if(pairs.begin(), pairs.end(), [&](const auto& x) {
    return x.first == key;
  });
  return it == pairs.end() ? nullptr : &it->second;
}

auto is_logid(std::string_view str) -> bool {
  return str.size() == 10 and std::all_of(str.begin(), str.end(), [](char c) {
           return c >= '0' and c <= '9';
         });
}

class plugin final : public virtual message_plugin {
public:
  auto initialize(const caf::settings& plugin_config,
                  const caf::settings& global_config) -> caf::error override {
    (void)global_config;
    if (const auto* value = caf::get_if(&plugin_config, "infer-types")) {
      const auto* flag = caf::get_if<bool>(value);
      if (not flag) {
        return caf::make_error(ec::invalid_configuration,
                               "plugins.fortigate.infer-types must be a "
                               "boolean");
      }
      infer_types_ = *flag;
    }
    return {};
  }

  auto name() const -> std::string override {
    return "fortigate";
  }

  auto stage() const -> plugin_stage override {
    return plugin_stage::first_pass;
  }

  auto try_decode(event& x, parsing_cache& cache) const -> bool override {
    const auto& pairs = cache.get_or_compute("kv", x.message, parse_key_value);
    const auto* eventtime = lookup(pairs, "eventtime");
    const auto* type = lookup(pairs, "type");
    const auto* subtype = lookup(pairs, "subtype");
    const auto* logid = lookup(pairs, "logid");
    if (not eventtime or not type or not subtype or not logid
        or not is_logid(*logid)) {
      return false;
    }
    auto names = std::vector<std::string>{};
    auto values = std::vector<data>{};
    names.reserve(pairs.size());
    values.reserve(pairs.size());
    for (const auto& [key, value] : pairs) {
      names.push_back(key);
      values.push_back(infer_types_ ? infer_data(value) : data{value});
    }
    if (auto err
        = apply_field_mapping(x, names, values, "fortinet", "fortigate",
                              fmt::format("{}_{}", *type, *subtype))) {
      diagnostic::error(err).throw_();
    }
    if (not x.timestamp) {
      if (auto ts = parse_epoch(*eventtime)) {
        x.timestamp = *ts;
      } else {
        diagnostic::warning("failed to parse FortiGate eventtime")
          .note("got `{}`", *eventtime)
          .emit(x.diagnostics);
      }
    }
    return true;
  }

private:
  bool infer_types_ = false;
};

} // namespace

} // namespace evnorm::plugins::fortigate

EVNORM_REGISTER_PLUGIN(evnorm::plugins::fortigate::plugin)
