//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include <evnorm/data.hpp>
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
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// The Common Event Format (CEF) is ArcSight's event representation. A message
// consists of seven pipe-separated header fields followed by an extension of
// space-separated key-value pairs:
//
//   CEF:Version|Device Vendor|Device Product|Device Version|Signature ID|Name|
//   Severity|Extension
namespace evnorm::plugins::cef {

namespace {

/// A CEF message.
struct message {
  int64_t cef_version = 0;
  std::string device_vendor;
  std::string device_product;
  std::string device_version;
  std::string signature_id;
  std::string name;
  std::string severity;
  kv_pairs extension;
};

/// Unescapes CEF header data containing \| and \\.
auto unescape_header(std::string_view value) -> std::string {
  auto result = std::string{};
  result.reserve(value.size());
  for (auto i = 0u; i < value.size(); ++i) {
    if (value[i] == '\\' and i + 1 < value.size()
        and (value[i + 1] == '|' or value[i + 1] == '\\')) {
      result += value[++i];
    } else {
      result += value[i];
    }
  }
  return result;
}

/// Parses a message that contains a CEF header, either at its start or after
/// a leading hostname.
auto parse_message(std::string_view str) -> std::variant<message, diagnostic> {
  const auto header = detail::find_header(str, "CEF:");
  if (header == std::string_view::npos) {
    return diagnostic::note("message has no CEF header").done();
  }
  str.remove_prefix(header);
  auto fields = detail::split_escaped(str, '|', 7);
  if (fields.size() != 8) {
    return diagnostic::warning("CEF requires 8 fields")
      .note("got {} fields", fields.size())
      .hint("CEF messages look like CEF:VERSION|VENDOR|PRODUCT|DEVICE "
            "VERSION|SIGNATURE ID|NAME|SEVERITY|EXTENSION")
      .done();
  }
  auto result = message{};
  auto version = fields[0].substr(4);
  const auto* last = version.data() + version.size();
  auto [ptr, err] = std::from_chars(version.data(), last, result.cef_version);
  if (err != std::errc{} or ptr != last) {
    return diagnostic::warning("failed to parse CEF version")
      .note("got `{}`", version)
      .done();
  }
  result.device_vendor = unescape_header(fields[1]);
  result.device_product = unescape_header(fields[2]);
  result.device_version = unescape_header(fields[3]);
  result.signature_id = unescape_header(fields[4]);
  result.name = unescape_header(fields[5]);
  result.severity = unescape_header(fields[6]);
  const auto extension = detail::trim(fields[7]);
  if (not extension.empty()) {
    if (detail::find_unescaped(extension, '=') == std::string_view::npos) {
      return diagnostic::warning(
               "extension field did not contain a key-value separator")
        .done();
    }
    result.extension = parse_extension(extension);
  }
  return result;
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
                               "plugins.cef.infer-types must be a boolean");
      }
      infer_types_ = *flag;
    }
    return {};
  }

  auto name() const -> std::string override {
    return "cef";
  }

  auto stage() const -> plugin_stage override {
    return plugin_stage::unprocessed_structured;
  }

  auto try_decode(event& x, parsing_cache& cache) const -> bool override {
    const auto& parsed = cache.get_or_compute("cef", x.message, parse_message);
    if (const auto* diag = std::get_if<diagnostic>(&parsed)) {
      if (diag->severity != severity::note) {
        EVNORM_DEBUG("cef plugin declines message: {}", *diag);
      }
      return false;
    }
    const auto& msg = std::get<message>(parsed);
    auto names = std::vector<std::string>{
      "cef_version",    "device_vendor", "device_product", "device_version",
      "signature_id",   "name",          "severity",
    };
    auto values = std::vector<data>{};
    values.reserve(names.size() + msg.extension.size());
    values.emplace_back(msg.cef_version);
    values.emplace_back(msg.device_vendor);
    values.emplace_back(msg.device_product);
    values.emplace_back(msg.device_version);
    values.emplace_back(msg.signature_id);
    values.emplace_back(msg.name);
    values.emplace_back(to_data(msg.severity));
    for (const auto& [key, value] : msg.extension) {
      names.push_back(key);
      values.push_back(to_data(value));
    }
    if (auto err = apply_field_mapping(x, names, values,
                                       detail::to_lower(msg.device_vendor),
                                       detail::to_lower(msg.device_product),
                                       detail::to_lower(msg.name))) {
      diagnostic::error(err).throw_();
    }
    return true;
  }

private:
  auto to_data(const std::string& value) const -> data {
    if (infer_types_) {
      return infer_data(value);
    }
    return value;
  }

  bool infer_types_ = false;
};

} // namespace

} // namespace evnorm::plugins::cef

EVNORM_REGISTER_PLUGIN(evnorm::plugins::cef::plugin)
