//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include <evnorm/data.hpp>
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
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

// The Log Event Extended Format (LEEF) is an event representation that has been
// popularized by IBM QRadar. The official documentation at
// https://www.ibm.com/docs/en/dsm?topic=overview-leef-event-components provides
// more details into the format.
namespace evnorm::plugins::leef {

namespace {

/// A LEEF message.
struct message {
  std::string leef_version;
  std::string vendor;
  std::string product_name;
  std::string product_version;
  std::string event_id;
  char delim = '\t';
  kv_pairs attributes;
};

/// Unescapes LEEF string data containing \r, \n, \t, \\, \|, and \=.
auto unescape(std::string_view value) -> std::string {
  std::string result;
  result.reserve(value.size());
  for (auto i = 0u; i < value.size(); ++i) {
    if (value[i] != '\\') {
      result += value[i];
    } else if (i + 1 < value.size()) {
      auto next = value[i + 1];
      switch (next) {
        default:
          result += next;
          break;
        case 'r':
          result += '\r';
          break;
        case 'n':
          result += '\n';
          break;
        case 't':
          result += '\t';
          break;
      }
      ++i;
    }
  }
  return result;
}

/// Parses a LEEF 2.0 delimiter.
auto parse_delimiter(std::string_view field) -> std::variant<char, diagnostic> {
  if (field.empty()) {
    return '\t';
  }
  if (field.size() > 1
      and (field.starts_with("x") or field.starts_with("0x"))) {
    auto i = field.find('x');
    EVNORM_ASSERT(i != std::string_view::npos);
    auto hex = field.substr(i + 1);
    if (hex.empty() or hex.size() > 2) {
      return diagnostic::warning("wrong hex delimiter size: {}", hex.size())
        .hint("need 1 or 2 hex chars")
        .done();
    }
    if (auto c = detail::hex_to_byte(hex)) {
      return *c;
    }
    return diagnostic::warning("invalid hex delimiter: {}", field)
      .hint("hex delimiters with 'x' or '0x' require subsequent hex chars")
      .done();
  }
  if (field.size() > 1) {
    return diagnostic::warning("invalid non-hex delimiter")
      .hint("expected a single character, but got {}", field.size())
      .done();
  }
  return field[0];
}

/// Parses the LEEF attributes field as a sequence of key-value pairs.
auto parse_attributes(char delimiter, std::string_view attributes)
  -> std::variant<kv_pairs, diagnostic> {
  auto result = kv_pairs{};
  attributes = detail::trim(attributes);
  if (attributes.empty()) {
    return result;
  }
  // Some LEEF 1.0 producers separate attributes with spaces instead of tabs.
  // Their values then end at the last whitespace before the next key, as
  // with CEF extensions.
  if (delimiter == '\t' and attributes.find('\t') == std::string_view::npos) {
    return parse_extension(attributes);
  }
  for (auto kvp : detail::split_escaped(attributes, delimiter)) {
    kvp = detail::trim(kvp);
    if (kvp.empty()) {
      continue;
    }
    auto eq = detail::find_unescaped(kvp, '=');
    if (eq == std::string_view::npos or eq == 0) {
      return diagnostic::warning("failed to parse LEEF attributes")
        .note("invalid attribute: {}", kvp)
        .done();
    }
    result.emplace_back(unescape(detail::trim(kvp.substr(0, eq))),
                        unescape(kvp.substr(eq + 1)));
  }
  return result;
}

/// Parses a message that contains a LEEF header, either at its start or after
/// a leading hostname.
auto parse_message(std::string_view line) -> std::variant<message, diagnostic> {
  const auto header = detail::find_header(line, "LEEF:");
  if (header == std::string_view::npos) {
    return diagnostic::note("message has no LEEF header").done();
  }
  line.remove_prefix(header);
  auto result = message{};
  // We first need to find out whether we are LEEF 1.0 or 2.0. The latter has
  // one additional top-level component.
  auto pipe = line.find('|');
  if (pipe == std::string_view::npos) {
    return diagnostic::warning("invalid LEEF event")
      .note("could not find a pipe (|) that separates LEEF metadata")
      .done();
  }
  result.leef_version = std::string{line.substr(5, pipe - 5)};
  auto num_fields = size_t{0};
  if (result.leef_version == "1.0") {
    num_fields = 5;
  } else if (result.leef_version == "2.0") {
    num_fields = 6;
  } else {
    return diagnostic::warning("unsupported LEEF version: {}",
                               result.leef_version)
      .hint("only 1.0 and 2.0 are valid values")
      .done();
  }
  auto fields = detail::split_escaped(line, '|', num_fields);
  if (fields.size() != num_fields + 1) {
    return diagnostic::warning("LEEF {} requires at least {} fields",
                               result.leef_version, num_fields + 1)
      .note("got {} fields", fields.size())
      .done();
  }
  if (result.leef_version == "2.0") {
    auto delim = parse_delimiter(fields[5]);
    if (const auto* c = std::get_if<char>(&delim)) {
      EVNORM_DEBUG("parsed LEEF delimiter: {:#04x}", static_cast<int>(*c));
      result.delim = *c;
    } else {
      return std::get<diagnostic>(std::move(delim));
    }
  }
  result.vendor = unescape(fields[1]);
  result.product_name = unescape(fields[2]);
  result.product_version = unescape(fields[3]);
  result.event_id = unescape(fields[4]);
  auto attributes = parse_attributes(result.delim, fields.back());
  if (auto* diag = std::get_if<diagnostic>(&attributes)) {
    return std::move(*diag);
  }
  result.attributes = std::get<kv_pairs>(std::move(attributes));
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
                               "plugins.leef.infer-types must be a boolean");
      }
      infer_types_ = *flag;
    }
    return {};
  }

  auto name() const -> std::string override {
    return "leef";
  }

  auto stage() const -> plugin_stage override {
    return plugin_stage::unprocessed_structured;
  }

  auto try_decode(event& x, parsing_cache& cache) const -> bool override {
    const auto& parsed = cache.get_or_compute("leef", x.message, parse_message);
    if (const auto* diag = std::get_if<diagnostic>(&parsed)) {
      if (diag->severity != severity::note) {
        EVNORM_DEBUG("leef plugin declines message: {}", *diag);
      }
      return false;
    }
    const auto& msg = std::get<message>(parsed);
    auto names = std::vector<std::string>{
      "leef_version", "vendor", "product_name", "product_version", "event_id",
    };
    auto values = std::vector<data>{
      msg.leef_version, msg.vendor, msg.product_name,
      msg.product_version, msg.event_id,
    };
    auto msgclass = detail::to_lower(msg.event_id);
    const std::string* category = nullptr;
    for (const auto& [key, value] : msg.attributes) {
      if (key == "cat" and category == nullptr) {
        category = &value;
      }
      names.push_back(key);
      values.push_back(infer_types_ ? infer_data(value) : data{value});
    }
    if (category != nullptr) {
      msgclass = fmt::format("{}_{}", detail::to_lower(*category), msgclass);
    }
    if (auto err = apply_field_mapping(x, names, values,
                                       detail::to_lower(msg.vendor),
                                       detail::to_lower(msg.product_name),
                                       msgclass)) {
      diagnostic::error(err).throw_();
    }
    return true;
  }

private:
  bool infer_types_ = false;
};

} // namespace

} // namespace evnorm::plugins::leef

EVNORM_REGISTER_PLUGIN(evnorm::plugins::leef::plugin)
