//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/json.hpp"

#include "evnorm/defaults.hpp"
#include "evnorm/detail/assert.hpp"
#include "evnorm/detail/string.hpp"
#include "evnorm/error.hpp"

#include <fmt/format.h>
#include <simdjson.h>

#include <stdexcept>
#include <string>

namespace evnorm {

namespace {

auto parse(const simdjson::dom::element& elem) -> data {
  switch (elem.type()) {
    case simdjson::dom::element_type::NULL_VALUE:
      return data{};
    case simdjson::dom::element_type::DOUBLE:
      return elem.get_double().value();
    case simdjson::dom::element_type::UINT64:
      return elem.get_uint64().value();
    case simdjson::dom::element_type::INT64:
      return elem.get_int64().value();
    case simdjson::dom::element_type::BOOL:
      return elem.get_bool().value();
    case simdjson::dom::element_type::STRING:
      return std::string{elem.get_string().value()};
    case simdjson::dom::element_type::ARRAY:
      return simdjson::minify(elem);
    case simdjson::dom::element_type::OBJECT:
      break;
  }
  EVNORM_UNREACHABLE();
}

void flatten(const simdjson::dom::object& obj, const std::string& prefix,
             record& result, size_t depth = 0) {
  if (depth > defaults::json::max_recursion) {
    throw std::runtime_error("nesting too deep");
  }
  for (const auto& field : obj) {
    auto key = prefix.empty() ? std::string{field.key}
                              : fmt::format("{}.{}", prefix, field.key);
    if (field.value.type() == simdjson::dom::element_type::OBJECT) {
      flatten(field.value.get_object().value(), key, result, depth + 1);
    } else if (not result.contains(key)) {
      result.emplace(std::move(key), parse(field.value));
    }
  }
}

} // namespace

auto parse_json_object(std::string_view str) -> caf::expected<record> {
  str = detail::trim(str);
  if (not str.starts_with('{') or not str.ends_with('}')) {
    return caf::make_error(ec::parse_error, "input is no JSON object");
  }
  auto padded_string = simdjson::padded_string{str};
  simdjson::dom::parser parser;
  simdjson::dom::element doc;
  if (auto error = parser.parse(padded_string).get(doc)) {
    return caf::make_error(ec::parse_error,
                           fmt::format("{}", simdjson::error_message(error)));
  }
  simdjson::dom::object obj;
  if (auto error = doc.get(obj)) {
    return caf::make_error(ec::parse_error,
                           fmt::format("{}", simdjson::error_message(error)));
  }
  auto result = record{};
  try {
    flatten(obj, {}, result);
  } catch (const simdjson::simdjson_error& e) {
    return caf::make_error(ec::parse_error, fmt::format("{}", e.what()));
  } catch (const std::runtime_error& e) {
    return caf::make_error(ec::parse_error, fmt::format("{}", e.what()));
  }
  return result;
}

} // namespace evnorm
