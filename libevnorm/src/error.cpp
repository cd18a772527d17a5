//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/error.hpp"

#include "evnorm/detail/assert.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <iterator>
#include <sstream>
#include <string>

namespace evnorm {
namespace {

const char* descriptions[] = {
  "no_error",
  "no_such_file",
  "parse_error",
  "version_error",
  "logic_error",
  "invalid_argument",
  "invalid_configuration",
  "diagnostic",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i)) {
        oss << ctx.get_as<std::string>(i);
      } else {
        oss << caf::deep_to_string(ctx);
      }
    }
  }
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  EVNORM_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto render(const caf::error& err) -> std::string {
  if (not err) {
    return "";
  }
  std::ostringstream oss;
  auto category = err.category();
  if (category == caf::type_id_v<evnorm::ec>
      and static_cast<evnorm::ec>(err.code()) == ec::diagnostic) {
    // Diagnostics carry their rendered text as the only context element.
    const auto& ctx = err.context();
    if (ctx.size() == 1 and ctx.match_element<std::string>(0)) {
      return ctx.get_as<std::string>(0);
    }
  }
  oss << "!! ";
  switch (category) {
    default:
      oss << "unknown";
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<evnorm::ec>: {
      const auto code = static_cast<evnorm::ec>(err.code());
      oss << to_string(code);
      render_default_ctx(oss, err.context());
      break;
    }
    case caf::type_id_v<caf::pec>:
      oss << to_string(static_cast<caf::pec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<caf::sec>:
      oss << to_string(static_cast<caf::sec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
  }
  return std::move(oss).str();
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (not error) {
    return error;
  }
  if (not error.context()) {
    return caf::error{
      error.code(),
      error.category(),
      caf::make_message(std::move(str)),
    };
  }
  return caf::error{
    error.code(),
    error.category(),
    caf::message::concat(error.context(), caf::make_message(std::move(str))),
  };
}

} // namespace evnorm
