//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/parsing_cache.hpp"

#include "evnorm/diagnostics.hpp"
#include "evnorm/error.hpp"
#include "evnorm/json.hpp"
#include "evnorm/kv.hpp"
#include "evnorm/test/test.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

using namespace evnorm;

TEST("parsing cache computes once") {
  auto cache = parsing_cache{};
  auto calls = 0;
  auto split = [&](std::string_view raw) {
    ++calls;
    return parse_key_value(raw);
  };
  const auto raw = std::string_view{"a=1 b=2"};
  const auto& first = cache.get_or_compute("kv", raw, split);
  const auto& second = cache.get_or_compute("kv", raw, split);
  CHECK_EQUAL(calls, 1);
  CHECK(&first == &second);
  REQUIRE_EQUAL(first.size(), 2u);
  CHECK_EQUAL(first[1].second, "2");
  CHECK(cache.contains("kv"));
  CHECK_EQUAL(cache.size(), 1u);
}

TEST("parsing cache ignores the input on a hit") {
  auto cache = parsing_cache{};
  const auto& first = cache.get_or_compute("kv", "a=1", parse_key_value);
  const auto& second = cache.get_or_compute("kv", "b=2", parse_key_value);
  CHECK(&first == &second);
  CHECK_EQUAL(second[0].first, "a");
}

TEST("parsing cache keys are independent") {
  auto cache = parsing_cache{};
  const auto& x = cache.get_or_compute("length", "abc", [](std::string_view s) {
    return s.size();
  });
  const auto& y = cache.get_or_compute("copy", "abc", [](std::string_view s) {
    return std::string{s};
  });
  CHECK_EQUAL(x, 3u);
  CHECK_EQUAL(y, "abc");
  CHECK_EQUAL(cache.size(), 2u);
  cache.clear();
  CHECK_EQUAL(cache.size(), 0u);
  CHECK(not cache.contains("length"));
}

TEST("parsing cache stores nothing if the parser throws") {
  auto cache = parsing_cache{};
  auto failed = false;
  try {
    cache.get_or_compute("boom", "", [](std::string_view) -> int {
      throw std::runtime_error{"boom"};
    });
  } catch (const std::runtime_error&) {
    failed = true;
  }
  CHECK(failed);
  CHECK(not cache.contains("boom"));
  const auto& x
    = cache.get_or_compute("boom", "", [](std::string_view) -> int {
        return 42;
      });
  CHECK_EQUAL(x, 42);
}

TEST("parsing cache rejects type mismatches") {
  auto cache = parsing_cache{};
  cache.get_or_compute("kv", "a=1", parse_key_value);
  auto failed = false;
  try {
    cache.get_or_compute("kv", "a=1", [](std::string_view) {
      return 42;
    });
  } catch (const diagnostic& diag) {
    failed = true;
    CHECK_EQUAL(diag.severity, severity::error);
  }
  CHECK(failed);
}

TEST("parsing cache holds parse results with errors") {
  static_assert(std::is_copy_constructible_v<caf::expected<record>>);
  auto cache = parsing_cache{};
  const auto& x = cache.get_or_compute("json", "not json", parse_json_object);
  REQUIRE(not x);
  CHECK_EQUAL(x.error(), ec::parse_error);
  const auto& y = cache.get_or_compute("json", R"({"a": 1})",
                                       parse_json_object);
  CHECK(&x == &y);
}
