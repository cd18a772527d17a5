//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/detail/stable_map.hpp"

#include "evnorm/test/test.hpp"

#include <string>

using namespace evnorm;

namespace {

struct fixture {
  fixture() {
    xs["foo"] = 1;
    xs.insert({"bar", 2});
    xs.emplace("baz", 3);
  }

  detail::stable_map<std::string, int> xs;
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("stable_map keeps insertion order") {
    REQUIRE_EQUAL(xs.size(), 3u);
    auto i = xs.begin();
    CHECK_EQUAL(i->first, "foo");
    CHECK_EQUAL((++i)->first, "bar");
    CHECK_EQUAL((++i)->first, "baz");
  }

  TEST("stable_map lookup") {
    CHECK(xs.find("qux") == xs.end());
    CHECK(xs.find("bar") != xs.end());
    CHECK(xs.contains("baz"));
    CHECK_EQUAL(xs.count("foo"), 1u);
    CHECK_EQUAL(xs.at("bar"), 2);
  }

  TEST("stable_map insert does not overwrite") {
    auto [i, inserted] = xs.insert({"foo", 42});
    CHECK(not inserted);
    CHECK_EQUAL(i->second, 1);
    CHECK_EQUAL(xs.size(), 3u);
    auto [j, emplaced] = xs.emplace("qux", 4);
    CHECK(emplaced);
    CHECK_EQUAL(j->second, 4);
    CHECK_EQUAL(xs.rbegin()->first, "qux");
  }

  TEST("stable_map erase") {
    CHECK_EQUAL(xs.erase("nope"), 0u);
    CHECK_EQUAL(xs.erase("bar"), 1u);
    REQUIRE_EQUAL(xs.size(), 2u);
    CHECK_EQUAL(xs.begin()->first, "foo");
    CHECK_EQUAL(xs.rbegin()->first, "baz");
  }

  TEST("stable_map equality respects order") {
    auto ys = detail::stable_map<std::string, int>{
      {"foo", 1},
      {"bar", 2},
      {"baz", 3},
    };
    CHECK(xs == ys);
    auto zs = detail::stable_map<std::string, int>{
      {"bar", 2},
      {"foo", 1},
      {"baz", 3},
    };
    CHECK(not(xs == zs));
  }
}
