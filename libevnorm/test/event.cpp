//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/event.hpp"

#include "evnorm/test/test.hpp"

#include <fmt/format.h>

#include <string>

using namespace evnorm;

TEST("record kind refinement") {
  CHECK(satisfies(record_kind::rfc5424, record_kind::rfc5424));
  CHECK(satisfies(record_kind::rfc5424, record_kind::syslog));
  CHECK(satisfies(record_kind::rfc3164, record_kind::envelope));
  CHECK(satisfies(record_kind::syslog, record_kind::envelope));
  CHECK(not satisfies(record_kind::syslog, record_kind::rfc5424));
  CHECK(not satisfies(record_kind::rfc3164, record_kind::rfc5424));
  CHECK(not satisfies(record_kind::envelope, record_kind::syslog));
  CHECK_EQUAL(parent(record_kind::rfc5424), record_kind::syslog);
  CHECK_EQUAL(parent(record_kind::syslog), record_kind::envelope);
  CHECK(not parent(record_kind::envelope));
}

TEST("record kind names") {
  CHECK_EQUAL(to_string(record_kind::envelope), "envelope");
  CHECK_EQUAL(to_string(record_kind::rfc3164), "rfc3164");
  CHECK_EQUAL(fmt::format("{}", record_kind::rfc5424), "rfc5424");
}

TEST("structured data element lookup") {
  auto element = structured_data_element{
    .id = "origin",
    .params = {{"ip", "10.0.0.1"}, {"ip", "10.0.0.2"}, {"software", "x"}},
  };
  CHECK_EQUAL(unbox(element.find("ip")), "10.0.0.1");
  CHECK_EQUAL(unbox(element.find("software")), "x");
  CHECK(element.find("nope") == nullptr);
  CHECK_EQUAL(fmt::format("{}", element),
              R"([origin ip="10.0.0.1" ip="10.0.0.2" software="x"])");
}

TEST("classification identity ignores fields") {
  auto x = structure_classification{"acme", "fw", "traffic", {"a"}};
  auto y = structure_classification{"acme", "fw", "traffic", {"b"}};
  auto z = structure_classification{"acme", "fw", "system", {"a"}};
  CHECK(x.same_class(y));
  CHECK(not x.same_class(z));
  CHECK(x != y);
  CHECK_EQUAL(fmt::format("{}", x), "acme/fw/traffic");
}

TEST("event formatting") {
  auto x = event{};
  x.kind = record_kind::rfc5424;
  x.facility = 4;
  x.severity = 2;
  x.hostname = "host";
  x.message = "hi";
  x.event_data.emplace("k", "v");
  CHECK_EQUAL(fmt::format("{}", x),
              R"(rfc5424{ facility: 4 severity: 2 hostname: host )"
              R"(message: "hi" k="v" })");
}
