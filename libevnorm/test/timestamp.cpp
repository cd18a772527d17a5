//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/timestamp.hpp"

#include "evnorm/test/test.hpp"

#include <chrono>

using namespace evnorm;
using namespace std::chrono;

namespace {

auto at(int64_t secs) -> evnorm::time {
  return evnorm::time{seconds{secs}};
}

} // namespace

TEST("parse rfc3339") {
  CHECK_EQUAL(parse_rfc3339("2023-05-09T02:33:52Z"), at(1683599632));
  CHECK_EQUAL(parse_rfc3339("2023-05-09T02:33:52.123Z"),
              evnorm::time{milliseconds{1683599632123}});
  CHECK_EQUAL(parse_rfc3339("2023-05-09T04:33:52+02:00"), at(1683599632));
  CHECK_EQUAL(parse_rfc3339("2023-05-08T21:33:52-05:00"), at(1683599632));
  CHECK_EQUAL(parse_rfc3339("2003-10-11T22:14:15.003Z"),
              evnorm::time{milliseconds{1065910455003}});
  CHECK_EQUAL(parse_rfc3339("2023-05-09T02:33:52.123456789Z"),
              evnorm::time{nanoseconds{1683599632123456789}});
}

TEST("parse rfc3339 rejects incomplete timestamps") {
  CHECK(not parse_rfc3339("2023-05-09T02:33:52"));
  CHECK(not parse_rfc3339("2023-05-09 02:33:52Z"));
  CHECK(not parse_rfc3339("2023-05-09T02:33:52.Z"));
  CHECK(not parse_rfc3339("2023-05-09T02:33:52.1234567890Z"));
  CHECK(not parse_rfc3339("2023-02-30T02:33:52Z"));
  CHECK(not parse_rfc3339("2023-05-09T02:33:52Zjunk"));
  CHECK(not parse_rfc3339("-"));
  CHECK(not parse_rfc3339(""));
}

TEST("parse epoch") {
  CHECK_EQUAL(parse_epoch("1683599632"), at(1683599632));
  CHECK_EQUAL(parse_epoch("1683599632123"),
              evnorm::time{milliseconds{1683599632123}});
  CHECK_EQUAL(parse_epoch("1683599632123456"),
              evnorm::time{microseconds{1683599632123456}});
  CHECK_EQUAL(parse_epoch("1683599632123456789"),
              evnorm::time{nanoseconds{1683599632123456789}});
  CHECK(not parse_epoch(""));
  CHECK(not parse_epoch("-1"));
  CHECK(not parse_epoch("12ab"));
}

TEST("parse month") {
  CHECK_EQUAL(parse_month("Jan"), 1u);
  CHECK_EQUAL(parse_month("Dec"), 12u);
  CHECK(not parse_month("jan"));
  CHECK(not parse_month("Foo"));
}

TEST("resolve bsd timestamp with year") {
  auto ts = bsd_timestamp{
    .year = 2023,
    .month = 10,
    .day = 11,
    .hour = 22,
    .minute = 14,
    .second = 15,
  };
  CHECK_EQUAL(resolve(ts, std::nullopt, minutes{0}), at(1697062455));
  CHECK_EQUAL(resolve(ts, std::nullopt, minutes{120}),
              at(1697062455) - hours{2});
}

TEST("resolve bsd timestamp against reference") {
  auto ts = bsd_timestamp{
    .year = std::nullopt,
    .month = 10,
    .day = 11,
    .hour = 22,
    .minute = 14,
    .second = 15,
  };
  CHECK(not resolve(ts, std::nullopt, minutes{0}));
  // Reference in the same year.
  CHECK_EQUAL(resolve(ts, at(1697062455) + hours{1}, minutes{0}),
              at(1697062455));
  // A December message received on New Year's Day belongs to the old year.
  auto december = bsd_timestamp{
    .year = std::nullopt,
    .month = 12,
    .day = 31,
    .hour = 23,
    .minute = 59,
    .second = 0,
  };
  CHECK_EQUAL(resolve(december, at(1704067500), minutes{0}), at(1704067140));
  // An invalid date does not resolve.
  auto invalid = december;
  invalid.month = 2;
  invalid.day = 30;
  CHECK(not resolve(invalid, at(1704067500), minutes{0}));
}

TEST("render time") {
  CHECK_EQUAL(to_string(at(1683599632)), "2023-05-09T02:33:52Z");
  CHECK_EQUAL(to_string(evnorm::time{milliseconds{1683599632123}}),
              "2023-05-09T02:33:52.123Z");
}
