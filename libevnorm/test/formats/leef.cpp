//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/decoder.hpp"
#include "evnorm/event.hpp"
#include "evnorm/parsing_cache.hpp"
#include "evnorm/plugin.hpp"
#include "evnorm/test/test.hpp"

#include <string>
#include <string_view>

using namespace evnorm;

namespace {

struct fixture {
  fixture() {
    plugin = plugins::find<message_plugin>("leef");
    REQUIRE(plugin != nullptr);
  }

  auto run(std::string_view message) -> bool {
    x = event{};
    x.message = std::string{message};
    auto cache = parsing_cache{};
    return plugin->try_decode(x, cache);
  }

  const message_plugin* plugin = nullptr;
  event x;
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("leef 1.0 with tab-separated attributes") {
    REQUIRE(run("LEEF:1.0|Microsoft|MSExchange|4.0 SP1|15345|src=192.0.2.0\t"
                "dst=172.50.123.1\tsev=5\tcat=anomaly\tmsg=this is a "
                "message"));
    REQUIRE(x.classification);
    CHECK_EQUAL(x.classification->vendor, "microsoft");
    CHECK_EQUAL(x.classification->product, "msexchange");
    CHECK_EQUAL(x.classification->msgclass, "anomaly_15345");
    CHECK_EQUAL(x.event_data.at("leef_version"), data{"1.0"});
    CHECK_EQUAL(x.event_data.at("vendor"), data{"Microsoft"});
    CHECK_EQUAL(x.event_data.at("product_name"), data{"MSExchange"});
    CHECK_EQUAL(x.event_data.at("product_version"), data{"4.0 SP1"});
    CHECK_EQUAL(x.event_data.at("event_id"), data{"15345"});
    CHECK_EQUAL(x.event_data.at("src"), data{"192.0.2.0"});
    CHECK_EQUAL(x.event_data.at("sev"), data{"5"});
    CHECK_EQUAL(x.event_data.at("msg"), data{"this is a message"});
    CHECK_EQUAL(x.event_data.size(), 10u);
  }

  TEST("leef 1.0 with space-separated attributes") {
    REQUIRE(run("LEEF:1.0|Vendor|Product|1|Login|usrName=bob src=10.0.0.1 "
                "msg=user logged in"));
    CHECK_EQUAL(x.classification->msgclass, "login");
    CHECK_EQUAL(x.event_data.at("usrName"), data{"bob"});
    CHECK_EQUAL(x.event_data.at("msg"), data{"user logged in"});
  }

  TEST("leef 2.0 with a character delimiter") {
    REQUIRE(run("LEEF:2.0|Lancope|StealthWatch|1.0|41|^|src=10.0.1.8^"
                "dst=10.0.0.5^sev=5^cat=Exploit^cat=ignored"));
    CHECK_EQUAL(x.event_data.at("leef_version"), data{"2.0"});
    CHECK_EQUAL(x.event_data.at("dst"), data{"10.0.0.5"});
    CHECK_EQUAL(x.classification->msgclass, "exploit_41");
    REQUIRE_EQUAL(x.collisions.size(), 1u);
    CHECK_EQUAL(x.collisions[0].key, "cat");
  }

  TEST("leef 2.0 with a hex delimiter") {
    REQUIRE(run("LEEF:2.0|Vendor|Product|1.0|evt|0x5e|a=1^b=2"));
    CHECK_EQUAL(x.event_data.at("a"), data{"1"});
    CHECK_EQUAL(x.event_data.at("b"), data{"2"});
    REQUIRE(run("LEEF:2.0|Vendor|Product|1.0|evt|x7C|a=1|b=2"));
    CHECK_EQUAL(x.event_data.at("b"), data{"2"});
    REQUIRE(run("LEEF:2.0|Vendor|Product|1.0|evt||a=1\tb=2"));
    CHECK_EQUAL(x.event_data.at("b"), data{"2"});
  }

  TEST("leef escaped attribute values") {
    REQUIRE(run(R"(LEEF:2.0|V|P|1|e|^|msg=a\^b^path=C:\\x^eq=1\=2)"));
    CHECK_EQUAL(x.event_data.at("msg"), data{"a^b"});
    CHECK_EQUAL(x.event_data.at("path"), data{R"(C:\x)"});
    CHECK_EQUAL(x.event_data.at("eq"), data{"1=2"});
  }

  TEST("leef control character escapes") {
    REQUIRE(run(R"(LEEF:2.0|V|P|1|e|^|crlf=a\r\nb^tab=x\ty)"));
    CHECK_EQUAL(x.event_data.at("crlf"), data{"a\r\nb"});
    CHECK_EQUAL(x.event_data.at("tab"), data{"x\ty"});
  }

  TEST("leef header after hostname") {
    REQUIRE(run("host1 LEEF:1.0|Vendor|Product|1|evt|k=v"));
    CHECK_EQUAL(x.event_data.at("k"), data{"v"});
  }

  TEST("leef declines malformed messages") {
    CHECK(not run("no leef here"));
    CHECK(not run("LEEF:3.0|V|P|1|e|k=v"));
    CHECK(not run("LEEF:1.0|V|P"));
    CHECK(not run("LEEF:2.0|V|P|1|e|0xZZ|k=v"));
    CHECK(not run("LEEF:2.0|V|P|1|e|0x123|k=v"));
    CHECK(not run("LEEF:2.0|V|P|1|e|ab|k=v"));
    CHECK(not run("LEEF:2.0|V|P|1|e|^|novalue"));
    CHECK(not x.classification);
  }

  TEST("leef through the decoder") {
    auto dec = decoder{};
    auto y = unbox(dec.decode("<13>1 2023-05-09T02:33:52Z host app - - - "
                              "LEEF:1.0|Vendor|Product|1|evt|a=1\tb=2"));
    CHECK_EQUAL(y.kind, record_kind::rfc5424);
    REQUIRE(y.classification);
    CHECK_EQUAL(y.classification->vendor, "vendor");
    CHECK_EQUAL(y.event_data.at("b"), data{"2"});
    CHECK(y.rejected_classifications.empty());
  }
}
