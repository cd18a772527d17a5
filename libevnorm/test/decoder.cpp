//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/decoder.hpp"

#include "evnorm/error.hpp"
#include "evnorm/field_mapping.hpp"
#include "evnorm/kv.hpp"
#include "evnorm/parsing_cache.hpp"
#include "evnorm/test/test.hpp"

#include <caf/settings.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace evnorm;
using namespace std::chrono;

namespace {

using decode_function = std::function<auto(event&, parsing_cache&)->bool>;

class function_plugin final : public virtual message_plugin {
public:
  function_plugin(std::string name, plugin_stage stage, decode_function fn)
    : name_{std::move(name)}, stage_{stage}, fn_{std::move(fn)} {
    // nop
  }

  auto name() const -> std::string override {
    return name_;
  }

  auto stage() const -> plugin_stage override {
    return stage_;
  }

  auto applies_to() const -> record_kind override {
    return record_kind::envelope;
  }

  auto try_decode(event& x, parsing_cache& cache) const -> bool override {
    return fn_(x, cache);
  }

private:
  std::string name_;
  plugin_stage stage_;
  decode_function fn_;
};

struct fixture {
  fixture() {
    // 2023-10-12T00:00:00Z
    opts.reference_time = evnorm::time{seconds{1697068800}};
  }

  void add(std::string name, plugin_stage stage, decode_function fn) {
    auto err = registry.add(std::make_unique<function_plugin>(
      std::move(name), stage, std::move(fn)));
    REQUIRE_SUCCESS(err);
  }

  /// Adds a plugin that maps all key-value pairs of the message.
  void add_kv_writer(std::string name, plugin_stage stage,
                     std::string msgclass) {
    add(name, stage,
        [this, name, msgclass](event& x, parsing_cache& cache) {
          ++invocations[name];
          const auto& pairs
            = cache.get_or_compute("kv", x.message, [this](auto raw) {
                ++kv_computations;
                return parse_key_value(raw);
              });
          if (pairs.empty()) {
            return false;
          }
          auto fields = record{};
          for (const auto& [key, value] : pairs) {
            fields.emplace(key, value);
          }
          auto err = apply_field_mapping(x, fields, "test", name, msgclass);
          return not err;
        });
  }

  decoder_options opts;
  plugin_registry registry;
  std::map<std::string, int> invocations;
  int kv_computations = 0;
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("decoder runs every stage") {
    add("first", plugin_stage::first_pass, [](event& x, parsing_cache&) {
      x.event_data.emplace("first", true);
      return true;
    });
    add("last", plugin_stage::unprocessed_messages,
        [](event& x, parsing_cache&) {
          x.event_data.emplace("last", true);
          return true;
        });
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>1 - host app - - - hello"));
    CHECK_EQUAL(x.event_data.size(), 2u);
    CHECK_EQUAL(x.event_data.at("first"), data{true});
    CHECK_EQUAL(x.event_data.at("last"), data{true});
  }

  TEST("decoder accumulates results across matching plugins") {
    add_kv_writer("vendor", plugin_stage::first_pass, "traffic");
    add_kv_writer("generic", plugin_stage::unprocessed_structured, "unknown");
    auto dec = decoder{opts, registry};
    auto x
      = unbox(dec.decode("<34>1 - host app - - - action=deny src=1.2.3.4"));
    CHECK_EQUAL(invocations["vendor"], 1);
    CHECK_EQUAL(invocations["generic"], 1);
    CHECK_EQUAL(kv_computations, 1);
    REQUIRE(x.classification);
    CHECK_EQUAL(x.classification->product, "vendor");
    CHECK_EQUAL(x.event_data.at("action"), data{"deny"});
    CHECK_EQUAL(x.collisions.size(), 2u);
    REQUIRE_EQUAL(x.rejected_classifications.size(), 1u);
    CHECK_EQUAL(x.rejected_classifications[0].product, "generic");
  }

  TEST("decoder continues after a non-matching plugin") {
    add("decline", plugin_stage::first_pass, [](event&, parsing_cache&) {
      return false;
    });
    add_kv_writer("generic", plugin_stage::second_pass, "unknown");
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>1 - host app - - - a=1"));
    REQUIRE(x.classification);
    CHECK_EQUAL(x.classification->product, "generic");
  }

  TEST("decoder isolates throwing plugins") {
    add("boom", plugin_stage::first_pass, [](event&, parsing_cache&) -> bool {
      throw std::runtime_error{"boom"};
    });
    add_kv_writer("generic", plugin_stage::first_pass, "unknown");
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>1 - host app - - - a=1"));
    CHECK_EQUAL(invocations["generic"], 1);
    CHECK_EQUAL(x.event_data.at("a"), data{"1"});
    REQUIRE_EQUAL(x.diagnostics.size(), 1u);
    CHECK_EQUAL(x.diagnostics[0].severity, severity::warning);
  }

  TEST("decoder discards writes of a throwing plugin") {
    add("partial", plugin_stage::first_pass,
        [](event& x, parsing_cache&) -> bool {
          auto fields = record{};
          fields.emplace("a", "partial");
          auto err = apply_field_mapping(x, fields, "test", "partial", "x");
          REQUIRE_SUCCESS(err);
          throw std::runtime_error{"failed after writing"};
        });
    add_kv_writer("generic", plugin_stage::second_pass, "unknown");
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>1 - host app - - - a=1"));
    REQUIRE(x.classification);
    CHECK_EQUAL(x.classification->product, "generic");
    CHECK_EQUAL(x.event_data.at("a"), data{"1"});
    CHECK(x.collisions.empty());
    CHECK(x.rejected_classifications.empty());
    REQUIRE_EQUAL(x.diagnostics.size(), 1u);
    CHECK_EQUAL(x.diagnostics[0].severity, severity::warning);
  }

  TEST("decoder isolates plugins throwing diagnostics") {
    add("diag", plugin_stage::second_pass, [](event&, parsing_cache&) -> bool {
      diagnostic::error("bad input").throw_();
    });
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("hello"));
    REQUIRE_EQUAL(x.diagnostics.size(), 1u);
    CHECK_EQUAL(x.diagnostics[0].severity, severity::warning);
  }

  TEST("decoder skips plugins for empty messages") {
    add_kv_writer("generic", plugin_stage::first_pass, "unknown");
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>1 - host app - - -"));
    CHECK_EQUAL(invocations["generic"], 0);
    CHECK(not x.classification);
  }

  TEST("decoder is idempotent") {
    add_kv_writer("vendor", plugin_stage::first_pass, "traffic");
    add_kv_writer("generic", plugin_stage::unprocessed_structured, "unknown");
    auto dec = decoder{opts, registry};
    const auto raw = "<34>Oct 11 22:14:15 host app[7]: a=1 b=\"two words\"";
    auto x = unbox(dec.decode(raw));
    auto y = unbox(dec.decode(raw));
    CHECK(x == y);
    CHECK_EQUAL(kv_computations, 2);
  }

  TEST("decoder end to end with rfc5424") {
    add_kv_writer("generic", plugin_stage::unprocessed_structured, "unknown");
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>1 2023-05-09T02:33:52.123Z myhostname app "
                              "1234 ID47 [exampleSDID@32473 iut=\"3\"] "
                              "user=alice action=login"));
    CHECK_EQUAL(x.kind, record_kind::rfc5424);
    CHECK_EQUAL(x.timestamp, evnorm::time{milliseconds{1683599632123}});
    CHECK_EQUAL(x.hostname, "myhostname");
    CHECK_EQUAL(x.structured_data.size(), 1u);
    CHECK_EQUAL(x.message, "user=alice action=login");
    CHECK_EQUAL(x.event_data.at("user"), data{"alice"});
    CHECK_EQUAL(x.event_data.at("action"), data{"login"});
  }

  TEST("decoder with rfc3164 syntax accepts bare text") {
    opts.syntax = syntax::rfc3164;
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("no header at all"));
    CHECK_EQUAL(x.kind, record_kind::rfc3164);
    CHECK(not x.facility);
    CHECK(not x.timestamp);
    CHECK_EQUAL(x.message, "no header at all");
  }

  TEST("decoder with explicit syntax reports rejections") {
    opts.syntax = syntax::rfc5424;
    auto dec = decoder{opts, registry};
    auto x = dec.decode("<34>Oct 11 22:14:15 host app: msg");
    REQUIRE(not x);
    CHECK_EQUAL(x.error(), ec::parse_error);
  }

  TEST("decoder falls back to weaker grammars") {
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>Oct 11 22:14:15 host app: msg"));
    CHECK_EQUAL(x.kind, record_kind::rfc3164);
    CHECK_EQUAL(x.app_name, "app");
    auto y = unbox(dec.decode(""));
    CHECK_EQUAL(y.kind, record_kind::envelope);
    CHECK(y.message.empty());
  }

  TEST("decoder envelope syntax") {
    opts.syntax = syntax::envelope;
    auto dec = decoder{opts, registry};
    auto x = unbox(dec.decode("<34>1 - host app - - - hi"));
    CHECK_EQUAL(x.kind, record_kind::envelope);
    CHECK_EQUAL(x.message, "<34>1 - host app - - - hi");
    CHECK(not x.hostname);
  }

  TEST("decoder freezes its registry") {
    auto dec = decoder{opts, registry};
    CHECK(registry.frozen());
    CHECK(dec.options().syntax == syntax::automatic);
  }
}

TEST("decoder syntax names") {
  CHECK_EQUAL(to_string(syntax::rfc5424), "rfc5424");
  CHECK(parse_syntax("envelope") == syntax::envelope);
  CHECK(parse_syntax("automatic") == syntax::automatic);
  CHECK(not parse_syntax("json"));
}

TEST("decoder options from settings") {
  auto cfg = caf::settings{};
  caf::put(cfg, "evnorm.decoder.syntax", "rfc3164");
  caf::put(cfg, "evnorm.decoder.lowercase-hostname", true);
  caf::put(cfg, "evnorm.decoder.utc-offset", int64_t{-90});
  auto opts = unbox(decoder_options::from_settings(cfg));
  CHECK(opts.syntax == syntax::rfc3164);
  CHECK(opts.lowercase_hostname);
  CHECK(opts.utc_offset == minutes{-90});
  CHECK(not opts.reference_time);
  auto defaults = unbox(decoder_options::from_settings({}));
  CHECK(defaults.syntax == syntax::automatic);
  CHECK(not defaults.lowercase_hostname);
}

TEST("decoder options reject invalid settings") {
  auto bad_syntax = caf::settings{};
  caf::put(bad_syntax, "evnorm.decoder.syntax", "json");
  CHECK_EQUAL(decoder_options::from_settings(bad_syntax).error(),
              ec::invalid_configuration);
  auto bad_offset = caf::settings{};
  caf::put(bad_offset, "evnorm.decoder.utc-offset", int64_t{5000});
  CHECK_EQUAL(decoder_options::from_settings(bad_offset).error(),
              ec::invalid_configuration);
  auto bad_flag = caf::settings{};
  caf::put(bad_flag, "evnorm.decoder.lowercase-hostname", "yes");
  CHECK_EQUAL(decoder_options::from_settings(bad_flag).error(),
              ec::invalid_configuration);
}
