//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/defaults.hpp"
#include "evnorm/detail/string.hpp"
#include "evnorm/error.hpp"
#include "evnorm/logger.hpp"
#include "evnorm/syslog.hpp"
#include "evnorm/timestamp.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>

namespace evnorm {

namespace {

constexpr auto nil = std::string_view{"-"};
constexpr auto bom = std::string_view{"\xEF\xBB\xBF"};

/// Walks over a raw message while keeping track of the absolute offset, so
/// that diagnostics can point into the original text.
class cursor {
public:
  explicit cursor(std::string_view text) : text_{text} {
    // nop
  }

  auto at_end() const -> bool {
    return pos_ == text_.size();
  }

  auto position() const -> size_t {
    return pos_;
  }

  auto peek() const -> char {
    return text_[pos_];
  }

  auto rest() const -> std::string_view {
    return text_.substr(pos_);
  }

  auto consume(char c) -> bool {
    if (at_end() or text_[pos_] != c) {
      return false;
    }
    ++pos_;
    return true;
  }

  /// Reads everything up to the next space or the end of input.
  auto token() -> std::string_view {
    const auto end = std::min(text_.find(' ', pos_), text_.size());
    const auto result = text_.substr(pos_, end - pos_);
    pos_ = end;
    return result;
  }

  void advance(size_t n) {
    pos_ += n;
  }

private:
  std::string_view text_;
  size_t pos_ = 0;
};

auto is_printable(std::string_view str) -> bool {
  for (auto c : str) {
    if (not detail::is_print_ascii(c)) {
      return false;
    }
  }
  return true;
}

/// Validates the syntax of an SD-NAME, i.e., an SD-ID or a PARAM-NAME.
auto is_sd_name(std::string_view str) -> bool {
  if (str.empty() or str.size() > defaults::syslog::max_sd_name_length) {
    return false;
  }
  for (auto c : str) {
    if (not detail::is_print_ascii(c) or c == '=' or c == ']' or c == '"') {
      return false;
    }
  }
  return true;
}

/// Reads one of the header fields that may be NILVALUE.
auto header_field(cursor& in, std::string_view name, size_t max_length)
  -> caf::expected<std::optional<std::string>> {
  const auto begin = in.position();
  const auto value = in.token();
  if (value.empty()) {
    return caf::make_error(ec::parse_error,
                           fmt::format("rfc5424: missing {} at offset {}",
                                       name, begin));
  }
  if (value.size() > max_length) {
    return caf::make_error(
      ec::parse_error, fmt::format("rfc5424: {} exceeds {} characters", name,
                                   max_length));
  }
  if (not is_printable(value)) {
    return caf::make_error(
      ec::parse_error,
      fmt::format("rfc5424: {} contains non-printable characters", name));
  }
  if (value == nil) {
    return std::optional<std::string>{};
  }
  return std::optional<std::string>{std::string{value}};
}

/// Parses the content of an SD-ELEMENT without the enclosing brackets.
/// @returns The element, or `std::nullopt` if the content is malformed.
auto parse_sd_element(std::string_view content)
  -> std::optional<structured_data_element> {
  auto result = structured_data_element{};
  auto pos = std::min(content.find(' '), content.size());
  const auto id = content.substr(0, pos);
  if (not is_sd_name(id)) {
    return std::nullopt;
  }
  result.id = std::string{id};
  while (pos < content.size()) {
    // Each SD-PARAM is preceded by a space.
    if (content[pos] != ' ') {
      return std::nullopt;
    }
    while (pos < content.size() and content[pos] == ' ') {
      ++pos;
    }
    if (pos == content.size()) {
      break;
    }
    const auto eq = content.find('=', pos);
    if (eq == std::string_view::npos) {
      return std::nullopt;
    }
    const auto name = content.substr(pos, eq - pos);
    if (not is_sd_name(name) or name.find(' ') != std::string_view::npos) {
      return std::nullopt;
    }
    if (eq + 1 >= content.size() or content[eq + 1] != '"') {
      return std::nullopt;
    }
    const auto value_begin = eq + 2;
    const auto quote = detail::find_unescaped(content, '"', value_begin);
    if (quote == std::string_view::npos) {
      return std::nullopt;
    }
    result.params.emplace_back(
      std::string{name},
      unescape_param_value(content.substr(value_begin, quote - value_begin)));
    pos = quote + 1;
  }
  return result;
}

/// Parses STRUCTURED-DATA that starts with `[`. Malformed elements are
/// dropped with a warning.
auto parse_structured_data(cursor& in, event& x) -> caf::error {
  while (not in.at_end() and in.peek() == '[') {
    const auto rest = in.rest();
    const auto close = detail::find_unescaped(rest, ']', 1);
    if (close == std::string_view::npos) {
      return caf::make_error(
        ec::parse_error,
        fmt::format("rfc5424: unterminated structured data at offset {}",
                    in.position()));
    }
    const auto source = location{in.position(), in.position() + close + 1};
    if (auto element = parse_sd_element(rest.substr(1, close - 1))) {
      x.structured_data.push_back(std::move(*element));
    } else {
      EVNORM_DEBUG("dropping malformed structured data element at {}..{}",
                   source.begin, source.end);
      diagnostic::warning("dropped malformed structured data element")
        .primary(source)
        .hint("parameter values must be enclosed in double quotes")
        .emit(x.diagnostics);
    }
    in.advance(close + 1);
  }
  return {};
}

} // namespace

auto parse_rfc5424(std::string_view text, const syslog_options& opts)
  -> caf::expected<event> {
  auto result = event{};
  result.kind = record_kind::rfc5424;
  auto str = text;
  auto prival = detail::consume_pri(str);
  if (not prival) {
    return caf::make_error(ec::parse_error, "rfc5424: missing PRI");
  }
  detail::apply_priority(result, *prival,
                         location{0, text.size() - str.size()});
  auto in = cursor{text};
  in.advance(text.size() - str.size());
  // VERSION
  const auto version = in.token();
  if (version.empty() or version.size() > 3
      or version.find_first_not_of("0123456789") != std::string_view::npos) {
    return caf::make_error(ec::parse_error, "rfc5424: missing VERSION");
  }
  if (version != "1") {
    return caf::make_error(ec::version_error,
                           fmt::format("rfc5424: unsupported VERSION {}",
                                       version));
  }
  result.version = uint16_t{1};
  if (not in.consume(' ')) {
    return caf::make_error(ec::parse_error,
                           "rfc5424: header ends after VERSION");
  }
  // TIMESTAMP
  const auto ts_begin = in.position();
  const auto ts = in.token();
  if (ts.empty()) {
    return caf::make_error(ec::parse_error, "rfc5424: missing TIMESTAMP");
  }
  if (ts != nil) {
    result.timestamp = parse_rfc3339(ts);
    if (not result.timestamp) {
      diagnostic::warning("failed to parse timestamp `{}`", ts)
        .primary(location{ts_begin, in.position()})
        .note("expected an RFC 3339 timestamp")
        .emit(result.diagnostics);
    }
  }
  // HOSTNAME APP-NAME PROCID MSGID
  struct field {
    std::string_view name;
    size_t max_length;
    std::optional<std::string>* target;
  };
  const auto fields = std::array{
    field{"HOSTNAME", defaults::syslog::max_hostname_length, &result.hostname},
    field{"APP-NAME", defaults::syslog::max_app_name_length, &result.app_name},
    field{"PROCID", defaults::syslog::max_proc_id_length, &result.proc_id},
    field{"MSGID", defaults::syslog::max_msg_id_length, &result.msg_id},
  };
  for (const auto& f : fields) {
    if (not in.consume(' ')) {
      return caf::make_error(ec::parse_error,
                             fmt::format("rfc5424: header ends before {}",
                                         f.name));
    }
    auto value = header_field(in, f.name, f.max_length);
    if (not value) {
      return std::move(value.error());
    }
    *f.target = std::move(*value);
  }
  if (opts.lowercase_hostname and result.hostname) {
    *result.hostname = detail::to_lower(*result.hostname);
  }
  // A message may end right after MSGID.
  if (in.at_end() or (in.consume(' ') and in.at_end())) {
    return result;
  }
  // STRUCTURED-DATA
  if (in.peek() == '-') {
    in.advance(1);
  } else if (in.peek() == '[') {
    if (auto err = parse_structured_data(in, result)) {
      return err;
    }
  } else {
    return caf::make_error(
      ec::parse_error,
      fmt::format("rfc5424: expected STRUCTURED-DATA at offset {}",
                  in.position()));
  }
  if (in.at_end()) {
    return result;
  }
  if (not in.consume(' ')) {
    return caf::make_error(
      ec::parse_error,
      fmt::format("rfc5424: unexpected character after STRUCTURED-DATA at "
                  "offset {}",
                  in.position()));
  }
  // MSG
  auto msg = in.rest();
  if (msg.starts_with(bom)) {
    msg.remove_prefix(bom.size());
  }
  result.message = std::string{msg};
  return result;
}

} // namespace evnorm
