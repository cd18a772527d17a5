//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/diagnostics.hpp"

#include <any>
#include <concepts>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace evnorm {

/// Memoizes the results of parsers for the message that is currently being
/// decoded, so that every parser runs at most once per message no matter how
/// many plugins ask for its result.
///
/// A cache belongs to exactly one decode call. Keys are not derived from the
/// message content, hence sharing a cache between messages yields stale
/// results.
class parsing_cache {
public:
  parsing_cache() = default;
  parsing_cache(const parsing_cache&) = delete;
  auto operator=(const parsing_cache&) -> parsing_cache& = delete;
  parsing_cache(parsing_cache&&) = default;
  auto operator=(parsing_cache&&) -> parsing_cache& = default;
  ~parsing_cache() = default;

  /// Returns the result of the parser identified by `key`, computing it on
  /// first access.
  /// @param key The identity of the parser, e.g., `"kv"`.
  /// @param raw The text that `fn` parses.
  /// @param fn The parser to invoke if there is no result for `key` yet. If
  /// it throws, the cache remains unchanged. Its result type must be copy
  /// constructible, because results live in a `std::any`.
  /// @returns A reference to the stored result, which stays valid for the
  /// lifetime of the cache.
  /// @throws diagnostic if `key` holds a result of a different type.
  template <class F>
    requires std::invocable<F, std::string_view>
  auto get_or_compute(std::string_view key, std::string_view raw, F&& fn)
    -> const std::decay_t<std::invoke_result_t<F, std::string_view>>& {
    using result_type = std::decay_t<std::invoke_result_t<F, std::string_view>>;
    static_assert(std::is_copy_constructible_v<result_type>,
                  "parsing_cache requires copy constructible results");
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      auto value = std::invoke(std::forward<F>(fn), raw);
      it = entries_.emplace(std::string{key}, std::move(value)).first;
    }
    const auto* result = std::any_cast<result_type>(&it->second);
    if (not result) {
      diagnostic::error("parsing cache entry `{}` holds a `{}`", key,
                        it->second.type().name())
        .note("requested a `{}`", typeid(result_type).name())
        .throw_();
    }
    return *result;
  }

  /// Checks whether a result for `key` exists.
  auto contains(std::string_view key) const -> bool {
    return entries_.find(key) != entries_.end();
  }

  /// @returns The number of stored results.
  auto size() const -> size_t {
    return entries_.size();
  }

  /// Discards all stored results.
  void clear() {
    entries_.clear();
  }

private:
  std::map<std::string, std::any, std::less<>> entries_;
};

} // namespace evnorm
