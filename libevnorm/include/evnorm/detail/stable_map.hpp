//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

namespace evnorm::detail {

/// An associative container that keeps its elements in insertion order.
/// Lookup is linear, which beats node-based maps for the small attribute
/// sets that a single event carries.
template <class Key, class T>
class stable_map {
public:
  using key_type = Key;
  using mapped_type = T;
  using value_type = std::pair<Key, T>;
  using vector_type = std::vector<value_type>;
  using size_type = typename vector_type::size_type;
  using iterator = typename vector_type::iterator;
  using const_iterator = typename vector_type::const_iterator;
  using reverse_iterator = typename vector_type::reverse_iterator;
  using const_reverse_iterator = typename vector_type::const_reverse_iterator;

  stable_map() = default;

  stable_map(std::initializer_list<value_type> xs) {
    reserve(xs.size());
    for (const auto& x : xs) {
      insert(x);
    }
  }

  // -- iterators -------------------------------------------------------------

  auto begin() noexcept -> iterator {
    return xs_.begin();
  }

  auto begin() const noexcept -> const_iterator {
    return xs_.begin();
  }

  auto end() noexcept -> iterator {
    return xs_.end();
  }

  auto end() const noexcept -> const_iterator {
    return xs_.end();
  }

  auto rbegin() noexcept -> reverse_iterator {
    return xs_.rbegin();
  }

  auto rbegin() const noexcept -> const_reverse_iterator {
    return xs_.rbegin();
  }

  auto rend() noexcept -> reverse_iterator {
    return xs_.rend();
  }

  auto rend() const noexcept -> const_reverse_iterator {
    return xs_.rend();
  }

  // -- capacity --------------------------------------------------------------

  [[nodiscard]] auto empty() const noexcept -> bool {
    return xs_.empty();
  }

  auto size() const noexcept -> size_type {
    return xs_.size();
  }

  void reserve(size_type n) {
    xs_.reserve(n);
  }

  // -- modifiers -------------------------------------------------------------

  void clear() noexcept {
    xs_.clear();
  }

  /// Inserts an element unless the key exists already.
  /// @returns An iterator to the element with the key, and whether the
  /// insertion took place.
  auto insert(value_type x) -> std::pair<iterator, bool> {
    if (auto i = find(x.first); i != end()) {
      return {i, false};
    }
    xs_.push_back(std::move(x));
    return {std::prev(xs_.end()), true};
  }

  template <class K, class... Ts>
  auto emplace(K&& key, Ts&&... xs) -> std::pair<iterator, bool> {
    return insert(
      value_type{Key(std::forward<K>(key)), T(std::forward<Ts>(xs)...)});
  }

  auto erase(iterator i) -> iterator {
    return xs_.erase(i);
  }

  auto erase(const_iterator i) -> iterator {
    return xs_.erase(i);
  }

  template <class K>
  auto erase(const K& key) -> size_type {
    auto i = find(key);
    if (i == end()) {
      return 0;
    }
    xs_.erase(i);
    return 1;
  }

  // -- lookup ----------------------------------------------------------------

  template <class K>
  auto find(const K& key) -> iterator {
    return std::find_if(xs_.begin(), xs_.end(), [&](const value_type& x) {
      return x.first == key;
    });
  }

  template <class K>
  auto find(const K& key) const -> const_iterator {
    return std::find_if(xs_.begin(), xs_.end(), [&](const value_type& x) {
      return x.first == key;
    });
  }

  template <class K>
  auto contains(const K& key) const -> bool {
    return find(key) != end();
  }

  template <class K>
  auto count(const K& key) const -> size_type {
    return contains(key) ? 1 : 0;
  }

  template <class K>
  auto at(const K& key) -> T& {
    if (auto i = find(key); i != end()) {
      return i->second;
    }
    throw std::out_of_range{"evnorm::detail::stable_map::at out of range"};
  }

  template <class K>
  auto at(const K& key) const -> const T& {
    if (auto i = find(key); i != end()) {
      return i->second;
    }
    throw std::out_of_range{"evnorm::detail::stable_map::at out of range"};
  }

  auto operator[](const Key& key) -> T& {
    if (auto i = find(key); i != end()) {
      return i->second;
    }
    xs_.emplace_back(key, T{});
    return xs_.back().second;
  }

  // -- comparison ------------------------------------------------------------

  friend auto operator==(const stable_map& x, const stable_map& y) -> bool {
    return x.xs_ == y.xs_;
  }

  /// Grants access to the underlying storage.
  friend auto as_vector(const stable_map& x) -> const vector_type& {
    return x.xs_;
  }

private:
  vector_type xs_;
};

} // namespace evnorm::detail
