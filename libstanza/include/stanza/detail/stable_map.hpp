//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace stanza::detail {

/// An associative container that keeps its entries in insertion order. Keys
/// are unique. Lookup is a linear scan, which is faster than a node-based map
/// for the handful of keys a telemetry record usually carries.
///
/// Two maps compare equal if they hold the same set of key-value pairs,
/// regardless of the order in which the keys were inserted.
template <class Key, class T>
class stable_map {
public:
  // -- types ------------------------------------------------------------------

  using key_type = Key;
  using mapped_type = T;
  using value_type = std::pair<Key, T>;
  using vector_type = std::vector<value_type>;
  using size_type = typename vector_type::size_type;
  using iterator = typename vector_type::iterator;
  using const_iterator = typename vector_type::const_iterator;

  // -- construction -----------------------------------------------------------

  stable_map() = default;

  stable_map(std::initializer_list<value_type> xs) {
    xs_.reserve(xs.size());
    for (const auto& x : xs) {
      insert(x);
    }
  }

  template <class InputIterator>
  stable_map(InputIterator first, InputIterator last) {
    for (; first != last; ++first) {
      insert(*first);
    }
  }

  // -- iterators --------------------------------------------------------------

  auto begin() -> iterator {
    return xs_.begin();
  }

  auto begin() const -> const_iterator {
    return xs_.begin();
  }

  auto end() -> iterator {
    return xs_.end();
  }

  auto end() const -> const_iterator {
    return xs_.end();
  }

  // -- capacity ---------------------------------------------------------------

  [[nodiscard]] auto empty() const noexcept -> bool {
    return xs_.empty();
  }

  auto size() const noexcept -> size_type {
    return xs_.size();
  }

  void reserve(size_type n) {
    xs_.reserve(n);
  }

  // -- lookup -----------------------------------------------------------------

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
    auto i = find(key);
    if (i == end()) {
      throw std::out_of_range{"stanza::detail::stable_map::at out of range"};
    }
    return i->second;
  }

  template <class K>
  auto at(const K& key) const -> const T& {
    auto i = find(key);
    if (i == end()) {
      throw std::out_of_range{"stanza::detail::stable_map::at out of range"};
    }
    return i->second;
  }

  auto operator[](const key_type& key) -> T& {
    return try_emplace(key).first->second;
  }

  auto operator[](key_type&& key) -> T& {
    return try_emplace(std::move(key)).first->second;
  }

  // -- modifiers --------------------------------------------------------------

  void clear() noexcept {
    xs_.clear();
  }

  auto insert(value_type x) -> std::pair<iterator, bool> {
    if (auto i = find(x.first); i != end()) {
      return {i, false};
    }
    xs_.push_back(std::move(x));
    return {std::prev(xs_.end()), true};
  }

  template <class... Ts>
  auto emplace(Ts&&... xs) -> std::pair<iterator, bool> {
    return insert(value_type{std::forward<Ts>(xs)...});
  }

  template <class K, class... Ts>
  auto try_emplace(K&& key, Ts&&... xs) -> std::pair<iterator, bool> {
    if (auto i = find(key); i != end()) {
      return {i, false};
    }
    xs_.emplace_back(std::piecewise_construct,
                     std::forward_as_tuple(std::forward<K>(key)),
                     std::forward_as_tuple(std::forward<Ts>(xs)...));
    return {std::prev(xs_.end()), true};
  }

  template <class K, class U>
  auto insert_or_assign(K&& key, U&& value) -> std::pair<iterator, bool> {
    if (auto i = find(key); i != end()) {
      i->second = std::forward<U>(value);
      return {i, false};
    }
    xs_.emplace_back(std::forward<K>(key), std::forward<U>(value));
    return {std::prev(xs_.end()), true};
  }

  auto erase(const_iterator i) -> iterator {
    return xs_.erase(i);
  }

  auto erase(iterator i) -> iterator {
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

  // -- comparison -------------------------------------------------------------

  friend auto operator==(const stable_map& lhs, const stable_map& rhs) -> bool {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    return std::all_of(lhs.begin(), lhs.end(), [&](const value_type& x) {
      auto i = rhs.find(x.first);
      return i != rhs.end() and i->second == x.second;
    });
  }

  friend auto operator!=(const stable_map& lhs, const stable_map& rhs) -> bool {
    return not(lhs == rhs);
  }

private:
  vector_type xs_ = {};
};

} // namespace stanza::detail
