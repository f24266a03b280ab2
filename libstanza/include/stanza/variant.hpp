//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/detail/assert.hpp"
#include "stanza/detail/overload.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace stanza {

namespace detail {

/// Types that wrap a `std::variant` and expose it via `get_data()`.
template <class T>
concept has_get_data = requires(T& x) { x.get_data(); };

template <class V>
auto underlying_variant(V& v) -> decltype(auto) {
  if constexpr (has_get_data<V>) {
    return (v.get_data());
  } else {
    return (v);
  }
}

} // namespace detail

/// Checks whether the variant currently holds alternative `T`.
template <class T, class V>
auto is(const V& v) -> bool {
  return std::holds_alternative<T>(detail::underlying_variant(v));
}

/// Tries to extract a `T` from the variant, returning `nullptr` otherwise.
template <class T, class V>
auto try_as(V* v) -> T* {
  if (not v) {
    return nullptr;
  }
  return std::get_if<T>(&detail::underlying_variant(*v));
}

template <class T, class V>
auto try_as(const V* v) -> const T* {
  if (not v) {
    return nullptr;
  }
  return std::get_if<T>(&detail::underlying_variant(*v));
}

template <class T, class V>
auto try_as(V& v) -> T* {
  return try_as<T>(&v);
}

template <class T, class V>
auto try_as(const V& v) -> const T* {
  return try_as<T>(&v);
}

/// Extracts a `T` from the given variant, asserting success.
template <class T, class V>
auto as(V& v) -> T& {
  auto* result = try_as<T>(&v);
  STANZA_ASSERT(result, "invalid variant access: requested alternative is not "
                        "active");
  return *result;
}

template <class T, class V>
auto as(const V& v) -> const T& {
  auto* result = try_as<T>(&v);
  STANZA_ASSERT(result, "invalid variant access: requested alternative is not "
                        "active");
  return *result;
}

/// Calls one of the given functions with the current variant alternative.
template <class V, class... Fs>
auto match(V&& v, Fs&&... fs) -> decltype(auto) {
  return std::visit(detail::overload{std::forward<Fs>(fs)...},
                    detail::underlying_variant(v));
}

} // namespace stanza
