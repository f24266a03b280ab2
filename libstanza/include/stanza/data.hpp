//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/aliases.hpp"
#include "stanza/detail/assert.hpp"
#include "stanza/error.hpp"
#include "stanza/variant.hpp"

#include <caf/expected.hpp>
#include <caf/none.hpp>
#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace stanza {

namespace detail {

struct invalid_data_type {};

template <class T>
constexpr auto to_data_type() {
  if constexpr (std::is_floating_point_v<T>) {
    return double{};
  } else if constexpr (std::is_same_v<T, bool>) {
    return bool{};
  } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
    return uint64_t{};
  } else if constexpr (std::is_integral_v<T>) {
    return int64_t{};
  } else if constexpr (std::is_convertible_v<T, std::string>
                       || std::is_same_v<T, std::string_view>) {
    return std::string{};
  } else if constexpr (std::is_same_v<T, caf::none_t>
                       || std::is_same_v<T, list>
                       || std::is_same_v<T, record>) {
    return T{};
  } else {
    return invalid_data_type{};
  }
}

} // namespace detail

/// Converts a C++ type to the corresponding data type.
/// @relates data
template <class T>
using to_data_type = decltype(detail::to_data_type<std::decay_t<T>>());

/// A type-erased representation of the values that can appear inside the
/// structured parts of a telemetry entry. This is a closed sum type: null,
/// booleans, signed and unsigned integers, reals, strings, lists, and records.
class data {
public:
  /// The sum type of all possible alternatives.
  using variant = std::variant<caf::none_t, bool, int64_t, uint64_t, double,
                               std::string, list, record>;

  /// Default-constructs null data.
  data() = default;

  data(const data&) = default;
  data& operator=(const data&) = default;
  data(data&&) noexcept = default;
  data& operator=(data&&) noexcept = default;
  ~data() noexcept = default;

  /// Constructs data.
  /// @param x The instance to construct data from.
  template <class T>
    requires(!std::same_as<to_data_type<T>, detail::invalid_data_type>)
  data(T&& x) : data_{to_data_type<T>(std::forward<T>(x))} {
    // nop
  }

  friend bool operator==(const data& lhs, const data& rhs);

  friend bool operator!=(const data& lhs, const data& rhs) {
    return !(lhs == rhs);
  }

  /// @cond PRIVATE

  [[nodiscard]] variant& get_data() {
    return data_;
  }

  [[nodiscard]] const variant& get_data() const {
    return data_;
  }

  /// @endcond

private:
  variant data_;
};

// -- helpers -----------------------------------------------------------------

/// @returns `true` if *x* is null.
/// @relates data
inline auto is_null(const data& x) -> bool {
  return is<caf::none_t>(x);
}

/// @returns `true` if *x* is a *container* data, i.e., a list or a record.
/// @relates data
auto is_container(const data& x) -> bool;

/// @returns A human-readable name of the alternative that *x* holds.
/// @relates data
auto type_name(const data& x) -> std::string_view;

/// Tries to find the entry with the dot-separated `path`. If one of the
/// parents is not a record, but it does exist, an error is returned. Otherwise,
/// returns `nullptr` if the path does not resolve.
/// @pre `!path.empty()`
auto descend(const record* r, std::string_view path)
  -> caf::expected<const data*>;

/// Tries to find the entry with the dot-separated `path` with the given type.
/// Does not attempt to perform any conversions. Returns `nullptr` if the path
/// does not exist or the entry has a different type.
/// @pre `!path.empty()`
template <class T>
auto get_if(const record* r, std::string_view path) -> const T* {
  auto result = descend(r, path);
  if (not result || not *result) {
    return nullptr;
  }
  return try_as<T>(*result);
}

/// Finds the entry with the dot-separated `path` or returns the `fallback`
/// value.
/// @pre `!path.empty()`
inline auto get_or(const record& r, std::string_view path,
                   std::string_view fallback) -> std::string_view {
  if (const auto* result = get_if<std::string>(&r, path)) {
    return *result;
  }
  return fallback;
}

/// Prints data in its JSON representation. Records print their keys in
/// insertion order. Non-finite reals print as `null`.
/// @relates data
auto to_string(const data& x) -> std::string;

// -- JSON -------------------------------------------------------------

/// Parses JSON into data.
/// @param x The string containing the JSON content.
/// @returns The parsed JSON as data, or an error.
auto from_json(std::string_view x) -> caf::expected<data>;

/// Prints data as JSON.
/// @param x The data instance.
/// @returns The JSON representation of *x*.
auto to_json(const data& x) -> std::string;

// -- YAML -------------------------------------------------------------

/// Parses YAML into data.
/// @param str The string containing the YAML content
/// @returns The parsed YAML as data, or an error.
auto from_yaml(std::string_view str) -> caf::expected<data>;

/// Loads YAML from a file.
/// @param file The file to load.
/// @returns The parsed YAML or an error.
auto load_yaml(const std::filesystem::path& file) -> caf::expected<data>;

/// Prints data as YAML.
/// @param x The data instance.
/// @returns The YAML representation of *x*, or an error.
auto to_yaml(const data& x) -> caf::expected<std::string>;

} // namespace stanza

namespace fmt {

template <>
struct formatter<stanza::data> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const stanza::data& value, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", stanza::to_string(value));
  }
};

} // namespace fmt
