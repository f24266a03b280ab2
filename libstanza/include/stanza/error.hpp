//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/fwd.hpp"

#include "stanza/detail/assert.hpp"

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace stanza {

/// Stanza's error codes.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// Requested file does not exist.
  no_such_file,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// Expected a different type.
  type_clash,
  /// Failure during parsing.
  parse_error,
  /// Failure during printing.
  print_error,
  /// A field path does not adhere to the expected syntax.
  syntax_error,
  /// A dictionary or table lookup failed to return a value.
  lookup_error,
  /// A component failed because its configuration was invalid.
  invalid_configuration,
  /// A recursive function has reached its maximum call depth.
  recursion_limit_reached,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// @relates ec
auto from_string(std::string_view str, ec& x) -> bool;

/// @relates ec
auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

template <class Inspector>
auto inspect(Inspector& f, ec& x) {
  return caf::default_enum_inspect(f, x);
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

/// Appends a formatted note to the context of an error. Returns the error
/// unchanged if it does not hold an error.
template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

inline void check(const caf::error& err, std::source_location location
                                         = std::source_location::current()) {
  if (err) [[unlikely]] {
    detail::panic_impl(render(err), location);
  }
}

template <class T>
[[nodiscard]] auto
check(caf::expected<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  if (not result) [[unlikely]] {
    detail::panic_impl(render(result.error()), location);
  }
  return std::move(*result);
}

} // namespace stanza

CAF_ERROR_CODE_ENUM(stanza::ec)

template <>
struct fmt::formatter<caf::error> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const caf::error& err, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", stanza::render(err));
  }
};
