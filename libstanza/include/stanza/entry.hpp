//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/fwd.hpp"

#include "stanza/aliases.hpp"
#include "stanza/data.hpp"
#include "stanza/error.hpp"
#include "stanza/field.hpp"
#include "stanza/time.hpp"
#include "stanza/tree.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace stanza {

/// The severity of an entry. The gaps leave room for finer levels.
enum class severity : uint8_t {
  default_ = 0,
  trace = 10,
  debug = 20,
  info = 30,
  notice = 40,
  warning = 50,
  error = 60,
  critical = 70,
  alert = 80,
  emergency = 90,
  catastrophe = 100,
};

/// @relates severity
auto to_string(severity x) -> std::string_view;

/// @relates severity
auto from_string(std::string_view str, severity& x) -> bool;

/// A single telemetry event on its way through a pipeline.
///
/// The body may hold any value. Attributes and resource are null until the
/// first write and records afterwards.
struct entry {
  /// The time at which the event occurred.
  time timestamp = {};

  /// The time at which the event entered the pipeline.
  time observed_timestamp = {};

  stanza::severity severity = stanza::severity::default_;

  /// The severity as reported by the source.
  std::string severity_text = {};

  data body = {};
  data attributes = {};
  data resource = {};

  /// @returns The sub-tree that fields of the given kind address.
  auto root(root_kind kind) -> data&;

  /// @returns The sub-tree that fields of the given kind address.
  auto root(root_kind kind) const -> const data&;

  auto get(const field& f) const -> std::optional<data> {
    return f.get(*this);
  }

  auto set(const field& f, data value) -> caf::error {
    return f.set(*this, std::move(value));
  }

  auto erase(const field& f) -> std::optional<data> {
    return f.erase(*this);
  }

  void merge(const field& f, record values) {
    f.merge(*this, std::move(values));
  }

  /// Reads the value at a field as a specific alternative. A string read
  /// accepts any non-container value and prints it.
  /// @returns The value, `ec::lookup_error` if the field does not resolve, or
  /// `ec::type_clash` if the value has a different type.
  template <class T>
  auto read(const field& f) const -> caf::expected<T> {
    const auto* x = lookup(root(f.kind()), f.keys());
    if (not x)
      return caf::make_error(ec::lookup_error,
                             fmt::format("{} does not exist", f));
    if constexpr (std::is_same_v<T, data>) {
      return *x;
    } else {
      if (const auto* y = try_as<T>(x))
        return *y;
      if constexpr (std::is_same_v<T, std::string>) {
        if (not is_null(*x) && not is_container(*x))
          return to_string(*x);
      }
      return caf::make_error(ec::type_clash,
                             fmt::format("{} holds a value of type {}", f,
                                         type_name(*x)));
    }
  }

  /// Inserts a key into the attributes, replacing an existing value.
  void add_attribute(std::string key, data value);

  /// Inserts a key into the resource, replacing an existing value.
  void add_resource_key(std::string key, data value);

private:
  template <class Self>
  static auto root_impl(Self& self, root_kind kind) -> auto&;
};

/// Creates an entry observed now.
auto make_entry() -> entry;

} // namespace stanza

template <>
struct fmt::formatter<stanza::severity> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(stanza::severity x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", stanza::to_string(x));
  }
};

template <>
struct fmt::formatter<stanza::entry> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const stanza::entry& x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(),
                          "{{timestamp: {}, severity: {}, body: {}, "
                          "attributes: {}, resource: {}}}",
                          x.timestamp, x.severity, x.body, x.attributes,
                          x.resource);
  }
};
