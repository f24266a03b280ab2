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

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stanza {

/// The sub-tree of an entry that a field addresses.
enum class root_kind : uint8_t {
  body,
  attributes,
  resource,
};

/// @returns The keyword that starts the textual form of a field with the
/// given root.
auto keyword(root_kind kind) -> std::string_view;

/// @returns Whether the sub-tree must always hold a record.
auto is_record_root(root_kind kind) -> bool;

/// @relates root_kind
auto to_string(root_kind kind) -> std::string;

/// An immutable path to a value inside one of the sub-trees of an entry.
///
/// The textual form of a field starts with the keyword of its root, followed
/// by dot and bracket segments, e.g., `resource.k8s.pod`,
/// `attributes['http.method']`, or `body["a"].b`. A field without keys
/// addresses the whole sub-tree.
class field {
public:
  /// Constructs a field from its parts.
  explicit field(root_kind kind, std::vector<std::string> keys = {});

  /// Parses a field from text. The root follows from the leading keyword.
  static auto parse(std::string_view str) -> caf::expected<field>;

  /// Parses a field from text that must start with the keyword of *kind*.
  static auto parse(std::string_view str, root_kind kind)
    -> caf::expected<field>;

  /// Parses a field from a data value, which must be a string.
  /// @param x The value, e.g., from a configuration document.
  /// @param kind The required root, or `std::nullopt` to accept any root.
  static auto from_data(const data& x, std::optional<root_kind> kind = {})
    -> caf::expected<field>;

  /// Parses a field from a YAML document consisting of a single scalar.
  static auto
  from_yaml(std::string_view document, std::optional<root_kind> kind = {})
    -> caf::expected<field>;

  /// Parses a field from a JSON document consisting of a single string.
  static auto
  from_json(std::string_view document, std::optional<root_kind> kind = {})
    -> caf::expected<field>;

  // -- properties -------------------------------------------------------------

  auto kind() const -> root_kind {
    return kind_;
  }

  auto keys() const -> const std::vector<std::string>& {
    return keys_;
  }

  /// @returns Whether the field addresses the whole sub-tree.
  auto is_root() const -> bool {
    return keys_.empty();
  }

  /// @returns The last key.
  /// @pre `!is_root()`
  auto last() const -> std::string_view;

  /// @returns The field with the last key removed. A root field is its own
  /// parent.
  auto parent() const -> field;

  /// @returns The field with *key* appended.
  auto child(std::string key) const -> field;

  // -- entry access -----------------------------------------------------------

  /// Reads the value at the field. Never creates anything.
  /// @returns The value, or `std::nullopt` if the field does not resolve.
  auto get(const entry& e) const -> std::optional<data>;

  /// Writes *value* at the field, creating missing intermediate records.
  /// Writing a record onto a record merges the two on the top level.
  auto set(entry& e, data value) const -> caf::error;

  /// Removes the value at the field. For a root field this resets the whole
  /// sub-tree.
  /// @returns The removed value, or `std::nullopt` if there was none.
  auto erase(entry& e) const -> std::optional<data>;

  /// Merges *values* into the record at the field. Anything in the way is
  /// replaced.
  void merge(entry& e, record values) const;

  friend auto operator==(const field& lhs, const field& rhs) -> bool {
    return lhs.kind_ == rhs.kind_ && lhs.keys_ == rhs.keys_;
  }

  friend auto operator!=(const field& lhs, const field& rhs) -> bool {
    return !(lhs == rhs);
  }

private:
  root_kind kind_;
  std::vector<std::string> keys_;
};

/// Prints the textual form of a field, which parses back to an equal field.
/// @relates field
auto to_string(const field& x) -> std::string;

template <class... Keys>
auto make_body_field(Keys&&... keys) -> field {
  return field{root_kind::body, {std::string{std::forward<Keys>(keys)}...}};
}

template <class... Keys>
auto make_attribute_field(Keys&&... keys) -> field {
  return field{root_kind::attributes,
               {std::string{std::forward<Keys>(keys)}...}};
}

template <class... Keys>
auto make_resource_field(Keys&&... keys) -> field {
  return field{root_kind::resource, {std::string{std::forward<Keys>(keys)}...}};
}

} // namespace stanza

template <>
struct fmt::formatter<stanza::field> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const stanza::field& x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", stanza::to_string(x));
  }
};

template <>
struct fmt::formatter<stanza::root_kind> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(stanza::root_kind x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", stanza::keyword(x));
  }
};
