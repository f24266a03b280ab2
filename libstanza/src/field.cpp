//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/field.hpp"

#include "stanza/detail/assert.hpp"
#include "stanza/entry.hpp"
#include "stanza/error.hpp"
#include "stanza/field_path.hpp"
#include "stanza/tree.hpp"

#include <array>
#include <utility>

namespace stanza {

namespace {

constexpr auto root_kinds = std::array{
  root_kind::body,
  root_kind::attributes,
  root_kind::resource,
};

/// Turns the segments of a path into a field, checking the leading keyword.
auto make_field(std::string_view str, std::vector<std::string> segments,
                std::optional<root_kind> required) -> caf::expected<field> {
  // The keyword must be a plain identifier, not a bracket segment.
  auto matches = [&](root_kind kind) {
    return str.front() != '[' && segments.front() == keyword(kind);
  };
  auto make = [&](root_kind kind) {
    segments.erase(segments.begin());
    return field{kind, std::move(segments)};
  };
  if (required) {
    if (not matches(*required))
      return caf::make_error(ec::parse_error,
                             fmt::format("must start with '{}'",
                                         keyword(*required)));
    return make(*required);
  }
  for (auto kind : root_kinds)
    if (matches(kind))
      return make(kind);
  return caf::make_error(ec::parse_error, "must start with 'body', "
                                          "'attributes', or 'resource'");
}

} // namespace

auto keyword(root_kind kind) -> std::string_view {
  switch (kind) {
    case root_kind::body:
      return "body";
    case root_kind::attributes:
      return "attributes";
    case root_kind::resource:
      return "resource";
  }
  STANZA_UNREACHABLE();
}

auto is_record_root(root_kind kind) -> bool {
  return kind != root_kind::body;
}

auto to_string(root_kind kind) -> std::string {
  return std::string{keyword(kind)};
}

field::field(root_kind kind, std::vector<std::string> keys)
  : kind_{kind}, keys_{std::move(keys)} {
  // nop
}

auto field::parse(std::string_view str) -> caf::expected<field> {
  auto segments = split_field_path(str);
  if (not segments)
    return std::move(segments.error());
  return make_field(str, std::move(*segments), std::nullopt);
}

auto field::parse(std::string_view str, root_kind kind)
  -> caf::expected<field> {
  auto segments = split_field_path(str);
  if (not segments)
    return std::move(segments.error());
  return make_field(str, std::move(*segments), kind);
}

auto field::from_data(const data& x, std::optional<root_kind> kind)
  -> caf::expected<field> {
  const auto* str = try_as<std::string>(x);
  if (not str)
    return caf::make_error(ec::type_clash, "the field is not a string");
  if (kind)
    return parse(*str, *kind);
  return parse(*str);
}

auto field::from_yaml(std::string_view document, std::optional<root_kind> kind)
  -> caf::expected<field> {
  auto x = stanza::from_yaml(document);
  if (not x)
    return std::move(x.error());
  return from_data(*x, kind);
}

auto field::from_json(std::string_view document, std::optional<root_kind> kind)
  -> caf::expected<field> {
  auto x = stanza::from_json(document);
  if (not x)
    return std::move(x.error());
  return from_data(*x, kind);
}

auto field::last() const -> std::string_view {
  STANZA_ASSERT(not keys_.empty());
  return keys_.back();
}

auto field::parent() const -> field {
  if (keys_.empty())
    return *this;
  return field{kind_, {keys_.begin(), keys_.end() - 1}};
}

auto field::child(std::string key) const -> field {
  auto keys = keys_;
  keys.push_back(std::move(key));
  return field{kind_, std::move(keys)};
}

auto field::get(const entry& e) const -> std::optional<data> {
  if (const auto* x = lookup(e.root(kind_), keys_))
    return *x;
  return std::nullopt;
}

auto field::set(entry& e, data value) const -> caf::error {
  auto err
    = assign(e.root(kind_), keys_, std::move(value), is_record_root(kind_));
  if (err)
    return add_context(err, "failed to set {}", *this);
  return {};
}

auto field::erase(entry& e) const -> std::optional<data> {
  return stanza::erase(e.root(kind_), keys_);
}

void field::merge(entry& e, record values) const {
  stanza::merge(e.root(kind_), keys_, std::move(values));
}

auto to_string(const field& x) -> std::string {
  auto result = to_string(x.kind());
  for (const auto& key : x.keys())
    result += print_field_key(key);
  return result;
}

} // namespace stanza
