//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/entry.hpp"

#include "stanza/detail/assert.hpp"

#include <array>
#include <chrono>
#include <utility>

namespace stanza {

namespace {

constexpr auto severity_names = std::array{
  std::pair{severity::default_, std::string_view{"default"}},
  std::pair{severity::trace, std::string_view{"trace"}},
  std::pair{severity::debug, std::string_view{"debug"}},
  std::pair{severity::info, std::string_view{"info"}},
  std::pair{severity::notice, std::string_view{"notice"}},
  std::pair{severity::warning, std::string_view{"warning"}},
  std::pair{severity::error, std::string_view{"error"}},
  std::pair{severity::critical, std::string_view{"critical"}},
  std::pair{severity::alert, std::string_view{"alert"}},
  std::pair{severity::emergency, std::string_view{"emergency"}},
  std::pair{severity::catastrophe, std::string_view{"catastrophe"}},
};

} // namespace

auto to_string(severity x) -> std::string_view {
  for (const auto& [value, name] : severity_names)
    if (value == x)
      return name;
  STANZA_UNREACHABLE();
}

auto from_string(std::string_view str, severity& x) -> bool {
  for (const auto& [value, name] : severity_names) {
    if (name == str) {
      x = value;
      return true;
    }
  }
  return false;
}

template <class Self>
auto entry::root_impl(Self& self, root_kind kind) -> auto& {
  switch (kind) {
    case root_kind::body:
      return self.body;
    case root_kind::attributes:
      return self.attributes;
    case root_kind::resource:
      return self.resource;
  }
  STANZA_UNREACHABLE();
}

auto entry::root(root_kind kind) -> data& {
  return root_impl(*this, kind);
}

auto entry::root(root_kind kind) const -> const data& {
  return root_impl(*this, kind);
}

void entry::add_attribute(std::string key, data value) {
  auto values = record{};
  values.emplace(std::move(key), std::move(value));
  stanza::merge(attributes, {}, std::move(values));
}

void entry::add_resource_key(std::string key, data value) {
  auto values = record{};
  values.emplace(std::move(key), std::move(value));
  stanza::merge(resource, {}, std::move(values));
}

auto make_entry() -> entry {
  auto result = entry{};
  result.observed_timestamp
    = std::chrono::time_point_cast<duration>(std::chrono::system_clock::now());
  return result;
}

} // namespace stanza
