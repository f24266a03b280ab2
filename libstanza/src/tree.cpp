//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/tree.hpp"

#include "stanza/error.hpp"
#include "stanza/logger.hpp"

#include <utility>

namespace stanza {

auto lookup(const data& root, std::span<const std::string> keys)
  -> const data* {
  if (is_null(root))
    return nullptr;
  const auto* current = &root;
  for (const auto& key : keys) {
    const auto* r = try_as<record>(current);
    if (not r)
      return nullptr;
    auto it = r->find(key);
    if (it == r->end())
      return nullptr;
    current = &it->second;
  }
  return current;
}

auto assign(data& root, std::span<const std::string> keys, data value,
            bool record_root) -> caf::error {
  if (keys.empty()) {
    if (auto* current = try_as<record>(root)) {
      if (auto* incoming = try_as<record>(value)) {
        merge_shallow(*current, std::move(*incoming));
        return {};
      }
      if (record_root && not current->empty())
        return caf::make_error(ec::type_clash,
                               fmt::format("cannot replace a non-empty record "
                                           "root with a value of type {}",
                                           type_name(value)));
    }
    root = std::move(value);
    return {};
  }
  if (is_null(root))
    root = record{};
  auto* current = try_as<record>(root);
  if (not current)
    return caf::make_error(ec::type_clash,
                           fmt::format("cannot descend into the root: expected "
                                       "a record but got {}",
                                       type_name(root)));
  // Records only get created below the last existing value, so a blocked
  // path leaves the sub-tree unchanged. A stored null blocks like any other
  // non-record value.
  for (const auto& key : keys.first(keys.size() - 1)) {
    auto& next = current->try_emplace(key, record{}).first->second;
    current = try_as<record>(next);
    if (not current)
      return caf::make_error(ec::type_clash,
                             fmt::format("cannot descend into '{}': expected a "
                                         "record but got {}",
                                         key, type_name(next)));
  }
  auto& target = (*current)[keys.back()];
  auto* existing = try_as<record>(target);
  auto* incoming = try_as<record>(value);
  if (existing && incoming)
    merge_shallow(*existing, std::move(*incoming));
  else
    target = std::move(value);
  return {};
}

auto erase(data& root, std::span<const std::string> keys)
  -> std::optional<data> {
  if (keys.empty()) {
    if (is_null(root))
      return std::nullopt;
    return std::exchange(root, data{});
  }
  auto* parent = &root;
  for (const auto& key : keys.first(keys.size() - 1)) {
    auto* r = try_as<record>(parent);
    if (not r)
      return std::nullopt;
    auto it = r->find(key);
    if (it == r->end())
      return std::nullopt;
    parent = &it->second;
  }
  auto* r = try_as<record>(parent);
  if (not r)
    return std::nullopt;
  auto it = r->find(keys.back());
  if (it == r->end())
    return std::nullopt;
  auto result = std::move(it->second);
  r->erase(it);
  return result;
}

void merge(data& root, std::span<const std::string> keys, record values) {
  auto* current = &root;
  for (const auto& key : keys) {
    auto* r = try_as<record>(current);
    if (not r) {
      if (not is_null(*current))
        STANZA_DEBUG("merge replaces {} with a record to reach '{}'",
                     type_name(*current), key);
      *current = record{};
      r = &as<record>(*current);
    }
    current = &(*r)[key];
  }
  if (auto* r = try_as<record>(current)) {
    merge_shallow(*r, std::move(values));
    return;
  }
  if (not is_null(*current))
    STANZA_DEBUG("merge replaces {} with a record", type_name(*current));
  *current = std::move(values);
}

void merge_shallow(record& dst, record src) {
  for (auto& [key, value] : src)
    dst.insert_or_assign(std::move(key), std::move(value));
}

} // namespace stanza
