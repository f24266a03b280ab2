//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/aliases.hpp"
#include "stanza/data.hpp"

#include <caf/error.hpp>

#include <optional>
#include <span>
#include <string>

namespace stanza {

/// Resolves a key path inside a sub-tree.
/// @param root The sub-tree. A null sub-tree resolves nothing, not even the
/// empty path.
/// @param keys The path below *root*.
/// @returns A pointer to the addressed value, or `nullptr` if a key is
/// missing or a value on the way is not a record.
auto lookup(const data& root, std::span<const std::string> keys)
  -> const data*;

/// Writes a value into a sub-tree.
///
/// Missing or null intermediates, and a null *root*, become empty records.
/// An existing value that is not a record blocks the write. If both the
/// addressed value and *value* are records, the keys of *value* are merged
/// into the existing record on the top level; otherwise *value* replaces the
/// addressed value.
///
/// @param record_root Whether *root* must stay a record once it has content.
/// @returns `ec::type_clash` if the path is blocked, or if a non-empty record
/// root would be replaced by a non-record. The sub-tree is unchanged then.
auto assign(data& root, std::span<const std::string> keys, data value,
            bool record_root) -> caf::error;

/// Removes the value at a key path. The empty path resets *root* to null.
/// @returns The removed value, or `std::nullopt` if the path did not resolve.
auto erase(data& root, std::span<const std::string> keys)
  -> std::optional<data>;

/// Merges a record into the record at a key path. Never fails: values that are
/// not records are replaced by records on the way, and *values* is installed
/// as-is where the addressed value is not a record.
void merge(data& root, std::span<const std::string> keys, record values);

/// Inserts every field of *src* into *dst*, overwriting existing keys.
/// Nested records are replaced, not merged.
void merge_shallow(record& dst, record src);

} // namespace stanza
