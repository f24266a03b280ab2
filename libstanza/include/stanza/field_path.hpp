//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/fwd.hpp"

#include <caf/expected.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace stanza {

/// Splits a textual field path into its segments.
///
/// A path is a leading identifier followed by any mix of dot segments
/// (`.key`) and bracket segments (`['key']` or `["key"]`). Identifiers run
/// until the next `.`, `[` or `]`. Bracketed keys are taken verbatim and may
/// contain dots, brackets and the other quote character. The leading
/// identifier is returned as the first segment; it is up to the caller to
/// interpret it as a root keyword.
///
/// @param str The path to split.
/// @returns The segments of *str*, or an `ec::syntax_error` describing the
/// first malformed construct.
auto split_field_path(std::string_view str)
  -> caf::expected<std::vector<std::string>>;

/// Checks whether a key can be printed as a dot segment.
auto is_plain_field_key(std::string_view key) -> bool;

/// Prints a single key as a path segment that `split_field_path` turns back
/// into *key*, i.e., `.key` for plain keys and a bracket segment otherwise.
auto print_field_key(std::string_view key) -> std::string;

} // namespace stanza
