//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace stanza::detail {

/// Splits a string at every occurrence of a separator.
/// @param str The string to split.
/// @param sep The separator, which must not be empty.
/// @returns The parts between the separators, including empty ones.
auto split(std::string_view str, std::string_view sep)
  -> std::vector<std::string_view>;

/// Escapes a string so that it can be embedded in a JSON document, including
/// the surrounding double quotes.
auto json_escape(std::string_view str) -> std::string;

} // namespace stanza::detail
