//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/detail/string.hpp"

#include "stanza/detail/assert.hpp"

#include <fmt/format.h>

#include <iterator>

namespace stanza::detail {

auto split(std::string_view str, std::string_view sep)
  -> std::vector<std::string_view> {
  STANZA_ASSERT(not sep.empty());
  auto result = std::vector<std::string_view>{};
  auto start = size_t{0};
  while (true) {
    auto pos = str.find(sep, start);
    if (pos == std::string_view::npos) {
      result.push_back(str.substr(start));
      return result;
    }
    result.push_back(str.substr(start, pos - start));
    start = pos + sep.size();
  }
}

auto json_escape(std::string_view str) -> std::string {
  auto result = std::string{};
  result.reserve(str.size() + 2);
  auto out = std::back_inserter(result);
  *out++ = '"';
  for (auto c : str) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          fmt::format_to(out, "\\u{:04x}", static_cast<unsigned char>(c));
        } else {
          *out++ = c;
        }
    }
  }
  *out++ = '"';
  return result;
}

} // namespace stanza::detail
