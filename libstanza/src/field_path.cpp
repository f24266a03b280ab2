//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/field_path.hpp"

#include "stanza/detail/assert.hpp"
#include "stanza/error.hpp"

namespace stanza {

namespace {

constexpr auto delimiters = std::string_view{".[]"};

auto syntax_error(std::string_view message) -> caf::error {
  return caf::make_error(ec::syntax_error, std::string{message});
}

} // namespace

auto split_field_path(std::string_view str)
  -> caf::expected<std::vector<std::string>> {
  if (str.empty())
    return syntax_error("found empty field name");
  auto result = std::vector<std::string>{};
  auto i = size_t{0};
  auto read_identifier = [&] {
    auto end = str.find_first_of(delimiters, i);
    if (end == std::string_view::npos)
      end = str.size();
    auto identifier = str.substr(i, end - i);
    i = end;
    return identifier;
  };
  if (str.front() != '[') {
    auto identifier = read_identifier();
    if (identifier.empty())
      return syntax_error("found empty field name");
    result.emplace_back(identifier);
  }
  while (i < str.size()) {
    switch (str[i]) {
      case '.': {
        ++i;
        auto identifier = read_identifier();
        if (identifier.empty())
          return syntax_error("found empty field name");
        result.emplace_back(identifier);
        break;
      }
      case '[': {
        if (i + 1 == str.size())
          return syntax_error("found unclosed left bracket");
        auto quote = str[i + 1];
        if (quote != '\'' && quote != '"')
          return syntax_error("strings in brackets must be surrounded by "
                              "quotes");
        auto begin = i + 2;
        auto end = str.find(quote, begin);
        if (end == std::string_view::npos)
          return syntax_error(quote == '\'' ? "found unclosed single quote"
                                            : "found unclosed double quote");
        result.emplace_back(str.substr(begin, end - begin));
        i = end + 1;
        if (i == str.size())
          return syntax_error("found unclosed left bracket");
        if (str[i] != ']')
          return syntax_error("found characters between closed quote and "
                              "closing bracket");
        ++i;
        if (i < str.size() && str[i] != '.' && str[i] != '[')
          return syntax_error("bracketed access must be followed by a dot or "
                              "another bracketed access");
        break;
      }
      case ']':
        return syntax_error("found unexpected right bracket");
      default:
        // Identifiers stop only at delimiters.
        STANZA_UNREACHABLE();
    }
  }
  return result;
}

auto is_plain_field_key(std::string_view key) -> bool {
  return not key.empty()
         && key.find_first_of(delimiters) == std::string_view::npos;
}

auto print_field_key(std::string_view key) -> std::string {
  if (is_plain_field_key(key))
    return fmt::format(".{}", key);
  // A key with both quote characters has no textual form.
  auto quote = key.find('\'') == std::string_view::npos ? '\'' : '"';
  return fmt::format("[{}{}{}]", quote, key, quote);
}

} // namespace stanza
