//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/error.hpp"

#include "stanza/detail/assert.hpp"

#include <caf/message.hpp>

#include <iterator>
#include <sstream>
#include <string>

namespace stanza {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "no_such_file",
  "filesystem_error",
  "type_clash",
  "parse_error",
  "print_error",
  "syntax_error",
  "lookup_error",
  "invalid_configuration",
  "recursion_limit_reached",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i))
        oss << ctx.get_as<std::string>(i);
      else
        oss << to_string(ctx);
    }
  }
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  STANZA_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto from_string(std::string_view str, ec& x) -> bool {
  for (size_t i = 0; i < std::size(descriptions); ++i) {
    if (str == descriptions[i]) {
      x = static_cast<ec>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool {
  if (value >= static_cast<std::underlying_type_t<ec>>(ec::ec_count))
    return false;
  x = static_cast<ec>(value);
  return true;
}

auto render(const caf::error& err) -> std::string {
  if (!err)
    return "";
  std::ostringstream oss;
  oss << "!! ";
  if (err.category() == caf::type_id_v<stanza::ec>) {
    oss << to_string(static_cast<stanza::ec>(err.code()));
  } else {
    oss << "Unknown";
  }
  render_default_ctx(oss, err.context());
  return std::move(oss).str();
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (!error)
    return error;
  if (!error.context()) {
    return caf::error{
      error.code(),
      error.category(),
      caf::make_message(std::move(str)),
    };
  }
  return caf::error{
    error.code(),
    error.category(),
    caf::message::concat(error.context(), caf::make_message(std::move(str))),
  };
}

} // namespace stanza
