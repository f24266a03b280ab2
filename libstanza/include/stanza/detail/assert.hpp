//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/config.hpp"

#include <fmt/format.h>

#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace stanza::detail {

/// Logs the message and throws. Aborts the process instead when the
/// environment variable `STANZA_ABORT_ON_PANIC` is set to a non-zero value.
[[noreturn]] STANZA_NO_INLINE void
panic_impl(std::string message, std::source_location source);

[[noreturn]] STANZA_NO_INLINE void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

[[noreturn]] inline void fail_assertion(const char* expr,
                                        std::source_location source) {
  fail_assertion_impl(expr, {}, source);
}

template <class... Ts>
[[noreturn]] void
fail_assertion(const char* expr, std::source_location source,
               fmt::format_string<Ts...> explanation, Ts&&... xs) {
  fail_assertion_impl(
    expr, fmt::format(std::move(explanation), std::forward<Ts>(xs)...),
    source);
}

} // namespace stanza::detail

#define STANZA_ASSERT(expr, ...)                                               \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                           \
      ::stanza::detail::fail_assertion(                                        \
        #expr, std::source_location::current() __VA_OPT__(, ) __VA_ARGS__);   \
    }                                                                          \
  } while (false)

#define STANZA_UNREACHABLE()                                                   \
  ::stanza::detail::panic_impl("unreachable code path",                       \
                               std::source_location::current())
