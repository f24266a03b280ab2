//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/data.hpp"
#include "stanza/error.hpp"

#include <caf/test/test.hpp>
#include <fmt/format.h>

#include <optional>
#include <set>
#include <string>
#include <type_traits>

namespace stanza::test::detail {

template <class T>
auto stringify(const T& value) {
  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return std::string{"null"};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{value};
  } else if constexpr (requires { to_string(value); }) {
    return std::string{to_string(value)};
  } else {
    return caf::deep_to_string(value);
  }
}

template <class T0, class T1>
bool check_eq(const T0& lhs, const T1& rhs,
              caf::detail::source_location location
              = caf::detail::source_location::current()) {
  // Adapted from CAF, but without safety checks.
  if (lhs == rhs) {
    caf::test::reporter::instance().pass(location);
    return true;
  }
  caf::test::reporter::instance().fail(
    caf::test::binary_predicate::eq, stringify(lhs), stringify(rhs), location);
  return false;
}

} // end namespace stanza::test::detail

// -- logging macros -----------------------------------------------------------

#define ERROR CAF_TEST_PRINT_ERROR
#define INFO CAF_TEST_PRINT_INFO
#define VERBOSE CAF_TEST_PRINT_VERBOSE
// The new testing framework does not have `CAF_MESSAGE` anymore.
#define MESSAGE(...) (fmt::print(__VA_ARGS__), fmt::print("\n"))

// -- macros for checking results ----------------------------------------------
// Checks that abort the current test on failure
#define REQUIRE(x)                                                             \
  ::caf::test::runnable::current().require(static_cast<bool>(x))
#define REQUIRE_EQUAL(x, y)                                                    \
  ::caf::test::runnable::current().require_eq((x), (y))
#define REQUIRE_NOT_EQUAL(x, y)                                                \
  ::caf::test::runnable::current().require_ne((x), (y))
#define REQUIRE_NOERROR(x)                                                     \
  do {                                                                         \
    if (! (x)) {                                                               \
      ::caf::test::runnable::current().fail("Unexpected error {} in: {}",      \
                                            (x).error(), __FILE__);            \
    } else {                                                                   \
      MESSAGE("Successful check " #x);                                         \
    }                                                                          \
  } while (false)
#define REQUIRE_ERROR(x) REQUIRE_EQUAL(! (x), true)
#define REQUIRE_SUCCESS(x) REQUIRE_EQUAL((x), caf::none)
#define REQUIRE_FAILURE(x) REQUIRE_NOT_EQUAL((x), caf::none)
#define FAIL ::caf::test::runnable::current().fail
// Checks that continue with the current test on failure
#define CHECK(x) ::caf::test::runnable::current().check(static_cast<bool>(x))
#define CHECK_EQUAL(x, y) ::stanza::test::detail::check_eq((x), (y))
#define CHECK_NOT_EQUAL(x, y)                                                  \
  ::caf::test::runnable::current().check_ne((x), (y))
#define CHECK_ERROR(x) CHECK_EQUAL(! (x), true)
#define CHECK_SUCCESS(x) CHECK_EQUAL((x), caf::none)
#define CHECK_FAILURE(x) CHECK_NOT_EQUAL((x), caf::none)

// Checks that an error or an expected holding an error renders to a string
// that contains the given text.
#define CHECK_ERROR_CONTAINS(x, text)                                          \
  CHECK_NOT_EQUAL(::stanza::test::render_error(x).find(text),                  \
                  std::string::npos)

// -- global state -------------------------------------------------------------

namespace stanza::test {

template <class T>
T unbox(std::optional<T> x) {
  if (! x) {
    FAIL("x == none");
  }
  return std::move(*x);
}

template <class T>
T unbox(caf::expected<T> x) {
  if (! x) {
    FAIL("expected<T> contains an error: {}", x.error());
  }
  return std::move(*x);
}

template <class T>
T unbox(T* x) {
  if (! x) {
    FAIL("T* contains nullptr");
  }
  return std::move(*x);
}

inline std::string render_error(const caf::error& err) {
  return render(err);
}

template <class T>
std::string render_error(const caf::expected<T>& x) {
  if (x)
    return {};
  return render(x.error());
}

// Holds global configuration options passed on the command line after the
// special -- delimiter.
extern std::set<std::string> config;

} // namespace stanza::test

namespace stanza {

using test::unbox;

} // namespace stanza
