//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/detail/stable_map.hpp"

#include "stanza/test/test.hpp"

#include <stdexcept>
#include <string>

using namespace stanza;

namespace {

struct fixture {
  fixture() {
    xs["c"] = 3;
    xs.insert({"a", 1});
    xs.emplace("b", 2);
  }

  detail::stable_map<std::string, int> xs;
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("membership") {
    CHECK(xs.find("x") == xs.end());
    CHECK(xs.find("a") != xs.end());
    CHECK(xs.contains("b"));
    CHECK_EQUAL(xs.count("c"), 1u);
    CHECK_EQUAL(xs.count("d"), 0u);
  }

  TEST("insertion order") {
    auto keys = std::string{};
    for (const auto& [key, _] : xs)
      keys += key;
    CHECK_EQUAL(keys, "cab");
  }

  TEST("lookup") {
    CHECK_EQUAL(xs.at("a"), 1);
    CHECK_EQUAL(xs["b"], 2);
    auto failed = false;
    try {
      static_cast<void>(xs.at("x"));
    } catch (const std::out_of_range&) {
      failed = true;
    }
    CHECK(failed);
  }

  TEST("insertion does not overwrite") {
    auto [i, inserted] = xs.insert({"a", 42});
    CHECK(not inserted);
    CHECK_EQUAL(i->second, 1);
    auto [j, emplaced] = xs.try_emplace("a", 42);
    CHECK(not emplaced);
    CHECK_EQUAL(j->second, 1);
    auto [k, added] = xs.insert_or_assign("a", 42);
    CHECK(not added);
    CHECK_EQUAL(k->second, 42);
    CHECK_EQUAL(xs.size(), 3u);
  }

  TEST("erasure") {
    CHECK_EQUAL(xs.erase("a"), 1u);
    CHECK_EQUAL(xs.erase("a"), 0u);
    CHECK_EQUAL(xs.size(), 2u);
    xs.erase(xs.begin());
    CHECK_EQUAL(xs.begin()->first, "b");
    xs.clear();
    CHECK(xs.empty());
  }

  TEST("equality ignores order") {
    auto ys = detail::stable_map<std::string, int>{{"a", 1}, {"b", 2}, {"c", 3}};
    CHECK(xs == ys);
    ys["c"] = 4;
    CHECK(xs != ys);
    ys.erase("c");
    CHECK(xs != ys);
  }
}
