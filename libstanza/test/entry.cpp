//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/entry.hpp"

#include "stanza/test/test.hpp"

#include <chrono>
#include <type_traits>

using namespace stanza;

namespace {

struct fixture {
  fixture() {
    e.add_attribute("count", int64_t{42});
    e.add_attribute("ratio", 0.5);
    e.add_attribute("enabled", true);
    e.add_attribute("name", "web");
    e.add_attribute("labels", record{{"app", "nginx"}});
  }

  entry e = make_entry();
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("typed reads") {
    CHECK_EQUAL(unbox(e.read<int64_t>(make_attribute_field("count"))), 42);
    CHECK_EQUAL(unbox(e.read<double>(make_attribute_field("ratio"))), 0.5);
    CHECK_EQUAL(unbox(e.read<bool>(make_attribute_field("enabled"))), true);
    CHECK_EQUAL(unbox(e.read<std::string>(make_attribute_field("name"))),
                "web");
    auto labels = unbox(e.read<record>(make_attribute_field("labels")));
    CHECK_EQUAL(data{labels}, data{record{{"app", "nginx"}}});
    CHECK_EQUAL(unbox(e.read<data>(make_attribute_field("labels", "app"))),
                data{"nginx"});
  }

  TEST("string reads print scalars") {
    CHECK_EQUAL(unbox(e.read<std::string>(make_attribute_field("count"))),
                "42");
    CHECK_EQUAL(unbox(e.read<std::string>(make_attribute_field("enabled"))),
                "true");
  }

  TEST("typed read failures") {
    auto missing = e.read<int64_t>(make_attribute_field("missing"));
    REQUIRE(not missing);
    CHECK_EQUAL(missing.error(), ec::lookup_error);
    auto clash = e.read<int64_t>(make_attribute_field("name"));
    REQUIRE(not clash);
    CHECK_EQUAL(clash.error(), ec::type_clash);
    auto container = e.read<std::string>(make_attribute_field("labels"));
    REQUIRE(not container);
    CHECK_EQUAL(container.error(), ec::type_clash);
  }

  TEST("root selects the sub-tree") {
    CHECK(&e.root(root_kind::body) == &e.body);
    CHECK(&e.root(root_kind::attributes) == &e.attributes);
    CHECK(&e.root(root_kind::resource) == &e.resource);
    const auto& ce = e;
    CHECK(&ce.root(root_kind::body) == &e.body);
    CHECK(&ce.root(root_kind::attributes) == &e.attributes);
    CHECK(&ce.root(root_kind::resource) == &e.resource);
    static_assert(
      std::is_same_v<decltype(ce.root(root_kind::body)), const data&>);
    static_assert(std::is_same_v<decltype(e.root(root_kind::body)), data&>);
  }

  TEST("entries are observed on creation") {
    CHECK(e.observed_timestamp != stanza::time{});
    CHECK(e.timestamp == stanza::time{});
    CHECK_EQUAL(e.severity, severity::default_);
  }

  TEST("entries print their sub-trees") {
    e.body = "hello";
    e.severity = severity::warning;
    auto str = fmt::format("{}", e);
    CHECK_NOT_EQUAL(str.find(R"(body: "hello")"), std::string::npos);
    CHECK_NOT_EQUAL(str.find("severity: warning"), std::string::npos);
    CHECK_NOT_EQUAL(str.find(R"("labels": {"app": "nginx"})"),
                    std::string::npos);
    CHECK_NOT_EQUAL(str.find("resource: null"), std::string::npos);
  }
}

TEST("severity names") {
  CHECK_EQUAL(to_string(severity::error), "error");
  auto x = severity::default_;
  CHECK(from_string("critical", x));
  CHECK_EQUAL(x, severity::critical);
  CHECK(not from_string("loud", x));
  CHECK_EQUAL(x, severity::critical);
}
