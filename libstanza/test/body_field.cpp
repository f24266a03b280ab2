//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/entry.hpp"
#include "stanza/field.hpp"
#include "stanza/test/test.hpp"

using namespace stanza;

namespace {

struct fixture {
  fixture() {
    e.body = record{
      {"message", "hello"},
      {"http", record{{"status", 200}}},
    };
  }

  entry e = make_entry();
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("get from the body") {
    CHECK_EQUAL(unbox(e.get(make_body_field("message"))), data{"hello"});
    CHECK_EQUAL(unbox(e.get(make_body_field("http", "status"))), data{200});
    CHECK(not e.get(make_body_field("message", "length")));
  }

  TEST("replace a record body with a string") {
    CHECK_SUCCESS(e.set(make_body_field(), "plain text"));
    CHECK_EQUAL(e.body, data{"plain text"});
  }

  TEST("a string body blocks nested writes") {
    e.body = "plain text";
    CHECK_EQUAL(e.set(make_body_field("key"), "value"), ec::type_clash);
    CHECK_EQUAL(e.body, data{"plain text"});
  }

  TEST("merge into a string body replaces it") {
    e.body = "plain text";
    e.merge(make_body_field(), record{{"key", "value"}});
    CHECK_EQUAL(e.body, data{record{{"key", "value"}}});
  }

  TEST("merge below a string replaces the string") {
    e.merge(make_body_field("message", "parts"), record{{"a", 1}});
    auto expected = record{
      {"message", record{{"parts", record{{"a", 1}}}}},
      {"http", record{{"status", 200}}},
    };
    CHECK_EQUAL(e.body, data{expected});
  }

  TEST("erase the body") {
    auto body = unbox(e.erase(make_body_field()));
    CHECK(is<record>(body));
    CHECK(is_null(e.body));
    CHECK(not e.get(make_body_field()));
  }

  TEST("list values are leaves") {
    e.body = list{data{1}, data{2}};
    CHECK_EQUAL(unbox(e.get(make_body_field())), data{list{data{1}, data{2}}});
    CHECK(not e.get(make_body_field("0")));
    CHECK_EQUAL(e.set(make_body_field("0"), 3), ec::type_clash);
  }

  TEST("parse a body field") {
    auto f = unbox(field::parse("body.http['status']"));
    CHECK_EQUAL(f, make_body_field("http", "status"));
    CHECK_EQUAL(unbox(e.get(f)), data{200});
  }
}
