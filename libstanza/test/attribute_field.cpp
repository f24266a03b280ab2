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

TEST("set an attribute on a fresh entry") {
  auto e = make_entry();
  CHECK(is_null(e.attributes));
  CHECK_SUCCESS(e.set(make_attribute_field("k8s", "pod"), "web-1"));
  CHECK_EQUAL(e.attributes, data{record{{"k8s", record{{"pod", "web-1"}}}}});
  CHECK(is_null(e.resource));
  CHECK(is_null(e.body));
}

TEST("attributes and resource are independent") {
  auto e = make_entry();
  e.add_attribute("key", "attribute");
  e.add_resource_key("key", "resource");
  CHECK_EQUAL(unbox(e.get(make_attribute_field("key"))), data{"attribute"});
  CHECK_EQUAL(unbox(e.get(make_resource_field("key"))), data{"resource"});
  CHECK(e.erase(make_attribute_field("key")));
  CHECK(not e.get(make_attribute_field("key")));
  CHECK_EQUAL(unbox(e.get(make_resource_field("key"))), data{"resource"});
}

TEST("the populated attribute root stays a record") {
  auto e = make_entry();
  e.add_attribute("key", "value");
  CHECK_EQUAL(e.set(make_attribute_field(), 42), ec::type_clash);
  CHECK_EQUAL(e.set(make_attribute_field(), list{}), ec::type_clash);
  CHECK_EQUAL(e.attributes, data{record{{"key", "value"}}});
}

TEST("an empty attribute root may be replaced") {
  auto e = make_entry();
  e.attributes = record{};
  CHECK_SUCCESS(e.set(make_attribute_field(), "value"));
  CHECK_EQUAL(e.attributes, data{"value"});
}

TEST("parse an attribute field from YAML") {
  auto f = unbox(field::from_yaml("attributes[\"http.method\"]",
                                  root_kind::attributes));
  CHECK_EQUAL(f, make_attribute_field("http.method"));
  auto err = field::from_yaml("resource.key", root_kind::attributes);
  CHECK_ERROR_CONTAINS(err, "must start with 'attributes'");
}

TEST("add_attribute overwrites") {
  auto e = make_entry();
  e.add_attribute("key", "old");
  e.add_attribute("key", "new");
  CHECK_EQUAL(e.attributes, data{record{{"key", "new"}}});
}
