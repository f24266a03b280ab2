//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/field_path.hpp"

#include "stanza/field.hpp"
#include "stanza/test/test.hpp"

#include <string>
#include <vector>

using namespace stanza;

namespace {

auto segments(std::string_view str) -> std::vector<std::string> {
  return unbox(split_field_path(str));
}

void check_syntax_error(std::string_view str, std::string_view message) {
  auto result = split_field_path(str);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::syntax_error);
  CHECK_ERROR_CONTAINS(result, message);
}

} // namespace

TEST("split dot segments") {
  CHECK_EQUAL(segments("resource"), (std::vector<std::string>{"resource"}));
  CHECK_EQUAL(segments("resource.a.b"),
              (std::vector<std::string>{"resource", "a", "b"}));
  CHECK_EQUAL(segments("body.with space"),
              (std::vector<std::string>{"body", "with space"}));
}

TEST("split bracket segments") {
  CHECK_EQUAL(segments("resource['test.foo']['bar']"),
              (std::vector<std::string>{"resource", "test.foo", "bar"}));
  CHECK_EQUAL(segments("resource['test.foo'].bar"),
              (std::vector<std::string>{"resource", "test.foo", "bar"}));
  CHECK_EQUAL(segments("resource.c['a.b']"),
              (std::vector<std::string>{"resource", "c", "a.b"}));
  CHECK_EQUAL(segments(R"(resource["it's"])"),
              (std::vector<std::string>{"resource", "it's"}));
  CHECK_EQUAL(segments(R"(resource['say "hi"'])"),
              (std::vector<std::string>{"resource", "say \"hi\""}));
  CHECK_EQUAL(segments("resource['[a]']"),
              (std::vector<std::string>{"resource", "[a]"}));
}

TEST("empty bracket keys are ordinary keys") {
  CHECK_EQUAL(segments("resource['']"),
              (std::vector<std::string>{"resource", ""}));
  auto f = unbox(field::parse("resource[''].a"));
  CHECK_EQUAL(f, make_resource_field("", "a"));
}

TEST("syntax errors") {
  check_syntax_error("", "found empty field name");
  check_syntax_error("resource.", "found empty field name");
  check_syntax_error("resource..a", "found empty field name");
  check_syntax_error(".resource", "found empty field name");
  check_syntax_error("resource[", "found unclosed left bracket");
  check_syntax_error("resource['a'", "found unclosed left bracket");
  check_syntax_error("test['foo'", "found unclosed left bracket");
  check_syntax_error("resource['a]", "found unclosed single quote");
  check_syntax_error(R"(resource["a])", "found unclosed double quote");
  check_syntax_error("resource[a]",
                     "strings in brackets must be surrounded by quotes");
  check_syntax_error("resource['a'b]", "found characters between closed quote "
                                       "and closing bracket");
  check_syntax_error("resource['a'x", "found characters between closed quote "
                                      "and closing bracket");
  check_syntax_error("resource['a", "found unclosed single quote");
  check_syntax_error("resource[a", "strings in brackets must be surrounded by "
                                   "quotes");
  check_syntax_error("resource['a']b", "bracketed access must be followed by "
                                       "a dot or another bracketed access");
  check_syntax_error("resource]", "found unexpected right bracket");
  check_syntax_error("resource.a]", "found unexpected right bracket");
}

TEST("parse any root") {
  CHECK_EQUAL(unbox(field::parse("body")), make_body_field());
  CHECK_EQUAL(unbox(field::parse("attributes.a")), make_attribute_field("a"));
  CHECK_EQUAL(unbox(field::parse("resource['a.b']")),
              make_resource_field("a.b"));
  auto err = field::parse("timestamp");
  CHECK_EQUAL(err.error(), ec::parse_error);
  CHECK_ERROR_CONTAINS(err,
                       "must start with 'body', 'attributes', or 'resource'");
}

TEST("the keyword is not a bracket segment") {
  auto err = field::parse("['resource'].a", root_kind::resource);
  CHECK_ERROR_CONTAINS(err, "must start with 'resource'");
  err = field::parse("resources.a", root_kind::resource);
  CHECK_ERROR_CONTAINS(err, "must start with 'resource'");
}

TEST("syntax errors come before prefix errors") {
  auto err = field::parse("test['foo'", root_kind::resource);
  CHECK_EQUAL(err.error(), ec::syntax_error);
  CHECK_ERROR_CONTAINS(err, "found unclosed left bracket");
}

TEST("parse from data") {
  auto err = field::from_data(data{42});
  CHECK_EQUAL(err.error(), ec::type_clash);
  CHECK_ERROR_CONTAINS(err, "the field is not a string");
  CHECK_EQUAL(unbox(field::from_data(data{"body.a"})), make_body_field("a"));
}

TEST("YAML scalars that are not strings") {
  CHECK_ERROR_CONTAINS(field::from_yaml("42"), "the field is not a string");
  CHECK_ERROR_CONTAINS(field::from_yaml("[resource]"),
                       "the field is not a string");
  CHECK_ERROR_CONTAINS(field::from_json("null"), "the field is not a string");
  CHECK_ERROR_CONTAINS(field::from_json("[\"resource\"]"),
                       "the field is not a string");
}

TEST("print fields") {
  CHECK_EQUAL(to_string(make_resource_field()), "resource");
  CHECK_EQUAL(to_string(make_resource_field("a", "b")), "resource.a.b");
  CHECK_EQUAL(to_string(make_attribute_field("http.method")),
              "attributes['http.method']");
  CHECK_EQUAL(to_string(make_body_field("it's", "x")), R"(body["it's"].x)");
  CHECK_EQUAL(to_string(make_body_field("")), "body['']");
  CHECK_EQUAL(fmt::format("{}", make_resource_field("k8s", "pod")),
              "resource.k8s.pod");
}

TEST("printing round-trips through parsing") {
  auto texts = std::vector<std::string>{
    "resource",
    "resource.test",
    "resource['test.foo']",
    "resource['test.foo']['bar']",
    "resource['test.foo'].bar",
    R"(attributes["a'b"].c)",
    "body['[x]']['']",
  };
  for (const auto& text : texts) {
    auto f = unbox(field::parse(text));
    auto printed = to_string(f);
    CHECK_EQUAL(unbox(field::parse(printed)), f);
    CHECK_EQUAL(unbox(split_field_path(printed)),
                unbox(split_field_path(text)));
  }
}
