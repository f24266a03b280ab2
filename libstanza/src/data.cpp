//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/data.hpp"

#include "stanza/defaults.hpp"
#include "stanza/detail/overload.hpp"
#include "stanza/detail/string.hpp"

#include <fmt/format.h>
#include <simdjson.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <system_error>

namespace stanza {

bool operator==(const data& lhs, const data& rhs) {
  if (lhs.data_.index() != rhs.data_.index())
    return false;
  return std::visit(
    [&]<class T>(const T& x) -> bool {
      if constexpr (std::is_same_v<T, caf::none_t>)
        return true;
      else
        return x == std::get<T>(rhs.data_);
    },
    lhs.data_);
}

auto is_container(const data& x) -> bool {
  return is<list>(x) || is<record>(x);
}

auto type_name(const data& x) -> std::string_view {
  return match(
    x,
    [](caf::none_t) -> std::string_view {
      return "null";
    },
    [](bool) -> std::string_view {
      return "bool";
    },
    [](int64_t) -> std::string_view {
      return "int64";
    },
    [](uint64_t) -> std::string_view {
      return "uint64";
    },
    [](double) -> std::string_view {
      return "double";
    },
    [](const std::string&) -> std::string_view {
      return "string";
    },
    [](const list&) -> std::string_view {
      return "list";
    },
    [](const record&) -> std::string_view {
      return "record";
    });
}

auto descend(const record* r, std::string_view path)
  -> caf::expected<const data*> {
  STANZA_ASSERT(r);
  STANZA_ASSERT(not path.empty());
  auto keys = detail::split(path, ".");
  for (size_t i = 0; i + 1 < keys.size(); ++i) {
    auto it = r->find(keys[i]);
    if (it == r->end())
      return nullptr;
    r = try_as<record>(&it->second);
    if (not r)
      return caf::make_error(ec::type_clash,
                             fmt::format("'{}' is not a record in path '{}'",
                                         keys[i], path));
  }
  auto it = r->find(keys.back());
  if (it == r->end())
    return nullptr;
  return &it->second;
}

// -- printing ----------------------------------------------------------------

namespace {

void print_json(std::string& out, const data& x) {
  auto f = detail::overload{
    [&](caf::none_t) {
      out += "null";
    },
    [&](bool x) {
      out += x ? "true" : "false";
    },
    [&](int64_t x) {
      fmt::format_to(std::back_inserter(out), "{}", x);
    },
    [&](uint64_t x) {
      fmt::format_to(std::back_inserter(out), "{}", x);
    },
    [&](double x) {
      if (not std::isfinite(x)) {
        out += "null";
        return;
      }
      auto str = fmt::format("{}", x);
      if (str.find_first_of(".e") == std::string::npos)
        str += ".0";
      out += str;
    },
    [&](const std::string& x) {
      out += detail::json_escape(x);
    },
    [&](const list& xs) {
      out += '[';
      auto first = true;
      for (const auto& x : xs) {
        if (not first)
          out += ", ";
        first = false;
        print_json(out, x);
      }
      out += ']';
    },
    [&](const record& xs) {
      out += '{';
      auto first = true;
      for (const auto& [k, v] : xs) {
        if (not first)
          out += ", ";
        first = false;
        out += detail::json_escape(k);
        out += ": ";
        print_json(out, v);
      }
      out += '}';
    },
  };
  std::visit(f, x.get_data());
}

} // namespace

auto to_string(const data& x) -> std::string {
  auto result = std::string{};
  print_json(result, x);
  return result;
}

// -- JSON --------------------------------------------------------------------

namespace {

auto recursion_limit_error() -> caf::error {
  return caf::make_error(ec::recursion_limit_reached,
                         fmt::format("nesting exceeds the maximum depth of {}",
                                     defaults::max_recursion));
}

auto parse(const simdjson::dom::element& elem, size_t depth = 0)
  -> caf::expected<data> {
  if (depth > defaults::max_recursion)
    return recursion_limit_error();
  switch (elem.type()) {
    case simdjson::dom::element_type::NULL_VALUE:
      return data{};
    case simdjson::dom::element_type::DOUBLE:
      return data{double{elem.get_double()}};
    case simdjson::dom::element_type::UINT64:
      return data{uint64_t{elem.get_uint64()}};
    case simdjson::dom::element_type::INT64:
      return data{int64_t{elem.get_int64()}};
    case simdjson::dom::element_type::BOOL:
      return data{bool{elem.get_bool()}};
    case simdjson::dom::element_type::STRING:
      return data{std::string{elem.get_string().value()}};
    case simdjson::dom::element_type::ARRAY: {
      list xs;
      auto lst = elem.get_array();
      xs.reserve(lst.size());
      for (const auto& element : lst) {
        auto x = parse(element, depth + 1);
        if (not x)
          return std::move(x.error());
        xs.push_back(std::move(*x));
      }
      return data{std::move(xs)};
    }
    case simdjson::dom::element_type::OBJECT: {
      record xs;
      auto obj = elem.get_object();
      xs.reserve(obj.size());
      for (const auto& pair : obj) {
        auto x = parse(pair.value, depth + 1);
        if (not x)
          return std::move(x.error());
        xs.insert_or_assign(std::string{pair.key}, std::move(*x));
      }
      return data{std::move(xs)};
    }
  }
  STANZA_UNREACHABLE();
}

} // namespace

auto from_json(std::string_view x) -> caf::expected<data> {
  auto padded_string = simdjson::padded_string{x};
  simdjson::dom::parser parser;
  simdjson::dom::element doc;
  auto error = parser.parse(padded_string).get(doc);
  if (error)
    return caf::make_error(ec::parse_error,
                           fmt::format("{}", error_message(error)));
  try {
    return parse(doc);
  } catch (const simdjson::simdjson_error& e) {
    return caf::make_error(ec::parse_error, fmt::format("{}", e.what()));
  }
}

auto to_json(const data& x) -> std::string {
  return to_string(x);
}

// -- YAML --------------------------------------------------------------------

namespace {

template <class T>
auto parse_number(std::string_view str) -> std::optional<T> {
  auto result = T{};
  const auto* end = str.data() + str.size();
  auto [ptr, err] = std::from_chars(str.data(), end, result);
  if (err != std::errc{} || ptr != end)
    return std::nullopt;
  return result;
}

/// Infers the type of a plain YAML scalar. Quoted scalars stay strings.
data parse_scalar(const YAML::Node& node) {
  auto str = node.as<std::string>();
  if (node.Tag() == "!")
    return str;
  if (str == "true" || str == "True" || str == "TRUE")
    return true;
  if (str == "false" || str == "False" || str == "FALSE")
    return false;
  auto digits = std::string_view{str};
  if (not digits.empty() && digits.front() == '+')
    digits.remove_prefix(1);
  if (auto x = parse_number<int64_t>(digits))
    return *x;
  if (auto x = parse_number<uint64_t>(digits))
    return *x;
  if (str.find_first_of(".eE") != std::string::npos)
    if (auto x = parse_number<double>(digits))
      return *x;
  return str;
}

auto parse(const YAML::Node& node, size_t depth = 0) -> caf::expected<data> {
  if (depth > defaults::max_recursion)
    return recursion_limit_error();
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return data{};
    case YAML::NodeType::Scalar:
      return parse_scalar(node);
    case YAML::NodeType::Sequence: {
      list xs;
      xs.reserve(node.size());
      for (const auto& element : node) {
        auto x = parse(element, depth + 1);
        if (not x)
          return std::move(x.error());
        xs.push_back(std::move(*x));
      }
      return data{std::move(xs)};
    }
    case YAML::NodeType::Map: {
      record xs;
      xs.reserve(node.size());
      for (const auto& pair : node) {
        auto x = parse(pair.second, depth + 1);
        if (not x)
          return std::move(x.error());
        xs.insert_or_assign(pair.first.as<std::string>(), std::move(*x));
      }
      return data{std::move(xs)};
    }
  }
  STANZA_UNREACHABLE();
}

} // namespace

auto from_yaml(std::string_view str) -> caf::expected<data> {
  try {
    auto node = YAML::Load(std::string{str});
    return parse(node);
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse YAML at line {} column "
                                       "{}: {}",
                                       e.mark.line, e.mark.column, e.msg));
  }
}

auto load_yaml(const std::filesystem::path& file) -> caf::expected<data> {
  auto in = std::ifstream{file};
  if (not in) {
    auto err = std::error_code{};
    if (not std::filesystem::exists(file, err))
      return caf::make_error(ec::no_such_file,
                             fmt::format("{} does not exist", file.string()));
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {}", file.string()));
  }
  auto buffer = std::stringstream{};
  buffer << in.rdbuf();
  auto yaml = from_yaml(buffer.str());
  if (not yaml)
    return add_context(yaml.error(), "failed to load YAML file {}",
                       file.string());
  return yaml;
}

namespace {

void print(YAML::Emitter& out, const data& x) {
  auto f = detail::overload{
    [&out](caf::none_t) {
      out << YAML::Null;
    },
    [&out](bool x) {
      out << (x ? "true" : "false");
    },
    [&out](int64_t x) {
      out << x;
    },
    [&out](uint64_t x) {
      out << x;
    },
    [&out](double x) {
      out << to_string(data{x});
    },
    [&out](const std::string& x) {
      out << x;
    },
    [&out](const list& xs) {
      out << YAML::BeginSeq;
      for (const auto& x : xs)
        print(out, x);
      out << YAML::EndSeq;
    },
    [&out](const record& xs) {
      out << YAML::BeginMap;
      for (const auto& [k, v] : xs) {
        out << YAML::Key << k << YAML::Value;
        print(out, v);
      }
      out << YAML::EndMap;
    },
  };
  std::visit(f, x.get_data());
}

} // namespace

auto to_yaml(const data& x) -> caf::expected<std::string> {
  YAML::Emitter out;
  out.SetOutputCharset(YAML::EscapeNonAscii); // restrict to ASCII output
  out.SetIndent(2);
  print(out, x);
  if (out.good())
    return std::string{out.c_str(), out.size()};
  return caf::make_error(ec::print_error, out.GetLastError());
}

} // namespace stanza
