//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/entry_operator.hpp"

#include "stanza/defaults.hpp"
#include "stanza/entry.hpp"
#include "stanza/error.hpp"
#include "stanza/field.hpp"
#include "stanza/logger.hpp"
#include "stanza/tree.hpp"

#include <algorithm>
#include <utility>

namespace stanza {

namespace {

// -- operators ----------------------------------------------------------------

class add_operator final : public entry_operator {
public:
  add_operator(on_error_policy on_error, field target, data value)
    : entry_operator{on_error},
      field_{std::move(target)},
      value_{std::move(value)} {
    // nop
  }

  caf::error apply(entry& e) const override {
    return field_.set(e, value_);
  }

  const char* name() const override {
    return "add";
  }

private:
  field field_;
  data value_;
};

class copy_operator final : public entry_operator {
public:
  copy_operator(on_error_policy on_error, field from, field to)
    : entry_operator{on_error}, from_{std::move(from)}, to_{std::move(to)} {
    // nop
  }

  caf::error apply(entry& e) const override {
    auto value = from_.get(e);
    if (not value)
      return caf::make_error(ec::lookup_error,
                             fmt::format("cannot copy {}: field does not exist",
                                         from_));
    return to_.set(e, std::move(*value));
  }

  const char* name() const override {
    return "copy";
  }

private:
  field from_;
  field to_;
};

class move_operator final : public entry_operator {
public:
  move_operator(on_error_policy on_error, field from, field to)
    : entry_operator{on_error}, from_{std::move(from)}, to_{std::move(to)} {
    // nop
  }

  caf::error apply(entry& e) const override {
    auto value = from_.erase(e);
    if (not value)
      return caf::make_error(ec::lookup_error,
                             fmt::format("cannot move {}: field does not exist",
                                         from_));
    auto err = to_.set(e, *value);
    if (not err)
      return {};
    // A failed move restores the source.
    if (auto restore_err = from_.set(e, std::move(*value)))
      return add_context(err, "failed to restore {}: {}", from_, restore_err);
    return err;
  }

  const char* name() const override {
    return "move";
  }

private:
  field from_;
  field to_;
};

class remove_operator final : public entry_operator {
public:
  remove_operator(on_error_policy on_error, field target)
    : entry_operator{on_error}, field_{std::move(target)} {
    // nop
  }

  caf::error apply(entry& e) const override {
    if (not field_.erase(e))
      return caf::make_error(ec::lookup_error,
                             fmt::format("cannot remove {}: field does not "
                                         "exist",
                                         field_));
    return {};
  }

  const char* name() const override {
    return "remove";
  }

private:
  field field_;
};

class retain_operator final : public entry_operator {
public:
  retain_operator(on_error_policy on_error, std::vector<field> fields)
    : entry_operator{on_error}, fields_{std::move(fields)} {
    // nop
  }

  caf::error apply(entry& e) const override {
    for (auto kind : {root_kind::body, root_kind::attributes,
                      root_kind::resource}) {
      auto addressed = std::any_of(fields_.begin(), fields_.end(),
                                   [&](const auto& f) {
                                     return f.kind() == kind;
                                   });
      if (not addressed)
        continue;
      auto retained = data{};
      for (const auto& f : fields_) {
        if (f.kind() != kind)
          continue;
        const auto* value = lookup(e.root(kind), f.keys());
        if (not value)
          continue;
        if (auto err = assign(retained, f.keys(), *value, false))
          return add_context(err, "failed to retain {}", f);
      }
      e.root(kind) = std::move(retained);
    }
    return {};
  }

  const char* name() const override {
    return "retain";
  }

private:
  std::vector<field> fields_;
};

// -- configuration ------------------------------------------------------------

auto invalid_option(std::string_view type, std::string_view option,
                    std::string_view reason) -> caf::error {
  return caf::make_error(ec::invalid_configuration,
                         fmt::format("operator '{}' has an invalid option "
                                     "'{}': {}",
                                     type, option, reason));
}

/// Checks that every key of a configuration is a known option.
auto check_options(std::string_view type, const record& config,
                   std::initializer_list<std::string_view> allowed)
  -> caf::error {
  for (const auto& [key, _] : config) {
    if (key == "type" || key == "on_error")
      continue;
    if (std::find(allowed.begin(), allowed.end(), key) == allowed.end())
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("operator '{}' has an unknown option "
                                         "'{}'",
                                         type, key));
  }
  return {};
}

auto required_option(std::string_view type, const record& config,
                     std::string_view option) -> caf::expected<const data*> {
  auto it = config.find(option);
  if (it == config.end())
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("operator '{}' is missing the option "
                                       "'{}'",
                                       type, option));
  return &it->second;
}

auto field_option(std::string_view type, const record& config,
                  std::string_view option) -> caf::expected<field> {
  auto value = required_option(type, config, option);
  if (not value)
    return std::move(value.error());
  auto result = field::from_data(**value);
  if (not result)
    return invalid_option(type, option, render(result.error()));
  return result;
}

} // namespace

auto to_string(on_error_policy x) -> std::string_view {
  switch (x) {
    case on_error_policy::send:
      return "send";
    case on_error_policy::drop:
      return "drop";
  }
  STANZA_UNREACHABLE();
}

auto from_string(std::string_view str, on_error_policy& x) -> bool {
  if (str == "send") {
    x = on_error_policy::send;
    return true;
  }
  if (str == "drop") {
    x = on_error_policy::drop;
    return true;
  }
  return false;
}

caf::expected<entry_operator_ptr> make_entry_operator(const record& config) {
  const auto* type = get_if<std::string>(&config, "type");
  if (not type)
    return caf::make_error(ec::invalid_configuration,
                           "operator configuration requires a string option "
                           "'type'");
  auto on_error = on_error_policy::send;
  auto on_error_str = std::string{defaults::entry_operator::on_error};
  if (auto it = config.find("on_error"); it != config.end()) {
    const auto* str = try_as<std::string>(it->second);
    if (not str)
      return invalid_option(*type, "on_error", "expected a string");
    on_error_str = *str;
  }
  if (not from_string(on_error_str, on_error))
    return invalid_option(*type, "on_error",
                          fmt::format("expected 'send' or 'drop' but got '{}'",
                                      on_error_str));
  if (*type == "add") {
    if (auto err = check_options(*type, config, {"field", "value"}))
      return err;
    auto f = field_option(*type, config, "field");
    if (not f)
      return std::move(f.error());
    auto value = required_option(*type, config, "value");
    if (not value)
      return std::move(value.error());
    return std::make_unique<add_operator>(on_error, std::move(*f), **value);
  }
  if (*type == "copy" || *type == "move") {
    if (auto err = check_options(*type, config, {"from", "to"}))
      return err;
    auto from = field_option(*type, config, "from");
    if (not from)
      return std::move(from.error());
    auto to = field_option(*type, config, "to");
    if (not to)
      return std::move(to.error());
    if (*type == "copy")
      return std::make_unique<copy_operator>(on_error, std::move(*from),
                                             std::move(*to));
    return std::make_unique<move_operator>(on_error, std::move(*from),
                                           std::move(*to));
  }
  if (*type == "remove") {
    if (auto err = check_options(*type, config, {"field"}))
      return err;
    auto f = field_option(*type, config, "field");
    if (not f)
      return std::move(f.error());
    return std::make_unique<remove_operator>(on_error, std::move(*f));
  }
  if (*type == "retain") {
    if (auto err = check_options(*type, config, {"fields"}))
      return err;
    auto value = required_option(*type, config, "fields");
    if (not value)
      return std::move(value.error());
    const auto* xs = try_as<list>(**value);
    if (not xs || xs->empty())
      return invalid_option(*type, "fields", "expected a non-empty list");
    auto fields = std::vector<field>{};
    fields.reserve(xs->size());
    for (const auto& x : *xs) {
      auto f = field::from_data(x);
      if (not f)
        return invalid_option(*type, "fields", render(f.error()));
      fields.push_back(std::move(*f));
    }
    return std::make_unique<retain_operator>(on_error, std::move(fields));
  }
  return caf::make_error(ec::invalid_configuration,
                         fmt::format("unknown operator type '{}'", *type));
}

transformer::transformer(std::vector<entry_operator_ptr> operators)
  : operators_{std::move(operators)} {
  // nop
}

bool transformer::process(entry& e) const {
  for (const auto& op : operators_) {
    auto err = op->apply(e);
    if (not err)
      continue;
    switch (op->on_error()) {
      case on_error_policy::send:
        STANZA_WARN("{} operator failed: {}", op->name(), err);
        break;
      case on_error_policy::drop:
        STANZA_DEBUG("{} operator failed, dropping entry: {}", op->name(),
                     err);
        return false;
    }
  }
  return true;
}

caf::expected<transformer> make_transformer(const data& config) {
  if (is_null(config))
    return transformer{};
  const auto* xs = try_as<list>(config);
  if (not xs)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("expected a list of operators but got "
                                       "a {}",
                                       type_name(config)));
  auto operators = std::vector<entry_operator_ptr>{};
  operators.reserve(xs->size());
  for (size_t i = 0; i < xs->size(); ++i) {
    const auto* op_config = try_as<record>((*xs)[i]);
    if (not op_config)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("operator #{} is not a record", i));
    auto op = make_entry_operator(*op_config);
    if (not op)
      return add_context(op.error(), "in operator #{}", i);
    operators.push_back(std::move(*op));
  }
  return transformer{std::move(operators)};
}

} // namespace stanza
