//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/fwd.hpp"

#include "stanza/aliases.hpp"
#include "stanza/data.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace stanza {

/// What happens to an entry when an operator fails on it.
enum class on_error_policy : uint8_t {
  /// Log a warning and pass the entry on.
  send,
  /// Log at debug level and discard the entry.
  drop,
};

/// @relates on_error_policy
auto to_string(on_error_policy x) -> std::string_view;

/// @relates on_error_policy
auto from_string(std::string_view str, on_error_policy& x) -> bool;

/// A pipeline operator that rewrites entries in place.
class entry_operator {
public:
  explicit entry_operator(on_error_policy on_error) : on_error_{on_error} {
    // nop
  }

  virtual ~entry_operator() = default;

  /// Applies the operator to an entry.
  [[nodiscard]] virtual caf::error apply(entry& e) const = 0;

  /// The name is how the operator is addressed in a configuration.
  [[nodiscard]] virtual const char* name() const = 0;

  [[nodiscard]] on_error_policy on_error() const {
    return on_error_;
  }

private:
  on_error_policy on_error_;
};

using entry_operator_ptr = std::unique_ptr<entry_operator>;

/// Creates an operator from its configuration, e.g.:
///
///     type: move
///     from: attributes.uuid
///     to: resource.uuid
///     on_error: drop
///
/// @returns The operator, or an `ec::invalid_configuration` error naming the
/// offending option.
caf::expected<entry_operator_ptr> make_entry_operator(const record& config);

/// A chain of operators that every entry passes in order.
class transformer {
public:
  transformer() = default;

  explicit transformer(std::vector<entry_operator_ptr> operators);

  /// Runs all operators on an entry.
  /// @returns Whether the entry continues down the pipeline.
  bool process(entry& e) const;

  [[nodiscard]] const std::vector<entry_operator_ptr>& operators() const {
    return operators_;
  }

private:
  std::vector<entry_operator_ptr> operators_ = {};
};

/// Creates a transformer from a list of operator configurations.
caf::expected<transformer> make_transformer(const data& config);

} // namespace stanza
