//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/fwd.hpp"

#include "stanza/detail/stable_map.hpp"

#include <string>
#include <vector>

namespace stanza {

/// A random-access sequence of data.
using list = std::vector<data>;

/// Maps field names to data elements.
using record = detail::stable_map<std::string, data>;

} // namespace stanza
