//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <string_view>

namespace stanza::defaults {

// -- global constants ---------------------------------------------------------

/// Maximum depth in recursive function calls before bailing out.
/// Note: the value must be > 0.
inline constexpr size_t max_recursion = 100;

// -- constants for entry operators --------------------------------------------

namespace entry_operator {

/// What to do with an entry when an operator fails on it.
inline constexpr std::string_view on_error = "send";

} // namespace entry_operator

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Log format for console output.
inline constexpr const char* console_format = "%^[%T.%e] %v%$";

/// Verbosity for writing to console.
inline constexpr const char* console_verbosity = "info";

/// Color mode of the console sink.
inline constexpr const char* console = "automatic";

/// Size of the queue of the asynchronous logger.
inline constexpr size_t queue_size = 100;

/// Number of threads draining the queue of the asynchronous logger.
inline constexpr size_t logger_threads = 1;

} // namespace logger

} // namespace stanza::defaults
