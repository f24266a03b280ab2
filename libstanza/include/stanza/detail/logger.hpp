//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/aliases.hpp"

#include <spdlog/spdlog.h>

#include <memory>

// Swallows the arguments of a compiled-out log statement without evaluating
// them.
#define STANZA_DISCARD_ARGS(...)                                               \
  do {                                                                         \
    if (false) {                                                               \
      [[maybe_unused]] auto stanza_discarded_args_ = [&] {                     \
        return ::fmt::format(__VA_ARGS__);                                     \
      };                                                                       \
    }                                                                          \
  } while (false)

namespace stanza::detail {

/// The process-wide logger. Writes to a null sink until
/// `create_log_context` replaces it.
std::shared_ptr<spdlog::logger>& logger();

/// Sets up the console sink from the given configuration.
/// @returns `false` on invalid configuration or if logging is already up.
bool setup_spdlog(const record& cfg);

/// Flushes and tears down all loggers.
void shutdown_spdlog();

} // namespace stanza::detail
