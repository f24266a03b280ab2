//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/detail/assert.hpp"

#include "stanza/config.hpp"
#include "stanza/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace stanza::detail {

void panic_impl(std::string message, std::source_location source) {
  STANZA_ERROR("panic: {}", message);
  STANZA_ERROR("version: {}", version::version);
  STANZA_ERROR("source: {}:{}", source.file_name(), source.line());
  STANZA_ERROR("this is a bug, we would appreciate a report - thank you!");
  if (const auto* e = std::getenv("STANZA_ABORT_ON_PANIC");
      e && not std::string_view{e}.empty() && std::string_view{e} != "0") {
    // Wait until `spdlog` flushed the logs.
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    std::_Exit(1);
  }
  message += fmt::format(" @ {}:{}", source.file_name(), source.line());
  throw std::runtime_error(message);
}

void fail_assertion_impl(const char* expr, std::string_view explanation,
                         std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (not explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace stanza::detail
