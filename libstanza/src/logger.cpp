//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/logger.hpp"

#include "stanza/config.hpp"
#include "stanza/data.hpp"
#include "stanza/defaults.hpp"
#include "stanza/detail/assert.hpp"

#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <cctype>
#include <iostream>
#include <memory>
#include <optional>

namespace stanza {

caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const record& cfg) {
  if (!stanza::detail::setup_spdlog(cfg))
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up the logger");
  return {caf::detail::make_scope_guard(
    std::addressof(stanza::detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return STANZA_LOG_LEVEL_QUIET;
  if (x == "error")
    return STANZA_LOG_LEVEL_ERROR;
  if (x == "warning")
    return STANZA_LOG_LEVEL_WARNING;
  if (x == "info")
    return STANZA_LOG_LEVEL_INFO;
  if (x == "verbose")
    return STANZA_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return STANZA_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return STANZA_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

/// Converts a stanza log level to spdlog level
spdlog::level::level_enum stanza_loglevel_to_spd(const int value) {
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case STANZA_LOG_LEVEL_QUIET:
      break;
    case STANZA_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case STANZA_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case STANZA_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case STANZA_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case STANZA_LOG_LEVEL_DEBUG:
      level = spdlog::level::trace;
      break;
    case STANZA_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      STANZA_ASSERT(false, "unhandled log level");
  }
  return level;
}

} // namespace

namespace detail {

bool setup_spdlog(const record& cfg) try {
  if (stanza::detail::logger()->name() != "/dev/null") {
    STANZA_ERROR("Log already up");
    return false;
  }
  std::string console_verbosity = stanza::defaults::logger::console_verbosity;
  auto cfg_console_verbosity
    = get_if<std::string>(&cfg, "stanza.console-verbosity");
  if (cfg_console_verbosity) {
    if (loglevel_to_int(*cfg_console_verbosity, -1) < 0) {
      fmt::print(stderr,
                 "failed to start logger; stanza.console-verbosity '{}' is "
                 "invalid\n",
                 *cfg_console_verbosity);
      return false;
    } else {
      console_verbosity = *cfg_console_verbosity;
    }
  }
  auto stanza_console_verbosity = loglevel_to_int(console_verbosity);
  // Helper to set the color mode
  auto log_color = [&]() -> std::optional<spdlog::color_mode> {
    auto config_value
      = get_or(cfg, "stanza.console", stanza::defaults::logger::console);
    if (config_value == "automatic")
      return spdlog::color_mode::automatic;
    if (config_value == "always")
      return spdlog::color_mode::always;
    if (config_value == "never")
      return spdlog::color_mode::never;
    fmt::print(stderr,
               "failed to start logger; stanza.console '{}' is invalid "
               "(expected 'automatic', 'always', or 'never')\n",
               config_value);
    return std::nullopt;
  }();
  if (!log_color)
    return false;
  spdlog::init_thread_pool(defaults::logger::queue_size,
                           defaults::logger::logger_threads);
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(*log_color);
  auto console_format = std::string{get_or(
    cfg, "stanza.console-format", stanza::defaults::logger::console_format)};
  console_sink->set_pattern(console_format);
  console_sink->set_level(stanza_loglevel_to_spd(stanza_console_verbosity));
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "stanza", std::move(console_sink), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(stanza_loglevel_to_spd(stanza_console_verbosity));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  std::cerr << err.what() << "\n";
  return false;
}

void shutdown_spdlog() {
  STANZA_DEBUG("shut down logging");
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> stanza_logger
    = spdlog::async_factory::template create<spdlog::sinks::null_sink_mt>(
      "/dev/null");
  return stanza_logger;
}

} // namespace detail
} // namespace stanza
