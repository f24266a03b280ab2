//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/aliases.hpp"
#include "stanza/config.hpp"
#include "stanza/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>

#include <string>

// STANZA_ERROR -> spdlog::err
// STANZA_WARN -> spdlog::warn
// STANZA_INFO -> spdlog::info
// STANZA_VERBOSE -> spdlog::debug
// STANZA_DEBUG -> spdlog::trace
// STANZA_TRACE -> spdlog::trace

#if STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif STANZA_LOG_LEVEL == STANZA_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include "stanza/detail/logger.hpp"

#if STANZA_LOG_LEVEL >= STANZA_LOG_LEVEL_TRACE

#  define STANZA_TRACE(...)                                                    \
    SPDLOG_LOGGER_TRACE(::stanza::detail::logger(), __VA_ARGS__)

#else // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_TRACE

#  define STANZA_TRACE(...) STANZA_DISCARD_ARGS(__VA_ARGS__)

#endif // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_TRACE

#if STANZA_LOG_LEVEL >= STANZA_LOG_LEVEL_DEBUG

#  define STANZA_DEBUG(...)                                                    \
    SPDLOG_LOGGER_TRACE(::stanza::detail::logger(), __VA_ARGS__)

#else // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_DEBUG

#  define STANZA_DEBUG(...) STANZA_DISCARD_ARGS(__VA_ARGS__)

#endif // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_DEBUG

#if STANZA_LOG_LEVEL >= STANZA_LOG_LEVEL_VERBOSE

#  define STANZA_VERBOSE(...)                                                  \
    SPDLOG_LOGGER_DEBUG(::stanza::detail::logger(), __VA_ARGS__)

#else // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_VERBOSE

#  define STANZA_VERBOSE(...) STANZA_DISCARD_ARGS(__VA_ARGS__)

#endif // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_VERBOSE

#if STANZA_LOG_LEVEL >= STANZA_LOG_LEVEL_INFO

#  define STANZA_INFO(...)                                                     \
    SPDLOG_LOGGER_INFO(::stanza::detail::logger(), __VA_ARGS__)

#else // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_INFO

#  define STANZA_INFO(...) STANZA_DISCARD_ARGS(__VA_ARGS__)

#endif // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_INFO

#if STANZA_LOG_LEVEL >= STANZA_LOG_LEVEL_WARNING

#  define STANZA_WARN(...)                                                     \
    SPDLOG_LOGGER_WARN(::stanza::detail::logger(), __VA_ARGS__)

#else // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_WARNING

#  define STANZA_WARN(...) STANZA_DISCARD_ARGS(__VA_ARGS__)

#endif // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_WARNING

#if STANZA_LOG_LEVEL >= STANZA_LOG_LEVEL_ERROR

#  define STANZA_ERROR(...)                                                    \
    SPDLOG_LOGGER_ERROR(::stanza::detail::logger(), __VA_ARGS__)

#else // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_ERROR

#  define STANZA_ERROR(...) STANZA_DISCARD_ARGS(__VA_ARGS__)

#endif // STANZA_LOG_LEVEL < STANZA_LOG_LEVEL_ERROR

namespace stanza {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to make log level strings from config, like 'debug', to a log level int.
int loglevel_to_int(std::string c, int default_value = STANZA_LOG_LEVEL_QUIET);

/// Replaces the null logger with a console logger configured from the
/// `stanza.console-verbosity`, `stanza.console-format` and `stanza.console`
/// options of *cfg*. The returned guard shuts logging down when destroyed.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const record& cfg);

} // namespace stanza
