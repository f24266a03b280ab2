//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/logger.hpp"

#include "stanza/data.hpp"
#include "stanza/test/test.hpp"

using namespace stanza;

TEST("log levels from strings") {
  CHECK_EQUAL(loglevel_to_int("quiet"), STANZA_LOG_LEVEL_QUIET);
  CHECK_EQUAL(loglevel_to_int("WARNING"), STANZA_LOG_LEVEL_WARNING);
  CHECK_EQUAL(loglevel_to_int("verbose"), STANZA_LOG_LEVEL_VERBOSE);
  CHECK_EQUAL(loglevel_to_int("trace"), STANZA_LOG_LEVEL_TRACE);
  CHECK_EQUAL(loglevel_to_int("loud", -1), -1);
}

TEST("the test runner owns the log context") {
  // The test runner set up logging before running the tests.
  CHECK_NOT_EQUAL(detail::logger()->name(), "/dev/null");
  auto cfg = record{
    {"stanza", record{{"console-verbosity", "debug"}}},
  };
  auto guard = create_log_context(cfg);
  REQUIRE(not guard);
  CHECK_EQUAL(guard.error(), ec::invalid_configuration);
}

TEST("log statements accept format arguments") {
  STANZA_DEBUG("debug message {}", 42);
  STANZA_VERBOSE("verbose message {}", data{"x"});
  STANZA_INFO("info message {}", "text");
  CHECK(detail::logger() != nullptr);
}
