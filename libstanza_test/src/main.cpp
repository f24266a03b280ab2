//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "stanza/data.hpp"
#include "stanza/fwd.hpp"
#include "stanza/logger.hpp"
#include "stanza/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>
#include <caf/test/runner.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>

namespace stanza::test {

extern std::set<std::string> config;

} // namespace stanza::test

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  // Parse everything after after '--'.
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end)
    return {};
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  ::setenv("STANZA_ABORT_ON_PANIC", "1", 1);
  std::string stanza_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(stanza_loglevel, "stanza-verbosity",
                          "console verbosity for libstanza")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
    stanza::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  caf::init_global_meta_objects<caf::id_block::stanza_types>();
  caf::core::init_global_meta_objects();
  auto log_settings = stanza::record{
    {"stanza",
     stanza::record{
       {"console-verbosity", stanza_loglevel},
       {"console-format", "%^[%s:%#] %v%$"},
     }},
  };
  auto log_context = stanza::create_log_context(log_settings);
  if (!log_context) {
    fmt::print(stderr, "failed to set up logging: {}\n", log_context.error());
    return EXIT_FAILURE;
  }
  // Run the unit tests.
  caf::test::runner runner;
  return runner.run(argc, argv);
}
