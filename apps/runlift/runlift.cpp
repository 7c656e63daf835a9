// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// runlift - uploads finished acquisition runs to S3 and tracks their state

#include <exception>
#include <iostream>

#include <runlift_log_init.hpp>

#include "commands.hpp"

/**
 * Main entry point for runlift
 */
int main(int argc, char* argv[]) {
  runlift::logging::init_logging_default();

  int exit_code = runlift::app::EXIT_SETUP_FAILURE;
  try {
    runlift::app::Commands commands;
    exit_code = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
  }

  runlift::logging::shutdown_logging();
  return exit_code;
}
