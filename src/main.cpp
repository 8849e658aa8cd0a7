#include "cli/registry.hpp"
#include "cli/session.hpp"

#include "treesnap/config.hpp"
#include "treesnap/consts.hpp"
#include "treesnap/log.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char **argv) {
  treesnap::cli::register_all_commands(); // defined in register_commands.cpp

  treesnap::cli::GlobalOptions options{.config_file = treesnap::consts::kConfigFile};
  int i = 0;
  try {
    i = treesnap::cli::parse_global_options(argc, argv, options);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    treesnap::cli::print_usage();
    return 2;
  }

  if (i >= argc) {
    treesnap::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[i];

  const auto fn = treesnap::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    treesnap::cli::print_usage();
    return 2;
  }

  try {
    auto config = treesnap::load_config(options.config_file);
    if (options.verbose) {
      config.log_level = treesnap::LogLevel::VERBOSE;
    }
    treesnap::log::set_level(config.log_level);
    treesnap::cli::init_session(config);
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }

  // Pass the subcommand and everything after it to the handler
  return fn(argc - i, argv + i);
}
