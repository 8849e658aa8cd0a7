#pragma once
#include "cli/command.hpp"

#include <filesystem>
#include <string>

namespace treesnap::cli {

// Options accepted before the command name.
struct GlobalOptions {
  std::filesystem::path config_file;
  bool verbose = false;
};

// Consumes leading global options from argv[1..] into `options`.
// Returns the index of the command name (argc when there is none).
// Throws std::invalid_argument for an option missing its value.
int parse_global_options(int argc, char **argv, GlobalOptions &options);

void register_command(const std::string &name, command_fn fn, const std::string &help);
[[nodiscard]] command_fn find_command(const std::string &name);
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

} // namespace treesnap::cli
