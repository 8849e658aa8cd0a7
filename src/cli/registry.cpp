#include "cli/registry.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace treesnap::cli {

namespace {

struct Option {
  std::string_view flag;
  std::string_view value; // empty for switches
  std::string_view help;
};

constexpr Option kGlobalOptions[] = {
    {"--config", "<file>", "read settings from <file> instead of ./.treesnap"},
    {"--verbose", "", "log cache activity (log-level: extra)"},
};

struct Command {
  std::string name;
  command_fn fn;
  std::string help;
};

// Kept in registration order so usage lists commands as registered.
std::vector<Command> &commands() {
  static std::vector<Command> all;
  return all;
}

} // namespace

int parse_global_options(int argc, char **argv, GlobalOptions &options) {
  int i = 1;
  for (; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        throw std::invalid_argument("--config needs a file");
      }
      options.config_file = argv[++i];
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else {
      break;
    }
  }
  return i;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  for (auto &c : commands()) {
    if (c.name == name) {
      c.fn = fn;
      c.help = help;
      return;
    }
  }
  commands().push_back(Command{.name = name, .fn = fn, .help = help});
}

command_fn find_command(const std::string &name) {
  for (const auto &c : commands()) {
    if (c.name == name)
      return c.fn;
  }
  return nullptr;
}

void print_usage() {
  std::cerr << "usage: treesnap [options] <command> [args]\n\noptions:\n";
  for (const auto &o : kGlobalOptions) {
    std::string usage{o.flag};
    if (!o.value.empty()) {
      usage.append(" ").append(o.value);
    }
    std::cerr << "  " << usage << std::string(usage.size() < 18 ? 18 - usage.size() : 1, ' ')
              << o.help << "\n";
  }
  std::cerr << "\ncommands:\n";
  for (const auto &c : commands()) {
    std::cerr << "  " << c.name << std::string(c.name.size() < 10 ? 10 - c.name.size() : 1, ' ')
              << c.help << "\n";
  }
}

} // namespace treesnap::cli
