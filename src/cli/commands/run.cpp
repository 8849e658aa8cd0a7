#include "cli/session.hpp"

#include "treesnap/command_work.hpp"
#include "treesnap/errors.hpp"
#include "treesnap/execute.hpp"

#include <iostream>
#include <string>

int cmd_run(int argc, char **argv) {
  if (argc < 4 || std::string(argv[2]) != "--") {
    std::cerr << "usage: treesnap run <dir> -- <command...>\n";
    return 2;
  }
  std::string command;
  for (int i = 3; i < argc; ++i) {
    if (!command.empty())
      command.push_back(' ');
    command += argv[i];
  }

  auto &s = treesnap::cli::session();
  treesnap::BuildCancellationToken token;
  treesnap::ShellCommandWork work{command, argv[1], s.snapshotter, s.mirror, token};
  const treesnap::ExecuteStep step{token};
  const auto result = step.execute(work);

  std::cout << treesnap::outcome_name(result.outcome()) << "\n";
  if (!result.is_success()) {
    std::cerr << "run: " << treesnap::describe(result.failure()) << "\n";
    return 1;
  }
  return 0;
}
