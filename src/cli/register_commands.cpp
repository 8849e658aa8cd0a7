#include "cli/registry.hpp"

int cmd_snapshot(int argc, char **argv);
int cmd_tree(int argc, char **argv);
int cmd_files(int, char **);
int cmd_run(int, char **);

namespace treesnap::cli {

void register_all_commands() {
  register_command("snapshot", ::cmd_snapshot, "Snapshot paths: treesnap snapshot <path>...");
  register_command("tree", ::cmd_tree,
                   "Snapshot a directory tree: treesnap tree <dir> [--include <glob>]...");
  register_command("files", ::cmd_files, "Snapshot a set of paths: treesnap files <path>...");
  register_command("run", ::cmd_run,
                   "Run a command, report if it changed <dir>: treesnap run <dir> -- <command...>");
}

} // namespace treesnap::cli
