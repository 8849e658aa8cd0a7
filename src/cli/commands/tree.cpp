#include "cli/session.hpp"

#include <exception>
#include <fnmatch.h>
#include <iostream>
#include <string>
#include <vector>

int cmd_tree(int argc, char **argv) {
  std::string root;
  std::vector<std::string> includes;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--include" && i + 1 < argc) {
      includes.emplace_back(argv[++i]);
    } else if (root.empty()) {
      root = arg;
    } else {
      root.clear();
      break;
    }
  }
  if (root.empty()) {
    std::cerr << "usage: treesnap tree <dir> [--include <glob>]...\n";
    return 2;
  }

  treesnap::DirectoryTree tree{.root = root, .filter = {}};
  if (!includes.empty()) {
    // '*' also crosses '/', so "*.h" matches at any depth
    tree.filter = [includes](std::string_view relative_path) {
      const std::string path(relative_path);
      for (const auto &pattern : includes) {
        if (::fnmatch(pattern.c_str(), path.c_str(), 0) == 0)
          return true;
      }
      return false;
    };
  }

  try {
    const auto snap = treesnap::cli::session().snapshotter.snapshot_directory_tree(tree);
    treesnap::cli::print_snapshot(std::cout, snap);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "tree: " << e.what() << "\n";
    return 1;
  }
}
