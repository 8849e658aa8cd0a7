#include "cli/session.hpp"

#include <exception>
#include <iostream>

int cmd_files(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: treesnap files <path> [<path> ...]\n";
    return 2;
  }

  treesnap::CompositeTree composite;
  for (int i = 1; i < argc; ++i) {
    composite.elements.emplace_back(std::filesystem::path(argv[i]));
  }

  try {
    const auto snap = treesnap::cli::session().snapshotter.snapshot(composite);
    if (!snap) {
      std::cout << "(nothing)\n";
      return 0;
    }
    treesnap::cli::print_snapshot(std::cout, *snap);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "files: " << e.what() << "\n";
    return 1;
  }
}
