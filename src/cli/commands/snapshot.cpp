#include "cli/session.hpp"

#include <exception>
#include <iostream>

int cmd_snapshot(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: treesnap snapshot <path> [<path> ...]\n";
    return 2;
  }
  auto &s = treesnap::cli::session();
  try {
    for (int i = 1; i < argc; ++i) {
      const auto snap = s.snapshotter.snapshot(argv[i]);
      std::cout << snap->absolute_path() << "\n";
      treesnap::cli::print_snapshot(std::cout, *snap);
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "snapshot: " << e.what() << "\n";
    return 1;
  }
}
