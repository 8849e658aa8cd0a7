#pragma once
#include "treesnap/config.hpp"
#include "treesnap/fs.hpp"
#include "treesnap/hash.hpp"
#include "treesnap/mirror.hpp"
#include "treesnap/snapshotter.hpp"

#include <iosfwd>
#include <memory>

namespace treesnap::cli {

// Services shared by all commands of one process.
struct Session {
  explicit Session(const Config &config);

  Config config;
  DefaultFileHasher hasher;
  DefaultFileSystem file_system;
  FileSystemMirror mirror;
  FileSystemSnapshotter snapshotter;
};

void init_session(const Config &config);
Session &session();

// Indented listing: "D name/", "F name <digest>", "M name (missing)".
void print_snapshot(std::ostream &os, const LocationSnapshot &snapshot);
void print_snapshot(std::ostream &os, const FileSystemSnapshot &snapshot);

} // namespace treesnap::cli
