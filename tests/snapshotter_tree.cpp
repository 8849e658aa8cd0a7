#include "treesnap/fs.hpp"
#include "treesnap/hash.hpp"
#include "treesnap/mirror.hpp"
#include "treesnap/snapshotter.hpp"
#include "treesnap/visitor.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using treesnap::DirectoryTree;
using treesnap::FileSystemSnapshot;
using treesnap::LocationSnapshot;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::pair<std::optional<std::string>, int> snapshot_info(const FileSystemSnapshot &tree) {
  std::optional<std::string> root_path;
  int count = 0;
  treesnap::CallbackVisitor v;
  v.on_pre_visit_directory = [&](const LocationSnapshot &d) {
    if (!root_path)
      root_path = d.absolute_path();
    ++count;
    return true;
  };
  v.on_visit_file = [&](const LocationSnapshot &) { ++count; };
  treesnap::accept(tree, v);
  return {root_path, count};
}

// Paths below the root, for every file and directory.
class RelativePathCollector : public treesnap::RelativePathVisitor {
public:
  std::set<std::string> paths;

  bool pre_visit_directory(const LocationSnapshot & /*dir*/,
                           const treesnap::RelativePath &path) override {
    if (path.size() > 1)
      paths.insert(path.join(1));
    return true;
  }
  void visit_file(const LocationSnapshot & /*file*/, const treesnap::RelativePath &path) override {
    paths.insert(path.join(1));
  }
};

static bool ends_in_1(std::string_view relative_path) {
  return !relative_path.empty() && relative_path.back() == '1';
}

static std::pair<std::optional<std::string>, int> info(const fs::path &root, int count) {
  return {root.string(), count};
}

int main() {
  const fs::path root = treesnap::fs::canonical_path(
      fs::temp_directory_path() / ("treesnap_tree_" + std::to_string(std::random_device{}())));
  fs::create_directories(root);

  try {
    const treesnap::DefaultFileHasher hasher;
    const treesnap::DefaultFileSystem file_system;

    // 1) Unfiltered trees share the cache entry of the directory
    {
      treesnap::FileSystemMirror mirror;
      const treesnap::FileSystemSnapshotter snapshotter{hasher, file_system, mirror};
      const auto d = root / "plain";
      write_file(d / "f1", "1");
      write_file(d / "d1" / "f2", "2");
      fs::create_directories(d / "d2");
      const DirectoryTree tree{.root = d, .filter = {}};

      const auto snapshot = snapshotter.snapshot_directory_tree(tree);
      if (snapshot_info(snapshot) != info(d, 5)) {
        std::cerr << "unfiltered tree should count 5\n";
        return 1;
      }
      const auto snapshot2 = snapshotter.snapshot_directory_tree(tree);
      const auto snapshot3 = snapshotter.snapshot_directory_tree(DirectoryTree{.root = d, .filter = {}});
      if (snapshot2.roots().front() != snapshot.roots().front() ||
          snapshot3.roots().front() != snapshot.roots().front() ||
          snapshotter.snapshot(d) != snapshot.roots().front()) {
        std::cerr << "unfiltered tree snapshots should be the cached directory\n";
        return 1;
      }
    }

    // 2) Filtered trees are derived every time and never cached
    {
      treesnap::FileSystemMirror mirror;
      const treesnap::FileSystemSnapshotter snapshotter{hasher, file_system, mirror};
      const auto d = root / "filtered";
      write_file(d / "f1", "1");
      write_file(d / "d1" / "f2", "2");
      write_file(d / "d1" / "f1", "3");
      write_file(d / "d2" / "f1", "4");
      write_file(d / "d2" / "f2", "5");
      const DirectoryTree tree{.root = d, .filter = ends_in_1};

      const auto snapshot = snapshotter.snapshot_directory_tree(tree);
      if (snapshot_info(snapshot) != info(d, 6)) {
        std::cerr << "filtered tree should count 6\n";
        return 1;
      }
      const auto snapshot2 = snapshotter.snapshot_directory_tree(tree);
      if (snapshot2.roots().front() == snapshot.roots().front()) {
        std::cerr << "filtered trees must not be reused\n";
        return 1;
      }
      const auto snapshot3 = snapshotter.snapshot_directory_tree(DirectoryTree{.root = d, .filter = {}});
      if (snapshot3.roots().front() == snapshot.roots().front() ||
          snapshot_info(snapshot3) != info(d, 8)) {
        std::cerr << "unfiltered tree after a filtered one should be complete\n";
        return 1;
      }
      const auto snapshot4 = snapshotter.snapshot_directory_tree(DirectoryTree{.root = d, .filter = {}});
      if (snapshot4.roots().front() != snapshot3.roots().front()) {
        std::cerr << "complete tree should be reused\n";
        return 1;
      }
      // Entry cached for the root is the complete one
      if (mirror.get(d.string()) != snapshot3.roots().front()) {
        std::cerr << "filtered view leaked into the mirror\n";
        return 1;
      }
    }

    // 3) Filtered tree reuses a previously captured unfiltered tree
    {
      treesnap::FileSystemMirror mirror;
      const treesnap::FileSystemSnapshotter snapshotter{hasher, file_system, mirror};
      const auto d = root / "reuse";
      write_file(d / "f1", "1");
      write_file(d / "d1" / "f2", "2");
      write_file(d / "d1" / "f1", "3");
      const auto complete = snapshotter.snapshot_directory_tree(DirectoryTree{.root = d, .filter = {}});

      // Disk changes after capture are invisible: the cached state is used
      write_file(d / "late1", "4");

      const auto filtered = snapshotter.snapshot_directory_tree(DirectoryTree{.root = d, .filter = ends_in_1});
      RelativePathCollector collector;
      treesnap::RelativePathTrackingVisitor tracking{collector};
      treesnap::accept(filtered, tracking);
      if (collector.paths != std::set<std::string>{"d1", "d1/f1", "f1"}) {
        std::cerr << "filtered tree did not use cached state\n";
        for (const auto &p : collector.paths)
          std::cerr << "  " << p << "\n";
        return 1;
      }
      // Matching leaves are shared with the cached tree
      const auto &cached_f1 = complete.roots().front()->children().back();
      const auto &filtered_f1 = filtered.roots().front()->children().back();
      if (cached_f1->name() != "f1" || filtered_f1 != cached_f1) {
        std::cerr << "filtered view should share unchanged leaves\n";
        return 1;
      }
    }

    // 4) Nothing matches: empty, rootless result
    {
      treesnap::FileSystemMirror mirror;
      const treesnap::FileSystemSnapshotter snapshotter{hasher, file_system, mirror};
      const auto d = root / "nomatch";
      write_file(d / "a", "a");
      const auto filtered = snapshotter.snapshot_directory_tree(
          DirectoryTree{.root = d, .filter = [](std::string_view) { return false; }});
      if (!filtered.empty() || filtered.root_path()) {
        std::cerr << "no matches should yield an empty tree\n";
        return 1;
      }
    }

    // 5) Non-existing directory
    {
      treesnap::FileSystemMirror mirror;
      const treesnap::FileSystemSnapshotter snapshotter{hasher, file_system, mirror};
      const auto snapshot = snapshotter.snapshot_directory_tree(DirectoryTree{.root = root / "dir", .filter = {}});
      if (snapshot_info(snapshot) != std::make_pair(std::optional<std::string>{}, 0)) {
        std::cerr << "non-existing directory should be empty and rootless\n";
        return 1;
      }
      const auto filtered = snapshotter.snapshot_directory_tree(DirectoryTree{.root = root / "dir", .filter = ends_in_1});
      if (!filtered.empty()) {
        std::cerr << "filtered non-existing directory should be empty\n";
        return 1;
      }
    }

    // 6) File used as a directory tree
    {
      treesnap::FileSystemMirror mirror;
      const treesnap::FileSystemSnapshotter snapshotter{hasher, file_system, mirror};
      const auto f = root / "fileAsTree";
      write_file(f, "x");
      const auto snapshot = snapshotter.snapshot_directory_tree(DirectoryTree{.root = f, .filter = {}});
      if (snapshot_info(snapshot) != std::make_pair(std::optional<std::string>{}, 1)) {
        std::cerr << "file as tree should be one rootless entry\n";
        return 1;
      }
      bool ok = true;
      treesnap::CallbackVisitor v;
      v.on_pre_visit_directory = [&](const LocationSnapshot &) {
        ok = false;
        return true;
      };
      v.on_post_visit_directory = [&](const LocationSnapshot &) { ok = false; };
      v.on_visit_file = [&](const LocationSnapshot &file) {
        ok = ok && file.absolute_path() == f.string() && file.name() == "fileAsTree";
      };
      treesnap::accept(snapshot, v);
      if (!ok || snapshot.roots().front() != snapshotter.snapshot(f)) {
        std::cerr << "file as tree should hold the cached file snapshot only\n";
        return 1;
      }
      // With a filter the file is matched by its own name
      const auto kept = snapshotter.snapshot_directory_tree(
          DirectoryTree{.root = f, .filter = [](std::string_view p) { return p == "fileAsTree"; }});
      const auto dropped = snapshotter.snapshot_directory_tree(DirectoryTree{.root = f, .filter = ends_in_1});
      if (kept.roots().size() != 1 || !dropped.empty()) {
        std::cerr << "filtered file as tree mismatch\n";
        return 1;
      }
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
