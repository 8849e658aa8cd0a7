#include "treesnap/snapshotter.hpp"

#include "treesnap/errors.hpp"
#include "treesnap/log.hpp"
#include "treesnap/visitor.hpp"

#include <utility>

namespace stdfs = std::filesystem;

namespace treesnap {

namespace {

// Rebuilds the retained part of a tree bottom-up while it is walked.
class FilteringVisitor : public RelativePathVisitor {
public:
  explicit FilteringVisitor(const PathPredicate &predicate) : predicate_(predicate) {}

  bool pre_visit_directory(const LocationSnapshot &dir, const RelativePath & /*path*/) override {
    levels_.push_back(Level{.original = &dir, .kept = {}});
    return true;
  }

  void visit_file(const LocationSnapshot &file, const RelativePath &path) override {
    if (file.type() == FileType::Missing) {
      return;
    }
    // a file root is matched by its own name
    const std::string relative = levels_.empty() ? path.join() : path.join(1);
    if (!predicate_(relative)) {
      return;
    }
    keep(file.shared_from_this());
  }

  void post_visit_directory(const LocationSnapshot &dir, const RelativePath & /*path*/) override {
    Level level = std::move(levels_.back());
    levels_.pop_back();
    if (level.kept.empty()) {
      return;
    }
    if (!levels_.empty() && kept_everything(level)) {
      keep(dir.shared_from_this());
    } else {
      keep(LocationSnapshot::directory_like(dir, std::move(level.kept)));
    }
  }

  [[nodiscard]] FileSystemSnapshot result() const {
    return result_ ? FileSystemSnapshot::of(result_) : FileSystemSnapshot{};
  }

private:
  struct Level {
    const LocationSnapshot *original;
    std::vector<SnapshotPtr> kept;
  };

  static bool kept_everything(const Level &level) {
    const auto &all = level.original->children();
    if (all.size() != level.kept.size()) {
      return false;
    }
    for (std::size_t i = 0; i < all.size(); ++i) {
      if (all[i] != level.kept[i]) {
        return false;
      }
    }
    return true;
  }

  void keep(SnapshotPtr node) {
    if (levels_.empty()) {
      result_ = std::move(node);
    } else {
      levels_.back().kept.push_back(std::move(node));
    }
  }

  const PathPredicate &predicate_;
  std::vector<Level> levels_;
  SnapshotPtr result_;
};

} // namespace

FileSystemSnapshot filter_snapshot(const LocationSnapshot &complete, const PathPredicate &predicate) {
  FilteringVisitor filtering{predicate};
  RelativePathTrackingVisitor tracking{filtering};
  accept(complete, tracking);
  return filtering.result();
}

FileSystemSnapshotter::FileSystemSnapshotter(const FileHasher &hasher,
                                             const FileSystem &file_system,
                                             FileSystemMirror &mirror)
    : hasher_(hasher), file_system_(file_system), mirror_(mirror) {}

SnapshotPtr FileSystemSnapshotter::snapshot(const stdfs::path &path) const {
  const stdfs::path absolute = fs::canonical_path(path);
  const std::string key = absolute.string();
  if (auto cached = mirror_.get(key)) {
    TREESNAP_LOG_EXTRA("snapshot: cache hit {}", key);
    return cached;
  }
  TREESNAP_LOG_EXTRA("snapshot: capturing {}", key);
  return mirror_.put_if_absent(key, capture(absolute));
}

SnapshotPtr FileSystemSnapshotter::capture(const stdfs::path &absolute_path) const {
  const FileMetadata metadata = file_system_.stat(absolute_path);
  switch (metadata.type) {
  case FileType::Missing:
    return LocationSnapshot::missing(absolute_path);
  case FileType::RegularFile:
    return capture_regular_file(absolute_path, metadata);
  case FileType::Directory:
    return capture_directory(absolute_path);
  }
  return LocationSnapshot::missing(absolute_path);
}

SnapshotPtr FileSystemSnapshotter::capture_regular_file(const stdfs::path &absolute_path,
                                                        const FileMetadata &metadata) const {
  try {
    return LocationSnapshot::regular_file(absolute_path, hasher_.hash(absolute_path),
                                          metadata.last_modified);
  } catch (const IoFailure &e) {
    // the file may have been removed between stat and read
    if (file_system_.stat(absolute_path).type == FileType::Missing) {
      TREESNAP_LOG_EXTRA("snapshot: {} vanished while hashing", absolute_path.string());
      return LocationSnapshot::missing(absolute_path);
    }
    TREESNAP_LOG_WARN("snapshot: {}", e.what());
    throw;
  }
}

SnapshotPtr FileSystemSnapshotter::capture_directory(const stdfs::path &absolute_path) const {
  std::vector<SnapshotPtr> children;
  for (const auto &entry : file_system_.list_directory(absolute_path)) {
    auto child = snapshot(absolute_path / entry.name);
    if (child->type() != FileType::Missing) {
      children.push_back(std::move(child));
    }
  }
  return LocationSnapshot::directory(absolute_path, std::move(children));
}

FileSystemSnapshot FileSystemSnapshotter::snapshot_directory_tree(const DirectoryTree &tree) const {
  if (!tree.filter) {
    auto root = snapshot(tree.root);
    if (root->type() == FileType::Missing) {
      return {};
    }
    return FileSystemSnapshot::of(std::move(root));
  }

  const std::string key = fs::canonical_path(tree.root).string();
  SnapshotPtr complete = mirror_.get_tree(key);
  if (complete) {
    TREESNAP_LOG_EXTRA("snapshot: filtering cached tree {}", key);
  } else {
    complete = snapshot(tree.root);
  }
  if (complete->type() == FileType::Missing) {
    return {};
  }
  return filter_snapshot(*complete, tree.filter);
}

std::optional<FileSystemSnapshot> FileSystemSnapshotter::snapshot(const CompositeTree &tree) const {
  std::vector<SnapshotPtr> roots;
  for (const auto &element : tree.elements) {
    if (const auto *path = std::get_if<stdfs::path>(&element)) {
      auto s = snapshot(*path);
      if (s->type() != FileType::Missing) {
        roots.push_back(std::move(s));
      }
      continue;
    }
    const auto sub = snapshot_directory_tree(std::get<DirectoryTree>(element));
    roots.insert(roots.end(), sub.roots().begin(), sub.roots().end());
  }
  if (roots.empty()) {
    return std::nullopt;
  }
  return FileSystemSnapshot(std::move(roots));
}

} // namespace treesnap
