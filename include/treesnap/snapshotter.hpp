#pragma once
#include "treesnap/fs.hpp"
#include "treesnap/hash.hpp"
#include "treesnap/mirror.hpp"
#include "treesnap/snapshot.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace treesnap {

// Does the '/'-separated path below the tree root match? (glob matching lives with the caller)
using PathPredicate = std::function<bool(std::string_view relative_path)>;

struct DirectoryTree {
  std::filesystem::path root;
  PathPredicate filter; // empty: include everything
};

// Union of individual paths and directory trees, not anchored at one directory.
struct CompositeTree {
  using Element = std::variant<std::filesystem::path, DirectoryTree>;
  std::vector<Element> elements;
};

/**
 * Captures filesystem state, reading through and populating a FileSystemMirror.
 * All operations throw IoFailure when the filesystem cannot be read.
 */
class FileSystemSnapshotter {
public:
  FileSystemSnapshotter(const FileHasher &hasher, const FileSystem &file_system,
                        FileSystemMirror &mirror);

  // Cached per absolute path. Capturing a directory caches every directory
  // and file below it as well.
  [[nodiscard]] SnapshotPtr snapshot(const std::filesystem::path &path) const;

  // Without a filter this is snapshot(root) wrapped as a tree (same object).
  // With a filter the complete tree is captured or reused, and a fresh,
  // uncached view holding only matching entries is returned.
  // Missing root -> empty; file root -> that file alone, without a directory.
  [[nodiscard]] FileSystemSnapshot snapshot_directory_tree(const DirectoryTree &tree) const;

  // std::nullopt when no element contributes anything. Never cached.
  [[nodiscard]] std::optional<FileSystemSnapshot> snapshot(const CompositeTree &tree) const;

private:
  SnapshotPtr capture(const std::filesystem::path &absolute_path) const;
  SnapshotPtr capture_regular_file(const std::filesystem::path &absolute_path,
                                   const FileMetadata &metadata) const;
  SnapshotPtr capture_directory(const std::filesystem::path &absolute_path) const;

  const FileHasher &hasher_;
  const FileSystem &file_system_;
  FileSystemMirror &mirror_;
};

// Matching subset of `complete`. Matching files are shared with `complete`,
// fully-matching subdirectories too; the returned root is always a new node.
FileSystemSnapshot filter_snapshot(const LocationSnapshot &complete, const PathPredicate &predicate);

} // namespace treesnap
