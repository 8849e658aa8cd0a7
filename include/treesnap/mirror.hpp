#pragma once
#include "treesnap/snapshot.hpp"

#include <cstddef>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace treesnap {

// Roots whose contents never change during a process (toolchains, dependency caches).
class WellKnownFileLocations {
public:
  WellKnownFileLocations() = default;
  explicit WellKnownFileLocations(const std::vector<std::filesystem::path> &immutable_roots);

  // True if `absolute_path` is one of the roots or lies below one.
  [[nodiscard]] bool is_immutable(std::string_view absolute_path) const;

private:
  std::vector<std::string> roots_;
};

/**
 * Process-wide cache of absolute path -> last captured snapshot.
 *
 * One canonical entry per path: the first insertion wins and every later
 * lookup or insertion attempt returns that same object. A directory entry also
 * serves as the complete directory-tree snapshot of that root. Entries are
 * only dropped by an explicit invalidate_all().
 */
class FileSystemMirror {
public:
  explicit FileSystemMirror(WellKnownFileLocations locations = {});

  FileSystemMirror(const FileSystemMirror &) = delete;
  FileSystemMirror &operator=(const FileSystemMirror &) = delete;

  // nullptr when nothing is cached for the path
  [[nodiscard]] SnapshotPtr get(const std::string &absolute_path) const;

  // Returns the cached value: `snapshot` if the key was free, the earlier winner otherwise.
  SnapshotPtr put_if_absent(const std::string &absolute_path, SnapshotPtr snapshot);

  // The cached complete directory snapshot for `root`, nullptr if none or not a directory.
  [[nodiscard]] SnapshotPtr get_tree(const std::string &root) const;

  // Like put_if_absent; `dir` must be a directory snapshot (std::invalid_argument otherwise).
  SnapshotPtr put_tree_if_absent(const std::string &root, SnapshotPtr dir);

  // Drop every entry outside the immutable well-known locations.
  void invalidate_all();

  [[nodiscard]] std::size_t size() const;

private:
  WellKnownFileLocations locations_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, SnapshotPtr> entries_;
};

} // namespace treesnap
