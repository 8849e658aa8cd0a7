#pragma once
#include "treesnap/fs.hpp"
#include "treesnap/hash.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace treesnap {

class LocationSnapshot;

// Snapshots are immutable and shared; identity of the pointer is meaningful
// (a mirror hit hands out the same object every time).
using SnapshotPtr = std::shared_ptr<const LocationSnapshot>;

struct MissingFileSnapshot {};

struct RegularFileSnapshot {
  HashCode content_hash;
  std::filesystem::file_time_type last_modified{};
};

struct DirectorySnapshot {
  std::vector<SnapshotPtr> children; // sorted by name
};

/**
 * State of one filesystem location: missing, regular file or directory.
 * Instances are only created through the factory functions below.
 */
class LocationSnapshot : public std::enable_shared_from_this<LocationSnapshot> {
  struct Private {};

public:
  using Content = std::variant<MissingFileSnapshot, RegularFileSnapshot, DirectorySnapshot>;

  LocationSnapshot(Private, std::string absolute_path, std::string name, Content content);

  static SnapshotPtr missing(const std::filesystem::path &absolute_path);
  static SnapshotPtr regular_file(const std::filesystem::path &absolute_path, HashCode content_hash,
                                  std::filesystem::file_time_type last_modified);
  // `children` is sorted by name here; callers may pass any order.
  static SnapshotPtr directory(const std::filesystem::path &absolute_path,
                               std::vector<SnapshotPtr> children);
  // Same location as `original`, different children. Used for derived views.
  static SnapshotPtr directory_like(const LocationSnapshot &original,
                                    std::vector<SnapshotPtr> children);

  [[nodiscard]] const std::string &absolute_path() const { return absolute_path_; }
  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] FileType type() const;
  [[nodiscard]] const Content &content() const { return content_; }

  // nullptr unless the snapshot is of that kind
  [[nodiscard]] const RegularFileSnapshot *as_regular_file() const;
  [[nodiscard]] const DirectorySnapshot *as_directory() const;

  // Empty for anything but a directory.
  [[nodiscard]] const std::vector<SnapshotPtr> &children() const;

  // Same kind and, for regular files, same digest and modification time.
  // Directories are compared shallowly (kind only).
  [[nodiscard]] bool is_content_and_metadata_up_to_date(const LocationSnapshot &other) const;

  // Structural equality; directory children are compared by name and state, in order.
  friend bool operator==(const LocationSnapshot &a, const LocationSnapshot &b);

private:
  std::string absolute_path_;
  std::string name_;
  Content content_;
};

/**
 * Zero or more root snapshots. A directory-tree request answers with one of these:
 * empty (nothing there), a single file (no directory wrapper), or a single directory.
 */
class FileSystemSnapshot {
public:
  FileSystemSnapshot() = default;
  explicit FileSystemSnapshot(std::vector<SnapshotPtr> roots) : roots_(std::move(roots)) {}

  static FileSystemSnapshot of(SnapshotPtr root);

  [[nodiscard]] const std::vector<SnapshotPtr> &roots() const { return roots_; }
  [[nodiscard]] bool empty() const { return roots_.empty(); }

  // Path of the first directory root, if any. Rootless for empty and file-only snapshots.
  [[nodiscard]] std::optional<std::string> root_path() const;

private:
  std::vector<SnapshotPtr> roots_;
};

} // namespace treesnap
