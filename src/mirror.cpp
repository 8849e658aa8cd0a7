#include "treesnap/mirror.hpp"

#include "treesnap/consts.hpp"
#include "treesnap/fs.hpp"
#include "treesnap/log.hpp"

#include <mutex>
#include <stdexcept>

namespace treesnap {

WellKnownFileLocations::WellKnownFileLocations(
    const std::vector<std::filesystem::path> &immutable_roots) {
  roots_.reserve(immutable_roots.size());
  for (const auto &root : immutable_roots) {
    roots_.push_back(fs::canonical_path(root).string());
  }
}

bool WellKnownFileLocations::is_immutable(std::string_view absolute_path) const {
  for (const auto &root : roots_) {
    if (!absolute_path.starts_with(root)) {
      continue;
    }
    if (absolute_path.size() == root.size() || absolute_path[root.size()] == consts::kPathSeparator ||
        root.ends_with(consts::kPathSeparator)) {
      return true;
    }
  }
  return false;
}

FileSystemMirror::FileSystemMirror(WellKnownFileLocations locations)
    : locations_(std::move(locations)) {}

SnapshotPtr FileSystemMirror::get(const std::string &absolute_path) const {
  const std::shared_lock lock(mutex_);
  const auto it = entries_.find(absolute_path);
  return it == entries_.end() ? nullptr : it->second;
}

SnapshotPtr FileSystemMirror::put_if_absent(const std::string &absolute_path, SnapshotPtr snapshot) {
  if (!snapshot) {
    throw std::invalid_argument("mirror: refusing to cache a null snapshot for " + absolute_path);
  }
  const std::unique_lock lock(mutex_);
  const auto [it, inserted] = entries_.try_emplace(absolute_path, std::move(snapshot));
  if (!inserted) {
    TREESNAP_LOG_EXTRA("mirror: lost insertion race for {}", absolute_path);
  }
  return it->second;
}

SnapshotPtr FileSystemMirror::get_tree(const std::string &root) const {
  auto entry = get(root);
  if (entry && entry->type() != FileType::Directory) {
    return nullptr;
  }
  return entry;
}

SnapshotPtr FileSystemMirror::put_tree_if_absent(const std::string &root, SnapshotPtr dir) {
  if (!dir || dir->type() != FileType::Directory) {
    throw std::invalid_argument("mirror: tree entry for " + root + " is not a directory");
  }
  return put_if_absent(root, std::move(dir));
}

void FileSystemMirror::invalidate_all() {
  const std::unique_lock lock(mutex_);
  const auto before = entries_.size();
  std::erase_if(entries_, [this](const auto &entry) { return !locations_.is_immutable(entry.first); });
  TREESNAP_LOG_EXTRA("mirror: invalidated {} of {} entries", before - entries_.size(), before);
}

std::size_t FileSystemMirror::size() const {
  const std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace treesnap
