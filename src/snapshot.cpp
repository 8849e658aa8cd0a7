#include "treesnap/snapshot.hpp"

#include <algorithm>

namespace treesnap {

namespace {

std::string name_of(const std::filesystem::path &p) {
  auto name = p.filename().string();
  return name.empty() ? p.string() : name; // filesystem root "/"
}

const std::vector<SnapshotPtr> &no_children() {
  static const std::vector<SnapshotPtr> kEmpty;
  return kEmpty;
}

void sort_by_name(std::vector<SnapshotPtr> &children) {
  std::ranges::sort(children, [](const SnapshotPtr &a, const SnapshotPtr &b) {
    return a->name() < b->name();
  });
}

} // namespace

LocationSnapshot::LocationSnapshot(Private, std::string absolute_path, std::string name,
                                   Content content)
    : absolute_path_(std::move(absolute_path)), name_(std::move(name)),
      content_(std::move(content)) {}

SnapshotPtr LocationSnapshot::missing(const std::filesystem::path &absolute_path) {
  return std::make_shared<LocationSnapshot>(Private{}, absolute_path.string(),
                                                  name_of(absolute_path), MissingFileSnapshot{});
}

SnapshotPtr LocationSnapshot::regular_file(const std::filesystem::path &absolute_path,
                                           HashCode content_hash,
                                           std::filesystem::file_time_type last_modified) {
  return std::make_shared<LocationSnapshot>(
      Private{}, absolute_path.string(), name_of(absolute_path),
      RegularFileSnapshot{.content_hash = std::move(content_hash), .last_modified = last_modified});
}

SnapshotPtr LocationSnapshot::directory(const std::filesystem::path &absolute_path,
                                        std::vector<SnapshotPtr> children) {
  sort_by_name(children);
  return std::make_shared<LocationSnapshot>(Private{}, absolute_path.string(),
                                                  name_of(absolute_path),
                                                  DirectorySnapshot{std::move(children)});
}

SnapshotPtr LocationSnapshot::directory_like(const LocationSnapshot &original,
                                             std::vector<SnapshotPtr> children) {
  sort_by_name(children);
  return std::make_shared<LocationSnapshot>(Private{}, original.absolute_path_,
                                                  original.name_,
                                                  DirectorySnapshot{std::move(children)});
}

FileType LocationSnapshot::type() const {
  if (std::holds_alternative<RegularFileSnapshot>(content_)) {
    return FileType::RegularFile;
  }
  if (std::holds_alternative<DirectorySnapshot>(content_)) {
    return FileType::Directory;
  }
  return FileType::Missing;
}

const RegularFileSnapshot *LocationSnapshot::as_regular_file() const {
  return std::get_if<RegularFileSnapshot>(&content_);
}

const DirectorySnapshot *LocationSnapshot::as_directory() const {
  return std::get_if<DirectorySnapshot>(&content_);
}

const std::vector<SnapshotPtr> &LocationSnapshot::children() const {
  const auto *dir = as_directory();
  return dir ? dir->children : no_children();
}

bool LocationSnapshot::is_content_and_metadata_up_to_date(const LocationSnapshot &other) const {
  if (type() != other.type()) {
    return false;
  }
  const auto *mine = as_regular_file();
  const auto *theirs = other.as_regular_file();
  if (mine && theirs) {
    return mine->content_hash == theirs->content_hash &&
           mine->last_modified == theirs->last_modified;
  }
  return true;
}

bool operator==(const LocationSnapshot &a, const LocationSnapshot &b) {
  if (&a == &b) {
    return true;
  }
  if (!a.is_content_and_metadata_up_to_date(b)) {
    return false;
  }
  const auto &xs = a.children();
  const auto &ys = b.children();
  if (xs.size() != ys.size()) {
    return false;
  }
  for (std::size_t i = 0; i < xs.size(); ++i) {
    if (xs[i]->name() != ys[i]->name() || !(*xs[i] == *ys[i])) {
      return false;
    }
  }
  return true;
}

FileSystemSnapshot FileSystemSnapshot::of(SnapshotPtr root) {
  std::vector<SnapshotPtr> roots;
  roots.push_back(std::move(root));
  return FileSystemSnapshot(std::move(roots));
}

std::optional<std::string> FileSystemSnapshot::root_path() const {
  for (const auto &root : roots_) {
    if (root->type() == FileType::Directory) {
      return root->absolute_path();
    }
  }
  return std::nullopt;
}

} // namespace treesnap
