#include "treesnap/visitor.hpp"

#include "treesnap/consts.hpp"

namespace treesnap {

void accept(const LocationSnapshot &snapshot, SnapshotVisitor &visitor) {
  if (snapshot.type() != FileType::Directory) {
    visitor.visit_file(snapshot);
    return;
  }
  if (visitor.pre_visit_directory(snapshot)) {
    for (const auto &child : snapshot.children()) {
      accept(*child, visitor);
    }
  }
  visitor.post_visit_directory(snapshot);
}

void accept(const FileSystemSnapshot &snapshot, SnapshotVisitor &visitor) {
  for (const auto &root : snapshot.roots()) {
    accept(*root, visitor);
  }
}

bool CallbackVisitor::pre_visit_directory(const LocationSnapshot &dir) {
  return on_pre_visit_directory ? on_pre_visit_directory(dir) : true;
}

void CallbackVisitor::visit_file(const LocationSnapshot &file) {
  if (on_visit_file)
    on_visit_file(file);
}

void CallbackVisitor::post_visit_directory(const LocationSnapshot &dir) {
  if (on_post_visit_directory)
    on_post_visit_directory(dir);
}

std::string RelativePath::join(std::size_t from) const {
  std::string out;
  for (std::size_t i = from; i < segments_.size(); ++i) {
    if (i != from) {
      out.push_back(consts::kPathSeparator);
    }
    out.append(segments_[i]);
  }
  return out;
}

bool RelativePathTrackingVisitor::pre_visit_directory(const LocationSnapshot &dir) {
  path_.push(dir.name());
  return delegate_.pre_visit_directory(dir, path_);
}

void RelativePathTrackingVisitor::visit_file(const LocationSnapshot &file) {
  path_.push(file.name());
  delegate_.visit_file(file, path_);
  path_.pop();
}

void RelativePathTrackingVisitor::post_visit_directory(const LocationSnapshot &dir) {
  delegate_.post_visit_directory(dir, path_);
  path_.pop();
}

} // namespace treesnap
