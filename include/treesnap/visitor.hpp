#pragma once
#include "treesnap/snapshot.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace treesnap {

/**
 * Hooks for a pre-order walk over a snapshot tree.
 * Returning false from pre_visit_directory skips the children; the matching
 * post_visit_directory still fires.
 */
class SnapshotVisitor {
public:
  virtual ~SnapshotVisitor() = default;

  virtual bool pre_visit_directory(const LocationSnapshot &dir) = 0;
  // Regular files and missing locations.
  virtual void visit_file(const LocationSnapshot &file) = 0;
  virtual void post_visit_directory(const LocationSnapshot &dir) = 0;
};

// Walk `snapshot`: directories pre-order, children in stored (name) order.
// A non-directory root only sees visit_file.
void accept(const LocationSnapshot &snapshot, SnapshotVisitor &visitor);

// Walk every root in order.
void accept(const FileSystemSnapshot &snapshot, SnapshotVisitor &visitor);

// SnapshotVisitor built from closures; unset hooks do nothing (pre-visit continues).
class CallbackVisitor : public SnapshotVisitor {
public:
  std::function<bool(const LocationSnapshot &)> on_pre_visit_directory;
  std::function<void(const LocationSnapshot &)> on_visit_file;
  std::function<void(const LocationSnapshot &)> on_post_visit_directory;

  bool pre_visit_directory(const LocationSnapshot &dir) override;
  void visit_file(const LocationSnapshot &file) override;
  void post_visit_directory(const LocationSnapshot &dir) override;
};

// Names from the traversal root down to the current node, root name included.
class RelativePath {
public:
  void push(std::string_view segment) { segments_.emplace_back(segment); }
  void pop() { segments_.pop_back(); }

  [[nodiscard]] std::size_t size() const { return segments_.size(); }
  [[nodiscard]] bool empty() const { return segments_.empty(); }
  [[nodiscard]] const std::vector<std::string> &segments() const { return segments_; }

  // Segments [from, size()) joined with '/'. join(1) is the path below the root.
  [[nodiscard]] std::string join(std::size_t from = 0) const;

private:
  std::vector<std::string> segments_;
};

class RelativePathVisitor {
public:
  virtual ~RelativePathVisitor() = default;

  virtual bool pre_visit_directory(const LocationSnapshot & /*dir*/, const RelativePath & /*path*/) {
    return true;
  }
  virtual void visit_file(const LocationSnapshot &file, const RelativePath &path) = 0;
  virtual void post_visit_directory(const LocationSnapshot & /*dir*/, const RelativePath & /*path*/) {}
};

/**
 * Decorates a RelativePathVisitor with the segment stack. The node's own name
 * is already pushed when its hook runs.
 */
class RelativePathTrackingVisitor final : public SnapshotVisitor {
public:
  explicit RelativePathTrackingVisitor(RelativePathVisitor &delegate) : delegate_(delegate) {}

  bool pre_visit_directory(const LocationSnapshot &dir) override;
  void visit_file(const LocationSnapshot &file) override;
  void post_visit_directory(const LocationSnapshot &dir) override;

  [[nodiscard]] const RelativePath &relative_path() const { return path_; }

private:
  RelativePathVisitor &delegate_;
  RelativePath path_;
};

} // namespace treesnap
