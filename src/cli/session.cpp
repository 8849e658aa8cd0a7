#include "cli/session.hpp"

#include "treesnap/visitor.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace treesnap::cli {

Session::Session(const Config &cfg)
    : config(cfg), hasher(cfg.digest), mirror(WellKnownFileLocations(cfg.immutable_locations)),
      snapshotter(hasher, file_system, mirror) {}

static std::unique_ptr<Session> &instance() {
  static std::unique_ptr<Session> s;
  return s;
}

void init_session(const Config &config) { instance() = std::make_unique<Session>(config); }

Session &session() {
  if (!instance()) {
    throw std::logic_error("session not initialized");
  }
  return *instance();
}

namespace {

class PrintingVisitor : public SnapshotVisitor {
public:
  explicit PrintingVisitor(std::ostream &os) : os_(os) {}

  bool pre_visit_directory(const LocationSnapshot &dir) override {
    indent() << "D " << dir.name() << "/\n";
    ++depth_;
    return true;
  }

  void visit_file(const LocationSnapshot &file) override {
    if (const auto *regular = file.as_regular_file()) {
      indent() << "F " << file.name() << ' ' << regular->content_hash.to_hex() << '\n';
    } else {
      indent() << "M " << file.name() << " (missing)\n";
    }
  }

  void post_visit_directory(const LocationSnapshot & /*dir*/) override { --depth_; }

private:
  std::ostream &indent() { return os_ << std::string(depth_ * 2, ' '); }

  std::ostream &os_;
  std::size_t depth_ = 0;
};

} // namespace

void print_snapshot(std::ostream &os, const LocationSnapshot &snapshot) {
  PrintingVisitor printer{os};
  accept(snapshot, printer);
}

void print_snapshot(std::ostream &os, const FileSystemSnapshot &snapshot) {
  if (snapshot.empty()) {
    os << "(empty)\n";
    return;
  }
  PrintingVisitor printer{os};
  accept(snapshot, printer);
}

} // namespace treesnap::cli
