#pragma once
#include "treesnap/execute.hpp"
#include "treesnap/mirror.hpp"
#include "treesnap/snapshotter.hpp"

#include <filesystem>
#include <string>

namespace treesnap {

/**
 * A shell command run through /bin/sh as a unit of work. It did work when the
 * snapshot of the watched directory differs before and after the command; the
 * mirror is invalidated in between so the second snapshot is read fresh.
 *
 * A child killed by SIGINT requests cancellation on the token. Any other
 * signal or a non-zero exit status makes execute() throw.
 */
class ShellCommandWork : public UnitOfWork {
public:
  ShellCommandWork(std::string command, std::filesystem::path watched,
                   const FileSystemSnapshotter &snapshotter, FileSystemMirror &mirror,
                   BuildCancellationToken &token);

  bool execute() override;
  [[nodiscard]] std::string display_name() const override { return "'" + command_ + "'"; }

private:
  std::string command_;
  std::filesystem::path watched_;
  const FileSystemSnapshotter &snapshotter_;
  FileSystemMirror &mirror_;
  BuildCancellationToken &token_;
};

// Interpret a wait status from std::system: cancels `token` on SIGINT, throws
// std::runtime_error for other signals and non-zero exits.
void check_wait_status(int status, BuildCancellationToken &token);

} // namespace treesnap
