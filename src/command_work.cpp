#include "treesnap/command_work.hpp"

#include "treesnap/log.hpp"

#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <sys/wait.h>
#include <utility>

namespace treesnap {

static bool same_state(const FileSystemSnapshot &a, const FileSystemSnapshot &b) {
  if (a.roots().size() != b.roots().size())
    return false;
  for (std::size_t i = 0; i < a.roots().size(); ++i) {
    if (!(*a.roots()[i] == *b.roots()[i]))
      return false;
  }
  return true;
}

void check_wait_status(int status, BuildCancellationToken &token) {
  if (status == -1) {
    throw std::runtime_error("could not start shell");
  }
  if (WIFSIGNALED(status)) {
    if (WTERMSIG(status) == SIGINT) {
      token.cancel();
      return;
    }
    throw std::runtime_error("command killed by signal " + std::to_string(WTERMSIG(status)));
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    throw std::runtime_error("command exited with status " + std::to_string(WEXITSTATUS(status)));
  }
}

ShellCommandWork::ShellCommandWork(std::string command, std::filesystem::path watched,
                                   const FileSystemSnapshotter &snapshotter,
                                   FileSystemMirror &mirror, BuildCancellationToken &token)
    : command_(std::move(command)), watched_(std::move(watched)), snapshotter_(snapshotter),
      mirror_(mirror), token_(token) {}

bool ShellCommandWork::execute() {
  const auto before = snapshotter_.snapshot_directory_tree({.root = watched_, .filter = {}});

  TREESNAP_LOG_INFO("run: {}", command_);
  check_wait_status(std::system(command_.c_str()), token_);

  mirror_.invalidate_all();
  const auto after = snapshotter_.snapshot_directory_tree({.root = watched_, .filter = {}});
  return !same_state(before, after);
}

} // namespace treesnap
