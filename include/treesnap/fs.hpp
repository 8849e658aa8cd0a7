#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace treesnap {

enum class FileType : std::uint8_t { Missing, RegularFile, Directory };

struct FileMetadata {
  FileType type = FileType::Missing;
  std::filesystem::file_time_type last_modified{}; // only meaningful for regular files
};

struct DirectoryEntry {
  std::string name; // single path segment
  FileType type;
};

/**
 * Capability: stat and list the filesystem.
 * Not-found is reported as FileType::Missing, every other failure throws IoFailure.
 */
class FileSystem {
public:
  virtual ~FileSystem() = default;

  [[nodiscard]] virtual FileMetadata stat(const std::filesystem::path &p) const = 0;

  // Entries sorted by name. Entries that are neither regular files nor
  // directories (sockets, fifos, dangling links) are left out.
  [[nodiscard]] virtual std::vector<DirectoryEntry>
  list_directory(const std::filesystem::path &dir) const = 0;
};

// std::filesystem backed implementation; symlinks are followed.
class DefaultFileSystem : public FileSystem {
public:
  [[nodiscard]] FileMetadata stat(const std::filesystem::path &p) const override;
  [[nodiscard]] std::vector<DirectoryEntry>
  list_directory(const std::filesystem::path &dir) const override;
};

namespace fs {

bool exists(const std::filesystem::path &p);
void ensure_parent_dir(const std::filesystem::path &p);

// Absolute, lexically normal, no trailing separator.
std::filesystem::path canonical_path(const std::filesystem::path &p);

std::vector<std::uint8_t> read_file(const std::filesystem::path &p);
void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data);

} // namespace fs
} // namespace treesnap
