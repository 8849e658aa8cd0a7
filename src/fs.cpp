#include "treesnap/fs.hpp"

#include "treesnap/errors.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace stdfs = std::filesystem;

namespace treesnap {

static bool is_not_found(const std::error_code &ec) {
  return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

FileMetadata DefaultFileSystem::stat(const stdfs::path &p) const {
  std::error_code ec;
  const auto st = stdfs::status(p, ec);
  if (ec && !is_not_found(ec)) {
    throw IoFailure(p, ec, "stat failed");
  }
  FileMetadata md{};
  switch (st.type()) {
  case stdfs::file_type::not_found:
    md.type = FileType::Missing;
    return md;
  case stdfs::file_type::directory:
    md.type = FileType::Directory;
    return md;
  case stdfs::file_type::regular:
    break;
  default:
    throw IoFailure(p, std::make_error_code(std::errc::not_supported), "unsupported file type");
  }
  md.type = FileType::RegularFile;
  md.last_modified = stdfs::last_write_time(p, ec);
  if (ec) {
    if (is_not_found(ec)) {
      return FileMetadata{};
    }
    throw IoFailure(p, ec, "stat failed");
  }
  return md;
}

std::vector<DirectoryEntry> DefaultFileSystem::list_directory(const stdfs::path &dir) const {
  std::error_code ec;
  stdfs::directory_iterator it(dir, ec);
  if (ec) {
    throw IoFailure(dir, ec, "list directory failed");
  }
  std::vector<DirectoryEntry> out;
  for (; it != stdfs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    const auto st = it->status(type_ec);
    if (type_ec) {
      continue; // dangling link or raced removal
    }
    if (st.type() == stdfs::file_type::directory) {
      out.push_back({it->path().filename().string(), FileType::Directory});
    } else if (st.type() == stdfs::file_type::regular) {
      out.push_back({it->path().filename().string(), FileType::RegularFile});
    }
  }
  if (ec) {
    throw IoFailure(dir, ec, "list directory failed");
  }
  std::ranges::sort(out, [](const DirectoryEntry &a, const DirectoryEntry &b) { return a.name < b.name; });
  return out;
}

namespace fs {

bool exists(const stdfs::path &p) {
  std::error_code ec;
  return stdfs::exists(p, ec);
}

void ensure_parent_dir(const stdfs::path &p) {
  std::error_code ec;
  stdfs::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

stdfs::path canonical_path(const stdfs::path &p) {
  std::error_code ec;
  auto abs = stdfs::absolute(p, ec);
  if (ec) {
    throw IoFailure(p, ec, "resolve absolute path failed");
  }
  abs = abs.lexically_normal();
  // "/a/b/" normalizes to "/a/b/" (empty filename); drop the separator
  if (!abs.has_filename() && abs.has_relative_path()) {
    abs = abs.parent_path();
  }
  return abs;
}

std::vector<std::uint8_t> read_file(const stdfs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const stdfs::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  stdfs::rename(tmp, p, ec);
  if (ec) {
    const std::string reason = ec.message();
    stdfs::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + reason);
  }
}

} // namespace fs
} // namespace treesnap
