#pragma once
#include "treesnap/hash.hpp"
#include "treesnap/log.hpp"

#include <filesystem>
#include <vector>

namespace treesnap {

struct Config {
  DigestAlgorithm digest = DigestAlgorithm::Md5;
  LogLevel::type log_level = LogLevel::WARN;
  std::vector<std::filesystem::path> immutable_locations;
};

// Read `key: value` lines from `file` (defaults if missing).
// Throws std::runtime_error on an unknown digest or log level.
Config load_config(const std::filesystem::path &file);

// Overwrite `file` with the given config
void save_config(const std::filesystem::path &file, const Config &config);

} // namespace treesnap
