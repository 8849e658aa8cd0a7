#include "treesnap/config.hpp"

#include "treesnap/consts.hpp"
#include "treesnap/fs.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace

namespace treesnap {

auto load_config(const std::filesystem::path &file) -> Config {
  Config out{};
  if (!fs::exists(file))
    return out;

  const auto bytes = fs::read_file(file);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.rfind(consts::kKeyDigest, 0) == 0) {
      const auto name = trim(sv.substr(consts::kKeyDigest.size()));
      if (!parse_algorithm(name, out.digest))
        throw std::runtime_error("config: unknown digest '" + name + "' in " + file.string());
    } else if (sv.rfind(consts::kKeyLogLevel, 0) == 0) {
      const auto name = trim(sv.substr(consts::kKeyLogLevel.size()));
      if (!log::parse_level(name, out.log_level))
        throw std::runtime_error("config: unknown log level '" + name + "' in " + file.string());
    } else if (sv.rfind(consts::kKeyImmutable, 0) == 0) {
      const auto path = trim(sv.substr(consts::kKeyImmutable.size()));
      if (!path.empty())
        out.immutable_locations.emplace_back(path);
    }
  }
  return out;
}

void save_config(const std::filesystem::path &file, const Config &config) {
  std::ostringstream os;
  os << consts::kKeyDigest << ' ' << algorithm_name(config.digest) << '\n';
  os << consts::kKeyLogLevel << ' ' << log::level_name(config.log_level) << '\n';
  for (const auto &p : config.immutable_locations)
    os << consts::kKeyImmutable << ' ' << p.string() << '\n';

  const std::string s = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(s.data());
  fs::write_file_atomic(file, std::span(data, s.size()));
}

} // namespace treesnap
