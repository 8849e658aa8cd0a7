#include "treesnap/config.hpp"
#include "treesnap/fs.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("treesnap_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // Defaults when the file is absent
    {
      const auto cfg = treesnap::load_config(root / "absent");
      if (cfg.digest != treesnap::DigestAlgorithm::Md5 || cfg.log_level != treesnap::LogLevel::WARN ||
          !cfg.immutable_locations.empty()) {
        std::cerr << "unexpected defaults\n";
        return 1;
      }
    }

    // Parsing with comments and unknown keys
    {
      write_file(root / "cfg", "# settings\n"
                               "digest: sha256\r\n"
                               "log-level:   info\n"
                               "colour: blue\n"
                               "immutable: /opt/toolchain\n"
                               "immutable: /var/cache/deps\n");
      const auto cfg = treesnap::load_config(root / "cfg");
      if (cfg.digest != treesnap::DigestAlgorithm::Sha256 || cfg.log_level != treesnap::LogLevel::INFO ||
          cfg.immutable_locations.size() != 2 || cfg.immutable_locations[1] != "/var/cache/deps") {
        std::cerr << "config not parsed\n";
        return 1;
      }

      // save + load keeps the values
      treesnap::save_config(root / "saved", cfg);
      const auto again = treesnap::load_config(root / "saved");
      if (again.digest != cfg.digest || again.log_level != cfg.log_level ||
          again.immutable_locations != cfg.immutable_locations) {
        std::cerr << "saved config differs\n";
        return 1;
      }
    }

    // Invalid values are rejected
    for (const char *bad : {"digest: crc32\n", "log-level: loud\n"}) {
      write_file(root / "bad", bad);
      bool threw = false;
      try {
        (void)treesnap::load_config(root / "bad");
      } catch (const std::runtime_error &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "accepted invalid config: " << bad;
        return 1;
      }
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
