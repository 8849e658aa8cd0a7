#pragma once
#include <fmt/format.h>

#include <cstdio>
#include <string_view>

namespace treesnap {

struct LogLevel {
  using type = int;
  static constexpr type NONE  = 0;
  static constexpr type ERROR = 1;
  static constexpr type WARN  = 2;
  static constexpr type INFO  = 3;
  static constexpr type EXTRA = 4;

  static constexpr type QUIET   = NONE;
  static constexpr type VERBOSE = EXTRA;
};

namespace log {

void set_level(LogLevel::type level);
[[nodiscard]] LogLevel::type level();

// Checks if messages of `level` are currently printed.
[[nodiscard]] inline bool enabled(LogLevel::type lvl) { return lvl != LogLevel::NONE && lvl <= level(); }

// Parse "none|error|warn|info|extra" (false on unknown names).
bool parse_level(std::string_view name, LogLevel::type &out);
[[nodiscard]] std::string_view level_name(LogLevel::type level);

// Messages go to stderr unless redirected; nullptr restores stderr.
void set_output(std::FILE *out);
void write(LogLevel::type level, std::string_view message);

} // namespace log
} // namespace treesnap

#define TREESNAP_LOG(LEVEL, ...)                                                                   \
  do {                                                                                             \
    if (::treesnap::log::enabled(::treesnap::LogLevel::LEVEL))                                     \
      ::treesnap::log::write(::treesnap::LogLevel::LEVEL, ::fmt::format(__VA_ARGS__));             \
  } while (false)

#define TREESNAP_LOG_ERROR(...) TREESNAP_LOG(ERROR, __VA_ARGS__)
#define TREESNAP_LOG_WARN(...)  TREESNAP_LOG(WARN, __VA_ARGS__)
#define TREESNAP_LOG_INFO(...)  TREESNAP_LOG(INFO, __VA_ARGS__)
#define TREESNAP_LOG_EXTRA(...) TREESNAP_LOG(EXTRA, __VA_ARGS__)
