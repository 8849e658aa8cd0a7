#include "treesnap/log.hpp"

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <cstdio>
#include <mutex>

namespace treesnap::log {

namespace {

std::atomic<LogLevel::type> g_level{LogLevel::WARN};
std::mutex g_write_mutex;
std::FILE *g_output = nullptr;

constexpr std::array<std::string_view, 5> kNames = {"none", "error", "warn", "info", "extra"};

} // namespace

void set_level(LogLevel::type lvl) { g_level.store(lvl, std::memory_order_relaxed); }

LogLevel::type level() { return g_level.load(std::memory_order_relaxed); }

bool parse_level(std::string_view name, LogLevel::type &out) {
  for (std::size_t i = 0; i < kNames.size(); ++i) {
    if (kNames[i] == name) {
      out = static_cast<LogLevel::type>(i);
      return true;
    }
  }
  return false;
}

std::string_view level_name(LogLevel::type lvl) {
  const auto idx = static_cast<std::size_t>(lvl);
  return idx < kNames.size() ? kNames[idx] : "log";
}

void set_output(std::FILE *out) {
  const std::lock_guard<std::mutex> lock(g_write_mutex);
  g_output = out;
}

void write(LogLevel::type lvl, std::string_view message) {
  const std::string_view tag = level_name(lvl);
  const std::lock_guard<std::mutex> lock(g_write_mutex);
  fmt::print(g_output ? g_output : stderr, "[treesnap:{}] {}\n", tag, message);
}

} // namespace treesnap::log
