#pragma once
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace treesnap {

// stat/list/hash failure on a concrete path.
class IoFailure : public std::runtime_error {
public:
  IoFailure(const std::filesystem::path &path, std::error_code code, const std::string &action);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::error_code code() const { return code_; }

private:
  std::filesystem::path path_;
  std::error_code code_;
};

// A unit of work threw while executing.
class ExecutionFailure : public std::runtime_error {
public:
  ExecutionFailure(std::string display_name, std::exception_ptr cause);

  [[nodiscard]] const std::string &display_name() const { return display_name_; }
  [[nodiscard]] std::exception_ptr cause() const { return cause_; }

private:
  std::string display_name_;
  std::exception_ptr cause_;
};

// Cancellation was observed after a unit of work returned.
class BuildCancelled : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Best-effort message of an exception_ptr (empty ptr -> "").
std::string describe(std::exception_ptr error);

} // namespace treesnap
