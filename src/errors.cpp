#include "treesnap/errors.hpp"

#include <utility>

namespace treesnap {

IoFailure::IoFailure(const std::filesystem::path &path, std::error_code code,
                     const std::string &action)
    : std::runtime_error(action + ": " + path.string() + ": " + code.message()), path_(path),
      code_(code) {}

static std::string message_of(std::exception_ptr cause) {
  const std::string msg = describe(cause);
  return msg.empty() ? std::string("unknown error") : msg;
}

ExecutionFailure::ExecutionFailure(std::string display_name, std::exception_ptr cause)
    : std::runtime_error("Execution failed for " + display_name + ": " + message_of(cause)),
      display_name_(std::move(display_name)), cause_(std::move(cause)) {}

std::string describe(std::exception_ptr error) {
  if (!error) {
    return {};
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace treesnap
