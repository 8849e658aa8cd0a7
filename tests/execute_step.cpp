#include "treesnap/errors.hpp"
#include "treesnap/execute.hpp"

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

using treesnap::BuildCancellationToken;
using treesnap::ExecuteStep;
using treesnap::WorkOutcome;

namespace {

class TestWork : public treesnap::UnitOfWork {
public:
  explicit TestWork(std::function<bool()> body) : body_(std::move(body)) {}
  bool execute() override { return body_(); }
  [[nodiscard]] std::string display_name() const override { return "task ':compile'"; }

private:
  std::function<bool()> body_;
};

template <typename E> bool failure_is(const treesnap::WorkResult &result) {
  try {
    result.rethrow_failure();
  } catch (const E &) {
    return true;
  } catch (...) {
    return false;
  }
  return false;
}

// Can only be named once; a second display_name() call throws.
class NamedOnceWork : public treesnap::UnitOfWork {
public:
  bool execute() override { throw std::runtime_error("compile error"); }
  [[nodiscard]] std::string display_name() const override {
    if (++name_calls_ > 1)
      throw std::logic_error("display_name called again");
    return "task ':link'";
  }

private:
  mutable int name_calls_ = 0;
};

} // namespace

int main() {
  // did work -> Executed
  {
    BuildCancellationToken token;
    TestWork work{[] { return true; }};
    const auto result = ExecuteStep{token}.execute(work);
    if (!result.is_success() || result.outcome() != WorkOutcome::Executed) {
      std::cerr << "expected Executed\n";
      return 1;
    }
  }

  // no work -> UpToDate
  {
    BuildCancellationToken token;
    TestWork work{[] { return false; }};
    const auto result = ExecuteStep{token}.execute(work);
    if (!result.is_success() || result.outcome() != WorkOutcome::UpToDate) {
      std::cerr << "expected UpToDate\n";
      return 1;
    }
  }

  // cancelled while executing -> Cancelled even though work completed
  {
    BuildCancellationToken token;
    TestWork work{[&token] {
      token.cancel();
      return true;
    }};
    const auto result = ExecuteStep{token}.execute(work);
    if (result.is_success() || result.outcome() != WorkOutcome::Cancelled ||
        !failure_is<treesnap::BuildCancelled>(result)) {
      std::cerr << "expected Cancelled\n";
      return 1;
    }
    if (treesnap::describe(result.failure()) != "Build cancelled during executing task ':compile'") {
      std::cerr << "unexpected cancellation message: " << treesnap::describe(result.failure()) << "\n";
      return 1;
    }
  }

  // throwing -> ExecutionFailure wrapping the cause, regardless of cancellation
  for (const bool cancel : {false, true}) {
    BuildCancellationToken token;
    TestWork work{[&token, cancel]() -> bool {
      if (cancel)
        token.cancel();
      throw std::logic_error("boom");
    }};
    const auto result = ExecuteStep{token}.execute(work);
    if (result.is_success() || result.outcome() != WorkOutcome::ExecutionFailure) {
      std::cerr << "expected ExecutionFailure\n";
      return 1;
    }
    try {
      result.rethrow_failure();
      std::cerr << "failure was not carried\n";
      return 1;
    } catch (const treesnap::ExecutionFailure &e) {
      if (e.display_name() != "task ':compile'" || treesnap::describe(e.cause()) != "boom" ||
          !failure_is<std::logic_error>(treesnap::WorkResult::failure(WorkOutcome::ExecutionFailure, e.cause()))) {
        std::cerr << "execution failure lost its cause\n";
        return 1;
      }
    }
  }

  // failure path names the work exactly once
  {
    BuildCancellationToken token;
    NamedOnceWork work;
    try {
      const auto result = ExecuteStep{token}.execute(work);
      if (result.outcome() != WorkOutcome::ExecutionFailure ||
          treesnap::describe(result.failure()) != "Execution failed for task ':link': compile error") {
        std::cerr << "unexpected failure: " << treesnap::describe(result.failure()) << "\n";
        return 1;
      }
    } catch (const std::exception &e) {
      std::cerr << "execute escaped: " << e.what() << "\n";
      return 1;
    }
  }

  // Cancellation callbacks run once, late registrations run immediately
  {
    BuildCancellationToken token;
    int calls = 0;
    token.add_callback([&calls] { ++calls; });
    token.cancel();
    token.cancel();
    token.add_callback([&calls] { ++calls; });
    if (calls != 2 || !token.is_cancellation_requested()) {
      std::cerr << "cancellation callbacks misbehaved\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
