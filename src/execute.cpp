#include "treesnap/execute.hpp"

#include "treesnap/errors.hpp"
#include "treesnap/log.hpp"

#include <stdexcept>
#include <string>

namespace treesnap {

void BuildCancellationToken::cancel() {
  std::vector<std::function<void()>> to_run;
  {
    const std::lock_guard lock(mutex_);
    if (cancelled_.exchange(true)) {
      return;
    }
    to_run.swap(callbacks_);
  }
  for (auto &callback : to_run) {
    callback();
  }
}

void BuildCancellationToken::add_callback(std::function<void()> callback) {
  {
    const std::lock_guard lock(mutex_);
    if (!cancelled_.load()) {
      callbacks_.push_back(std::move(callback));
      return;
    }
  }
  callback();
}

std::string_view outcome_name(WorkOutcome outcome) {
  switch (outcome) {
  case WorkOutcome::Executed:
    return "EXECUTED";
  case WorkOutcome::UpToDate:
    return "UP-TO-DATE";
  case WorkOutcome::Cancelled:
    return "CANCELLED";
  case WorkOutcome::ExecutionFailure:
    return "FAILED";
  }
  return "UNKNOWN";
}

WorkResult WorkResult::success(WorkOutcome outcome) {
  if (outcome != WorkOutcome::Executed && outcome != WorkOutcome::UpToDate) {
    throw std::invalid_argument("success outcome must be Executed or UpToDate");
  }
  return WorkResult{outcome, nullptr};
}

WorkResult WorkResult::failure(WorkOutcome outcome, std::exception_ptr error) {
  if (!error) {
    throw std::invalid_argument("failure result needs an error");
  }
  return WorkResult{outcome, std::move(error)};
}

void WorkResult::rethrow_failure() const {
  if (failure_) {
    std::rethrow_exception(failure_);
  }
}

WorkResult ExecuteStep::execute(UnitOfWork &work) const {
  const std::string name = work.display_name();
  bool did_work = false;
  try {
    did_work = work.execute();
  } catch (...) {
    TREESNAP_LOG_INFO("execute: {} failed", name);
    return WorkResult::failure(WorkOutcome::ExecutionFailure,
                               std::make_exception_ptr(ExecutionFailure(name, std::current_exception())));
  }
  if (cancellation_token_.is_cancellation_requested()) {
    TREESNAP_LOG_INFO("execute: build cancelled during {}", name);
    return WorkResult::failure(
        WorkOutcome::Cancelled,
        std::make_exception_ptr(BuildCancelled("Build cancelled during executing " + name)));
  }
  return WorkResult::success(did_work ? WorkOutcome::Executed : WorkOutcome::UpToDate);
}

} // namespace treesnap
