#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace treesnap {

// Opaque piece of work whose outcome is classified.
class UnitOfWork {
public:
  virtual ~UnitOfWork() = default;

  // true if work was actually performed, false if it was up to date
  virtual bool execute() = 0;
  [[nodiscard]] virtual std::string display_name() const = 0;
};

/**
 * Cooperative cancellation flag owned by the build. Thread-safe.
 * Callbacks run once, on the thread that calls cancel() (or immediately when
 * added after cancellation).
 */
class BuildCancellationToken {
public:
  void cancel();
  [[nodiscard]] bool is_cancellation_requested() const { return cancelled_.load(); }
  void add_callback(std::function<void()> callback);

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::vector<std::function<void()>> callbacks_;
};

enum class WorkOutcome : std::uint8_t { Executed, UpToDate, Cancelled, ExecutionFailure };

std::string_view outcome_name(WorkOutcome outcome);

// Success carries Executed/UpToDate; failure carries the error
// (ExecutionFailure or BuildCancelled).
class WorkResult {
public:
  static WorkResult success(WorkOutcome outcome);
  static WorkResult failure(WorkOutcome outcome, std::exception_ptr error);

  [[nodiscard]] WorkOutcome outcome() const { return outcome_; }
  [[nodiscard]] bool is_success() const { return !failure_; }
  [[nodiscard]] std::exception_ptr failure() const { return failure_; }

  // Throw the carried failure, if any.
  void rethrow_failure() const;

private:
  WorkResult(WorkOutcome outcome, std::exception_ptr failure)
      : outcome_(outcome), failure_(std::move(failure)) {}

  WorkOutcome outcome_;
  std::exception_ptr failure_;
};

// Runs a unit of work synchronously and classifies what happened.
class ExecuteStep {
public:
  explicit ExecuteStep(const BuildCancellationToken &cancellation_token)
      : cancellation_token_(cancellation_token) {}

  // Never throws for failures of `work`; they come back inside the result.
  WorkResult execute(UnitOfWork &work) const;

private:
  const BuildCancellationToken &cancellation_token_;
};

} // namespace treesnap
