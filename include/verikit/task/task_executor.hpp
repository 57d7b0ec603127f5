#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "verikit/api/export.hpp"
#include "verikit/task/i_verifier.hpp"
#include "verikit/task/task_types.hpp"

namespace verikit {
namespace task {

struct TaskExecutorOptions {
  // How long a cancelled Verifier may take to return before it is abandoned.
  std::uint32_t grace_period_ms = 2000;
  // Invocations allowed per task. A Failed outcome is retried while attempts
  // remain; TimedOut never is. 0 is treated as 1.
  std::uint32_t max_attempts = 1;
};

struct ExecutionReport {
  Outcome outcome;
  WallTime started_at;
  WallTime finished_at;
  // The Verifier ignored cancellation and was left running detached.
  bool abandoned = false;
  std::uint32_t attempts = 1;  // Verifier invocations, retries included
};

// Runs a Verifier invocation under a deadline and classifies the result:
// exit 0 -> Succeeded, deadline or Verifier-side kill -> TimedOut, any other
// exit status -> Failed(code), Verifier error -> Failed(-1).
//
// The invocation runs on its own thread. On deadline expiry the executor
// cancels it, waits at most the grace period and returns TimedOut either
// way, so the calling worker is always released. A Failed attempt is
// repeated up to max_attempts; the report describes the last attempt and
// starts at the first.
class VERIKIT_API TaskExecutor {
 public:
  explicit TaskExecutor(std::shared_ptr<IVerifier> verifier,
                        const TaskExecutorOptions& options = TaskExecutorOptions());

  TaskExecutor(const TaskExecutor&) = delete;
  TaskExecutor& operator=(const TaskExecutor&) = delete;

  // Deadline is request.timeout_seconds; 0 waits indefinitely.
  ExecutionReport Run(const VerifierRequest& request) const;

  ExecutionReport Run(const TaskDeclaration& task, std::uint32_t timeout_seconds) const;

  const TaskExecutorOptions& options() const { return options_; }
  std::uint64_t abandoned_count() const { return abandoned_.load(std::memory_order_relaxed); }

  static VerifierRequest MakeRequest(const TaskDeclaration& task, std::uint32_t timeout_seconds);

 private:
  ExecutionReport RunOnce(const VerifierRequest& request) const;

  std::shared_ptr<IVerifier> verifier_;
  TaskExecutorOptions options_;
  mutable std::atomic<std::uint64_t> abandoned_;
};

}  // namespace task
}  // namespace verikit
