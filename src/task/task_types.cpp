#include "verikit/task/task_types.hpp"

namespace verikit {
namespace task {

Outcome Outcome::Succeeded(double duration_seconds, const std::string& log_path) {
  Outcome out;
  out.kind = OutcomeKind::kSucceeded;
  out.exit_code = 0;
  out.duration_seconds = duration_seconds;
  out.log_path = log_path;
  return out;
}

Outcome Outcome::Failed(int exit_code, double duration_seconds, const std::string& log_path) {
  Outcome out;
  out.kind = OutcomeKind::kFailed;
  out.exit_code = exit_code;
  out.duration_seconds = duration_seconds;
  out.log_path = log_path;
  return out;
}

Outcome Outcome::TimedOut(double duration_seconds, const std::string& log_path) {
  Outcome out;
  out.kind = OutcomeKind::kTimedOut;
  out.exit_code = 124;
  out.duration_seconds = duration_seconds;
  out.log_path = log_path;
  return out;
}

TaskStatus Outcome::ToStatus() const {
  switch (kind) {
    case OutcomeKind::kSucceeded:
      return TaskStatus::kSucceeded;
    case OutcomeKind::kTimedOut:
      return TaskStatus::kTimedOut;
    case OutcomeKind::kFailed:
    default:
      return TaskStatus::kFailed;
  }
}

const char* TaskStatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kReady:
      return "ready";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kSucceeded:
      return "succeeded";
    case TaskStatus::kFailed:
      return "failed";
    case TaskStatus::kTimedOut:
      return "timed_out";
    default:
      return "unknown";
  }
}

bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kSucceeded || status == TaskStatus::kFailed ||
         status == TaskStatus::kTimedOut;
}

std::uint32_t EffectiveTimeout(const TaskDeclaration& task, std::uint32_t session_timeout_seconds) {
  if (task.timeout_seconds == 0) return session_timeout_seconds;
  if (session_timeout_seconds == 0) return task.timeout_seconds;
  return task.timeout_seconds < session_timeout_seconds ? task.timeout_seconds
                                                        : session_timeout_seconds;
}

const char* TaskKindName(TaskKind kind) {
  switch (kind) {
    case TaskKind::kProof:
      return "proof";
    case TaskKind::kModelCheck:
      return "model";
    case TaskKind::kTestHarness:
      return "test";
    case TaskKind::kCustom:
      return "custom";
    default:
      return "unknown";
  }
}

bool ParseTaskKind(const std::string& text, TaskKind* out) {
  if (out == NULL) return false;
  if (text == "proof" || text == "tlaps") {
    *out = TaskKind::kProof;
  } else if (text == "model" || text == "tlc") {
    *out = TaskKind::kModelCheck;
  } else if (text == "test" || text == "stateright") {
    *out = TaskKind::kTestHarness;
  } else if (text == "custom") {
    *out = TaskKind::kCustom;
  } else {
    return false;
  }
  return true;
}

const char* OutcomeKindName(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kSucceeded:
      return "succeeded";
    case OutcomeKind::kFailed:
      return "failed";
    case OutcomeKind::kTimedOut:
      return "timed_out";
    default:
      return "unknown";
  }
}

}  // namespace task
}  // namespace verikit
