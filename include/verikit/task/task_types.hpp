#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "verikit/api/export.hpp"

namespace verikit {
namespace task {

// Dense node index; equals the task's position in the declaration list.
typedef std::size_t TaskIndex;

typedef std::chrono::system_clock::time_point WallTime;

enum class TaskStatus : std::uint8_t {
  kPending = 0,
  kReady = 1,
  kRunning = 2,
  kSucceeded = 3,
  kFailed = 4,
  kTimedOut = 5
};

// Selects an entry of the invocation table.
enum class TaskKind : std::uint8_t {
  kProof = 0,
  kModelCheck = 1,
  kTestHarness = 2,
  kCustom = 3
};

enum class OutcomeKind : std::uint8_t { kSucceeded = 0, kFailed = 1, kTimedOut = 2 };

struct TaskDeclaration {
  std::string name;
  std::vector<std::string> dependencies;
  TaskKind kind = TaskKind::kCustom;
  std::string target;
  std::vector<std::string> extra_args;
  std::map<std::string, std::string> params;
  // Caps the session deadline for this task; 0 leaves the session deadline.
  std::uint32_t timeout_seconds = 0;
};

// Deadline for one task: the tighter of the task cap and the session
// deadline, either of which may be 0 (unlimited).
VERIKIT_API std::uint32_t EffectiveTimeout(const TaskDeclaration& task,
                                           std::uint32_t session_timeout_seconds);

// Result of one Verifier invocation. Recorded once per task.
struct Outcome {
  OutcomeKind kind = OutcomeKind::kFailed;
  int exit_code = 0;
  double duration_seconds = 0.0;
  std::string log_path;
  std::string message;

  static Outcome Succeeded(double duration_seconds, const std::string& log_path);
  static Outcome Failed(int exit_code, double duration_seconds, const std::string& log_path);
  static Outcome TimedOut(double duration_seconds, const std::string& log_path);

  TaskStatus ToStatus() const;
};

VERIKIT_API const char* TaskStatusName(TaskStatus status);
VERIKIT_API bool IsTerminal(TaskStatus status);

VERIKIT_API const char* TaskKindName(TaskKind kind);
// Accepts "proof", "model", "test", "custom" (and a few aliases).
VERIKIT_API bool ParseTaskKind(const std::string& text, TaskKind* out);

VERIKIT_API const char* OutcomeKindName(OutcomeKind kind);

}  // namespace task
}  // namespace verikit
