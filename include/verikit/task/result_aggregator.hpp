#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"
#include "verikit/task/scheduler.hpp"
#include "verikit/task/task_types.hpp"

namespace verikit {
namespace task {

enum class OverallStatus : std::uint8_t { kSuccess = 0, kFailure = 1, kTimeout = 2 };

struct TaskSummary {
  std::string name;
  TaskStatus status = TaskStatus::kPending;
  double duration_seconds = 0.0;
  std::vector<std::string> dependencies;
  int exit_code = 0;
  std::string log_path;
  bool requested = false;
  bool launched = false;
  std::uint32_t attempts = 0;  // 0 when the Verifier never ran
  std::string note;
  std::string message;
};

struct SessionCounts {
  std::size_t total = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;  // includes propagated
  std::size_t timed_out = 0;
  std::size_t propagated = 0;  // failed without the Verifier running
};

struct SessionSummary {
  std::vector<std::string> requested;
  std::size_t max_concurrency = 0;
  std::uint32_t task_timeout_seconds = 0;
  bool fail_fast = false;
  bool fail_fast_triggered = false;
  SessionCounts counts;
  OverallStatus overall = OverallStatus::kSuccess;
  double total_duration_seconds = 0.0;
  WallTime started_at;
  WallTime finished_at;
  std::vector<TaskSummary> tasks;  // execution order
};

class VERIKIT_API ResultAggregator {
 public:
  // Reads a finished session. Every record must be terminal, otherwise
  // SCHED_AGGREGATION_INCONSISTENCY.
  //
  // Overall: kFailure if any task failed, propagated failures included;
  // else kTimeout if any timed out; else kSuccess.
  static api::Result<SessionSummary> Summarize(const ExecutionSession& session);
};

VERIKIT_API const char* OverallStatusName(OverallStatus status);

// 0 success, 1 failure, 2 timeout.
VERIKIT_API int ExitCodeFor(OverallStatus status);

}  // namespace task
}  // namespace verikit
