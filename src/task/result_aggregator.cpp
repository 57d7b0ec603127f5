#include "verikit/task/result_aggregator.hpp"

#include <chrono>
#include <utility>

namespace verikit {
namespace task {

api::Result<SessionSummary> ResultAggregator::Summarize(const ExecutionSession& session) {
  SessionSummary summary;
  summary.requested = session.requested;
  summary.max_concurrency = session.options.max_concurrency;
  summary.task_timeout_seconds = session.options.task_timeout_seconds;
  summary.fail_fast = session.options.fail_fast;
  summary.fail_fast_triggered = session.fail_fast_triggered;
  summary.started_at = session.started_at;
  summary.finished_at = session.finished_at;
  if (session.finished_at > session.started_at) {
    summary.total_duration_seconds =
        std::chrono::duration<double>(session.finished_at - session.started_at).count();
  }

  summary.tasks.reserve(session.records.size());
  for (std::size_t i = 0; i < session.records.size(); ++i) {
    const TaskRecord& rec = session.records[i];
    if (!IsTerminal(rec.status)) {
      return api::Result<SessionSummary>(api::Status::FromModule(
          api::StatusCode::kInternalError,
          "task " + rec.name + " is still " + TaskStatusName(rec.status) + " at aggregation",
          api::ErrorModule::kSched, api::detail::kSchedAggregationInconsistency));
    }
    if (rec.has_outcome && rec.outcome.ToStatus() != rec.status) {
      return api::Result<SessionSummary>(api::Status::FromModule(
          api::StatusCode::kInternalError,
          "task " + rec.name + " is " + TaskStatusName(rec.status) + " but its outcome is " +
              OutcomeKindName(rec.outcome.kind),
          api::ErrorModule::kSched, api::detail::kSchedAggregationInconsistency));
    }

    TaskSummary entry;
    entry.name = rec.name;
    entry.status = rec.status;
    entry.dependencies = rec.dependencies;
    entry.requested = rec.requested;
    entry.launched = rec.launched;
    entry.attempts = rec.attempts;
    entry.note = rec.note;
    if (rec.has_outcome) {
      entry.duration_seconds = rec.outcome.duration_seconds;
      entry.exit_code = rec.outcome.exit_code;
      entry.log_path = rec.outcome.log_path;
      entry.message = rec.outcome.message;
    }
    summary.tasks.push_back(entry);

    ++summary.counts.total;
    switch (rec.status) {
      case TaskStatus::kSucceeded:
        ++summary.counts.succeeded;
        break;
      case TaskStatus::kTimedOut:
        ++summary.counts.timed_out;
        break;
      default:
        ++summary.counts.failed;
        if (!rec.launched) ++summary.counts.propagated;
        break;
    }
  }

  // A failure outranks any number of timeouts.
  if (summary.counts.failed > 0) {
    summary.overall = OverallStatus::kFailure;
  } else if (summary.counts.timed_out > 0) {
    summary.overall = OverallStatus::kTimeout;
  } else {
    summary.overall = OverallStatus::kSuccess;
  }
  return api::Result<SessionSummary>(std::move(summary));
}

const char* OverallStatusName(OverallStatus status) {
  switch (status) {
    case OverallStatus::kSuccess:
      return "success";
    case OverallStatus::kFailure:
      return "failure";
    case OverallStatus::kTimeout:
      return "timeout";
  }
  return "unknown";
}

int ExitCodeFor(OverallStatus status) {
  switch (status) {
    case OverallStatus::kSuccess:
      return 0;
    case OverallStatus::kFailure:
      return 1;
    case OverallStatus::kTimeout:
      return 2;
  }
  return 1;
}

}  // namespace task
}  // namespace verikit
