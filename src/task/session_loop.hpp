#pragma once

#include <cstddef>
#include <set>
#include <vector>

#include "task/completion_channel.hpp"
#include "task/worker_pool.hpp"
#include "verikit/api/status.hpp"
#include "verikit/task/scheduler.hpp"

namespace verikit {
namespace task {

// Single-threaded control loop for one session. Owns the ready queue; the
// session's records are mutated only here.
class SessionLoop {
 public:
  // Starts the worker pool; throws std::system_error if it cannot.
  SessionLoop(const TaskGraph& graph, const TaskExecutor& executor, ISessionObserver* observer,
              ExecutionSession* session);

  SessionLoop(const SessionLoop&) = delete;
  SessionLoop& operator=(const SessionLoop&) = delete;

  // Runs until every record is terminal. A completion that does not belong
  // to a running task, or a loop with pending work and nothing running, is
  // SCHED_AGGREGATION_INCONSISTENCY.
  api::Status Execute();

  // Workers report here.
  CompletionChannel* channel() { return &channel_; }

  std::size_t worker_count() const { return pool_.worker_count(); }

  // max_concurrency bounded by the number of tasks, at least 1.
  static std::size_t WorkerCountFor(const ExecutionSession& session);

 private:
  TaskRecord& record(std::size_t slot) { return session_->records[slot]; }

  void Transition(std::size_t slot, TaskStatus to);
  void MarkReady(std::size_t slot);
  void LaunchReady();
  api::Status HandleCompletion(const TaskCompletion& completion);
  void OnUnsuccessful(std::size_t slot);
  void Cascade(std::size_t failed_slot);
  void AbortPending();

  const TaskGraph& graph_;
  const TaskExecutor& executor_;
  ISessionObserver* observer_;
  ExecutionSession* session_;

  std::vector<std::size_t> slot_of_;
  std::vector<std::size_t> unresolved_;
  std::set<TaskIndex> ready_;  // ordered by declaration index
  std::size_t running_;
  std::size_t terminal_;

  // Declared after the channel: the pool joins its workers, which may still
  // post, before the channel goes away.
  CompletionChannel channel_;
  WorkerPool pool_;
};

}  // namespace task
}  // namespace verikit
