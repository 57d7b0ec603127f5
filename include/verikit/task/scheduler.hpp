#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"
#include "verikit/task/task_executor.hpp"
#include "verikit/task/task_graph.hpp"
#include "verikit/task/task_types.hpp"

namespace verikit {
namespace task {

struct SchedulerOptions {
  std::size_t max_concurrency = 0;  // 0 -> hardware concurrency
  std::uint32_t task_timeout_seconds = 0;  // 0 disables the deadline
  bool fail_fast = false;
};

// Live status of one task within a session. Written only by the scheduler
// control loop.
struct TaskRecord {
  TaskIndex index = 0;
  std::string name;
  std::vector<std::string> dependencies;
  TaskStatus status = TaskStatus::kPending;
  bool requested = false;
  bool launched = false;  // the Verifier was invoked
  std::uint32_t attempts = 0;
  bool has_outcome = false;
  Outcome outcome;
  WallTime started_at;
  WallTime finished_at;
  std::string note;  // why the task ended without running
};

struct ExecutionSession {
  std::vector<std::string> requested;
  std::vector<TaskIndex> order;
  SchedulerOptions options;  // normalized
  std::vector<TaskRecord> records;  // parallel to order
  WallTime started_at;
  WallTime finished_at;
  bool fail_fast_triggered = false;
  std::size_t peak_running = 0;

  const TaskRecord* Find(const std::string& name) const;
};

struct TaskEvent {
  std::string task;
  TaskStatus from = TaskStatus::kPending;
  TaskStatus to = TaskStatus::kPending;
  std::size_t running = 0;  // tasks in kRunning after this transition
  WallTime at;
};

// 会话观察者：接收调度过程中每个任务的状态变化。
class ISessionObserver {
 public:
  virtual ~ISessionObserver() {}

  // 任务状态每变化一次调用一次，顺序与实际发生顺序一致。
  // 参数：
  // - event: 任务名、变化前后的状态、变化后处于 kRunning 的任务数与时间。
  // 线程：只在调度控制循环线程上调用，实现不得阻塞，也不得回调 Scheduler。
  virtual void OnTaskEvent(const TaskEvent& event) = 0;
};

// Runs a requested task set to completion under a bounded worker pool.
//
// Dependents of a task that ends Failed or TimedOut are marked Failed
// without running; unrelated branches keep running unless fail_fast is set,
// in which case nothing new is launched after the first failure.
class VERIKIT_API Scheduler {
 public:
  Scheduler(const TaskGraph& graph, const TaskExecutor& executor,
            const SchedulerOptions& options = SchedulerOptions());

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Not owned. May be NULL.
  void SetObserver(ISessionObserver* observer) { observer_ = observer; }

  // Resolves the request into a session whose records are all kPending.
  // Errors: CONFIG_INVALID_OPTION for an empty request, CONFIG_UNKNOWN_TASK.
  api::Result<ExecutionSession> Plan(const std::vector<std::string>& requested) const;

  // Plan() then execute. Per-task failures are recorded in the session; a
  // non-ok result means the run never started or an internal invariant broke
  // (SCHED_AGGREGATION_INCONSISTENCY).
  api::Result<ExecutionSession> Run(const std::vector<std::string>& requested);

  const SchedulerOptions& options() const { return options_; }

 private:
  const TaskGraph& graph_;
  const TaskExecutor& executor_;
  SchedulerOptions options_;
  ISessionObserver* observer_;
};

}  // namespace task
}  // namespace verikit
