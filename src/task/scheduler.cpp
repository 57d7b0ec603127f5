#include "verikit/task/scheduler.hpp"

#include <chrono>
#include <set>
#include <system_error>
#include <utility>

#include <glog/logging.h>

#include "task/session_loop.hpp"
#include "task/worker_pool.hpp"
#include "verikit/task/dependency_resolver.hpp"

namespace verikit {
namespace task {

const TaskRecord* ExecutionSession::Find(const std::string& name) const {
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (records[i].name == name) return &records[i];
  }
  return NULL;
}

Scheduler::Scheduler(const TaskGraph& graph, const TaskExecutor& executor,
                     const SchedulerOptions& options)
    : graph_(graph), executor_(executor), options_(options), observer_(NULL) {}

api::Result<ExecutionSession> Scheduler::Plan(const std::vector<std::string>& requested) const {
  if (requested.empty()) {
    return api::Result<ExecutionSession>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, "no task requested", api::ErrorModule::kConfig,
        api::detail::kConfigInvalidOption));
  }

  for (std::size_t i = 0; i < requested.size(); ++i) {
    if (requested[i] == kAllTasks || graph_.Contains(requested[i])) continue;
    return api::Result<ExecutionSession>(api::Status::FromModule(
        api::StatusCode::kNotFound, "unknown task '" + requested[i] + "'",
        api::ErrorModule::kConfig, api::detail::kConfigUnknownTask));
  }

  api::Result<std::vector<TaskIndex> > order = DependencyResolver::Plan(graph_, requested);
  if (!order.ok()) return api::Result<ExecutionSession>(order.status());

  ExecutionSession session;
  session.requested = DependencyResolver::ExpandRequest(graph_, requested);
  session.order = order.value();
  session.options = options_;
  session.options.max_concurrency = WorkerPool::NormalizeWorkerCount(options_.max_concurrency);

  std::set<std::string> requested_names(session.requested.begin(), session.requested.end());
  session.records.resize(session.order.size());
  for (std::size_t slot = 0; slot < session.order.size(); ++slot) {
    const TaskIndex index = session.order[slot];
    TaskRecord& rec = session.records[slot];
    rec.index = index;
    rec.name = graph_.name(index);
    rec.requested = requested_names.count(rec.name) != 0;
    const std::vector<TaskIndex>& deps = graph_.dependencies(index);
    for (std::size_t d = 0; d < deps.size(); ++d) rec.dependencies.push_back(graph_.name(deps[d]));
  }
  return api::Result<ExecutionSession>(std::move(session));
}

api::Result<ExecutionSession> Scheduler::Run(const std::vector<std::string>& requested) {
  api::Result<ExecutionSession> planned = Plan(requested);
  if (!planned.ok()) return planned;

  ExecutionSession& session = planned.value();
  LOG(INFO) << "scheduling " << session.order.size() << " task(s), concurrency "
            << session.options.max_concurrency << ", timeout "
            << session.options.task_timeout_seconds << "s"
            << (session.options.fail_fast ? ", fail-fast" : "");

  session.started_at = std::chrono::system_clock::now();
  api::Status st;
  try {
    SessionLoop loop(graph_, executor_, observer_, &session);
    st = loop.Execute();
  } catch (const std::system_error& ex) {
    st = api::Status::FromModule(api::StatusCode::kInternalError,
                                 std::string("cannot start workers: ") + ex.what(),
                                 api::ErrorModule::kSched);
  }
  session.finished_at = std::chrono::system_clock::now();
  if (!st.ok()) {
    LOG(ERROR) << "session aborted: " << st.ToString();
    return api::Result<ExecutionSession>(st);
  }
  return planned;
}

}  // namespace task
}  // namespace verikit
