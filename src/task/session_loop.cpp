#include "task/session_loop.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <limits>
#include <string>
#include <thread>
#include <utility>

#include <glog/logging.h>

namespace verikit {
namespace task {

#define VK_SCHED_STATUS(message)                                                  \
  api::Status::FromModule(api::StatusCode::kInternalError, (message), api::ErrorModule::kSched, \
                          api::detail::kSchedAggregationInconsistency)

namespace {

const std::size_t kNoSlot = std::numeric_limits<std::size_t>::max();

// The control loop blocks until every launched task has posted, so a failed
// post is retried rather than dropped.
void PostCompletion(CompletionChannel* channel, TaskCompletion&& completion) {
  for (int attempt = 0;; ++attempt) {
    api::Status st = channel->Post(std::move(completion));
    if (st.ok()) return;
    if (attempt % 50 == 0) {
      LOG(ERROR) << "posting completion for slot " << completion.slot
                 << " failed: " << st.ToString();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

}  // namespace

SessionLoop::SessionLoop(const TaskGraph& graph, const TaskExecutor& executor,
                         ISessionObserver* observer, ExecutionSession* session)
    : graph_(graph),
      executor_(executor),
      observer_(observer),
      session_(session),
      slot_of_(graph.size(), kNoSlot),
      unresolved_(session->records.size(), 0),
      running_(0),
      terminal_(0),
      pool_(WorkerCountFor(*session)) {
  for (std::size_t slot = 0; slot < session_->order.size(); ++slot) {
    slot_of_[session_->order[slot]] = slot;
  }
}

std::size_t SessionLoop::WorkerCountFor(const ExecutionSession& session) {
  const std::size_t bound = std::min(session.options.max_concurrency, session.order.size());
  return bound == 0 ? 1 : bound;
}

api::Status SessionLoop::Execute() {
  const std::size_t total = session_->records.size();
  for (std::size_t slot = 0; slot < total; ++slot) {
    const std::vector<TaskIndex>& deps = graph_.dependencies(session_->order[slot]);
    for (std::size_t d = 0; d < deps.size(); ++d) {
      if (slot_of_[deps[d]] != kNoSlot) ++unresolved_[slot];
    }
    if (unresolved_[slot] == 0) MarkReady(slot);
  }

  while (terminal_ < total) {
    LaunchReady();
    if (terminal_ == total) break;
    if (running_ == 0) {
      return VK_SCHED_STATUS("scheduler stalled with " + std::to_string(total - terminal_) +
                             " unfinished tasks and none running");
    }
    TaskCompletion completion;
    channel_.Wait(&completion);
    api::Status st = HandleCompletion(completion);
    if (!st.ok()) return st;
  }
  const WorkerPoolStats stats = pool_.Stats();
  VLOG(1) << "worker pool: " << stats.submitted << " submitted, " << stats.completed
          << " completed, peak busy " << stats.busy_high_watermark;
  return api::Status::Ok();
}

void SessionLoop::Transition(std::size_t slot, TaskStatus to) {
  TaskRecord& rec = record(slot);
  TaskEvent event;
  event.task = rec.name;
  event.from = rec.status;
  event.to = to;
  event.running = running_;
  event.at = std::chrono::system_clock::now();
  rec.status = to;
  if (IsTerminal(to)) ++terminal_;
  VLOG(1) << "task " << rec.name << ": " << TaskStatusName(event.from) << " -> "
          << TaskStatusName(to) << " (running " << running_ << ")";
  if (observer_ != NULL) observer_->OnTaskEvent(event);
}

void SessionLoop::MarkReady(std::size_t slot) {
  ready_.insert(session_->order[slot]);
  Transition(slot, TaskStatus::kReady);
}

void SessionLoop::LaunchReady() {
  while (running_ < session_->options.max_concurrency && !ready_.empty() &&
         !session_->fail_fast_triggered) {
    const TaskIndex index = *ready_.begin();
    ready_.erase(ready_.begin());
    const std::size_t slot = slot_of_[index];

    TaskRecord& rec = record(slot);
    rec.launched = true;
    rec.started_at = std::chrono::system_clock::now();
    ++running_;
    if (running_ > session_->peak_running) session_->peak_running = running_;
    Transition(slot, TaskStatus::kRunning);

    const TaskDeclaration& decl = graph_.node(index).declaration;
    const VerifierRequest request = TaskExecutor::MakeRequest(
        decl, EffectiveTimeout(decl, session_->options.task_timeout_seconds));
    const TaskExecutor* executor = &executor_;
    CompletionChannel* channel = &channel_;
    api::Status st = pool_.Submit([executor, channel, request, slot]() {
      TaskCompletion completion;
      completion.slot = slot;
      try {
        completion.report = executor->Run(request);
      } catch (const std::exception& ex) {
        // Every launched task must post exactly one completion.
        completion.report.outcome = Outcome::Failed(-1, 0.0, std::string());
        completion.report.outcome.message = std::string("executor threw: ") + ex.what();
        completion.report.started_at = std::chrono::system_clock::now();
        completion.report.finished_at = completion.report.started_at;
      }
      PostCompletion(channel, std::move(completion));
    });
    if (!st.ok()) {
      LOG(ERROR) << "cannot launch task " << rec.name << ": " << st.ToString();
      --running_;
      rec.outcome = Outcome::Failed(-1, 0.0, std::string());
      rec.outcome.message = st.ToString();
      rec.has_outcome = true;
      rec.finished_at = std::chrono::system_clock::now();
      Transition(slot, TaskStatus::kFailed);
      OnUnsuccessful(slot);
    }
  }
}

api::Status SessionLoop::HandleCompletion(const TaskCompletion& completion) {
  if (completion.slot >= session_->records.size()) {
    return VK_SCHED_STATUS("completion for unknown slot " + std::to_string(completion.slot));
  }
  TaskRecord& rec = record(completion.slot);
  if (rec.status != TaskStatus::kRunning || rec.has_outcome) {
    return VK_SCHED_STATUS("task " + rec.name + " reported terminal while " +
                           TaskStatusName(rec.status));
  }

  --running_;
  rec.outcome = completion.report.outcome;
  rec.has_outcome = true;
  rec.attempts = completion.report.attempts;
  rec.started_at = completion.report.started_at;
  rec.finished_at = completion.report.finished_at;
  const TaskStatus status = rec.outcome.ToStatus();
  Transition(completion.slot, status);

  if (status == TaskStatus::kSucceeded) {
    LOG(INFO) << "task " << rec.name << " succeeded in " << rec.outcome.duration_seconds << "s";
    const std::vector<TaskIndex>& dependents = graph_.dependents(rec.index);
    for (std::size_t d = 0; d < dependents.size(); ++d) {
      const std::size_t dep_slot = slot_of_[dependents[d]];
      if (dep_slot == kNoSlot) continue;
      if (unresolved_[dep_slot] > 0) --unresolved_[dep_slot];
      if (unresolved_[dep_slot] == 0 && record(dep_slot).status == TaskStatus::kPending) {
        MarkReady(dep_slot);
      }
    }
    return api::Status::Ok();
  }

  if (status == TaskStatus::kTimedOut) {
    LOG(WARNING) << "task " << rec.name << " timed out after "
                 << rec.outcome.duration_seconds << "s";
  } else {
    LOG(WARNING) << "task " << rec.name << " failed with exit code " << rec.outcome.exit_code
                 << (rec.outcome.message.empty() ? "" : ": ") << rec.outcome.message;
  }
  OnUnsuccessful(completion.slot);
  return api::Status::Ok();
}

void SessionLoop::OnUnsuccessful(std::size_t slot) {
  Cascade(slot);
  if (session_->options.fail_fast && !session_->fail_fast_triggered) AbortPending();
}

// Marks every not-yet-terminal task downstream of `slot` as Failed.
void SessionLoop::Cascade(std::size_t failed_slot) {
  std::vector<std::size_t> stack(1, failed_slot);
  while (!stack.empty()) {
    const std::size_t slot = stack.back();
    stack.pop_back();
    const TaskRecord& cause = record(slot);
    const std::vector<TaskIndex>& dependents = graph_.dependents(cause.index);
    for (std::size_t d = 0; d < dependents.size(); ++d) {
      const std::size_t dep_slot = slot_of_[dependents[d]];
      if (dep_slot == kNoSlot || IsTerminal(record(dep_slot).status)) continue;
      TaskRecord& dep = record(dep_slot);
      dep.note = "dependency '" + cause.name + "' " + TaskStatusName(cause.status);
      dep.finished_at = std::chrono::system_clock::now();
      ready_.erase(dep.index);
      Transition(dep_slot, TaskStatus::kFailed);
      stack.push_back(dep_slot);
    }
  }
}

void SessionLoop::AbortPending() {
  session_->fail_fast_triggered = true;
  LOG(WARNING) << "fail-fast: no further tasks will be launched";
  ready_.clear();
  for (std::size_t slot = 0; slot < session_->records.size(); ++slot) {
    TaskRecord& rec = record(slot);
    if (rec.status != TaskStatus::kPending && rec.status != TaskStatus::kReady) continue;
    rec.note = "aborted (fail-fast)";
    rec.finished_at = std::chrono::system_clock::now();
    Transition(slot, TaskStatus::kFailed);
  }
}

#undef VK_SCHED_STATUS

}  // namespace task
}  // namespace verikit
