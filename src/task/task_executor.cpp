#include "verikit/task/task_executor.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

#include <glog/logging.h>

namespace verikit {
namespace task {

namespace {

// State shared by the executor and the invocation thread. Owned jointly so an
// abandoned invocation can finish after Run() has returned.
struct Invocation {
  Invocation() : done(false), result(api::Status::Ok()) {}

  std::mutex mu;
  std::condition_variable cv;
  bool done;
  api::Result<VerifierResult> result;
  CancellationToken cancel;
};

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

void Invoke(std::shared_ptr<Invocation> invocation, std::shared_ptr<IVerifier> verifier,
            VerifierRequest request) {
  api::Result<VerifierResult> result(api::Status::Ok());
  try {
    result = verifier->Execute(request, &invocation->cancel);
  } catch (const std::exception& ex) {
    result = api::Result<VerifierResult>(api::Status::FromModule(
        api::StatusCode::kInternalError, std::string("verifier threw: ") + ex.what(),
        api::ErrorModule::kExec, api::detail::kExecVerifierFailed));
  }
  {
    std::lock_guard<std::mutex> lock(invocation->mu);
    invocation->result = result;
    invocation->done = true;
  }
  invocation->cv.notify_all();
}

Outcome Classify(const api::Result<VerifierResult>& result, double elapsed) {
  if (!result.ok()) {
    Outcome out = Outcome::Failed(-1, elapsed, std::string());
    out.message = result.status().ToString();
    return out;
  }
  const VerifierResult& vr = result.value();
  const double duration = vr.duration_seconds > 0.0 ? vr.duration_seconds : elapsed;
  if (vr.terminated) return Outcome::TimedOut(duration, vr.log_path);
  if (vr.exit_code == 0) return Outcome::Succeeded(duration, vr.log_path);
  return Outcome::Failed(vr.exit_code, duration, vr.log_path);
}

}  // namespace

TaskExecutor::TaskExecutor(std::shared_ptr<IVerifier> verifier,
                           const TaskExecutorOptions& options)
    : verifier_(std::move(verifier)), options_(options), abandoned_(0) {}

VerifierRequest TaskExecutor::MakeRequest(const TaskDeclaration& task,
                                          std::uint32_t timeout_seconds) {
  VerifierRequest request;
  request.task_id = task.name;
  request.kind = task.kind;
  request.target = task.target;
  request.extra_args = task.extra_args;
  request.params = task.params;
  request.timeout_seconds = timeout_seconds;
  return request;
}

ExecutionReport TaskExecutor::Run(const TaskDeclaration& task,
                                  std::uint32_t timeout_seconds) const {
  return Run(MakeRequest(task, timeout_seconds));
}

ExecutionReport TaskExecutor::Run(const VerifierRequest& request) const {
  const std::uint32_t max_attempts = options_.max_attempts == 0 ? 1 : options_.max_attempts;
  ExecutionReport report = RunOnce(request);
  while (report.outcome.kind == OutcomeKind::kFailed && !report.abandoned &&
         report.attempts < max_attempts) {
    LOG(WARNING) << "task " << request.task_id << " attempt " << report.attempts << "/"
                 << max_attempts << " failed with exit code " << report.outcome.exit_code
                 << ", retrying";
    ExecutionReport next = RunOnce(request);
    next.attempts = report.attempts + 1;
    next.started_at = report.started_at;
    report = next;
  }
  return report;
}

ExecutionReport TaskExecutor::RunOnce(const VerifierRequest& request) const {
  ExecutionReport report;
  report.started_at = std::chrono::system_clock::now();
  const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

  if (!verifier_) {
    report.outcome = Outcome::Failed(-1, 0.0, std::string());
    report.outcome.message = "no verifier configured";
    report.finished_at = std::chrono::system_clock::now();
    return report;
  }

  std::shared_ptr<Invocation> invocation(new Invocation());
  std::thread worker(&Invoke, invocation, verifier_, request);

  bool finished = false;
  bool timed_out = false;
  {
    std::unique_lock<std::mutex> lock(invocation->mu);
    if (request.timeout_seconds == 0) {
      invocation->cv.wait(lock, [&invocation]() { return invocation->done; });
      finished = true;
    } else {
      finished = invocation->cv.wait_for(lock, std::chrono::seconds(request.timeout_seconds),
                                         [&invocation]() { return invocation->done; });
    }
  }

  if (!finished) {
    timed_out = true;
    VLOG(1) << "task " << request.task_id << " exceeded " << request.timeout_seconds
            << "s, cancelling";
    invocation->cancel.Cancel();
    std::unique_lock<std::mutex> lock(invocation->mu);
    finished = invocation->cv.wait_for(lock, std::chrono::milliseconds(options_.grace_period_ms),
                                       [&invocation]() { return invocation->done; });
  }

  if (finished) {
    worker.join();
  } else {
    // The Verifier ignored cancellation. Its thread keeps the shared state
    // and the Verifier alive until it returns.
    worker.detach();
    report.abandoned = true;
    abandoned_.fetch_add(1, std::memory_order_relaxed);
    LOG(WARNING) << "task " << request.task_id << " did not stop within "
                 << options_.grace_period_ms << "ms of cancellation; abandoning invocation";
  }

  const double elapsed = SecondsSince(start);
  if (timed_out) {
    std::string log_path;
    if (finished && invocation->result.ok()) log_path = invocation->result.value().log_path;
    report.outcome = Outcome::TimedOut(elapsed, log_path);
  } else {
    report.outcome = Classify(invocation->result, elapsed);
  }
  report.finished_at = std::chrono::system_clock::now();
  return report;
}

}  // namespace task
}  // namespace verikit
