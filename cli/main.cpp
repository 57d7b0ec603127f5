#include "verikit/verikit.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace {

const int kExitConfigError = 3;
const int kExitInternalError = 4;

int ExitCodeForError(const verikit::api::Status& status) {
  const verikit::api::ErrorModule module = status.module();
  if (module == verikit::api::ErrorModule::kConfig || module == verikit::api::ErrorModule::kGraph) {
    return kExitConfigError;
  }
  return kExitInternalError;
}

int Fail(const char* what, const verikit::api::Status& status) {
  std::fprintf(stderr, "%s: %s\n", what, status.ToString().c_str());
  return ExitCodeForError(status);
}

// Prints one progress line per transition into a terminal status.
class ConsoleObserver : public verikit::task::ISessionObserver {
 public:
  void OnTaskEvent(const verikit::task::TaskEvent& event) override {
    using verikit::task::TaskStatus;
    const char* tag = NULL;
    switch (event.to) {
      case TaskStatus::kRunning:
        tag = "[ RUN    ]";
        break;
      case TaskStatus::kSucceeded:
        tag = "[     OK ]";
        break;
      case TaskStatus::kTimedOut:
        tag = "[TIMEOUT ]";
        break;
      case TaskStatus::kFailed:
        tag = event.from == TaskStatus::kRunning ? "[ FAILED ]" : "[ SKIPPED]";
        break;
      default:
        return;
    }
    std::printf("%s %s\n", tag, event.task.c_str());
    std::fflush(stdout);
  }
};

void PrintTaskList(const verikit::task::TaskGraph& graph) {
  for (verikit::task::TaskIndex i = 0; i < graph.size(); ++i) {
    const verikit::task::TaskDeclaration& decl = graph.node(i).declaration;
    std::string deps;
    for (std::size_t d = 0; d < decl.dependencies.size(); ++d) {
      if (d > 0) deps += ",";
      deps += decl.dependencies[d];
    }
    std::printf("%-36s %-7s %-40s %s\n", decl.name.c_str(), verikit::task::TaskKindName(decl.kind),
                decl.target.c_str(), deps.empty() ? "-" : deps.c_str());
  }
}

void PrintPlan(const verikit::task::ExecutionSession& session,
               const verikit::task::TaskGraph& graph,
               const verikit::verifier::ProcessVerifier& verifier) {
  std::printf("Execution order (%zu task(s), concurrency %zu, timeout %us):\n",
              session.order.size(), session.options.max_concurrency,
              session.options.task_timeout_seconds);
  for (std::size_t slot = 0; slot < session.order.size(); ++slot) {
    const verikit::task::TaskDeclaration& decl = graph.node(session.order[slot]).declaration;
    const verikit::task::VerifierRequest request = verikit::task::TaskExecutor::MakeRequest(
        decl, verikit::task::EffectiveTimeout(decl, session.options.task_timeout_seconds));
    verikit::api::Result<std::vector<std::string> > command = verifier.BuildCommand(request);
    std::string line;
    if (command.ok()) {
      for (std::size_t i = 0; i < command.value().size(); ++i) {
        if (i > 0) line += " ";
        line += command.value()[i];
      }
    } else {
      line = "<" + command.status().message() + ">";
    }
    std::printf("  %2zu. %-36s %s\n", slot + 1, session.records[slot].name.c_str(), line.c_str());
  }
}

void PrintSummary(const verikit::task::SessionSummary& summary, const std::string& path) {
  std::printf("\nVerification %s\n", verikit::task::OverallStatusName(summary.overall));
  std::printf("  Tasks: %zu  succeeded: %zu  failed: %zu (propagated %zu)  timed out: %zu\n",
              summary.counts.total, summary.counts.succeeded, summary.counts.failed,
              summary.counts.propagated, summary.counts.timed_out);
  std::printf("  Duration: %.1fs\n", summary.total_duration_seconds);
  std::printf("  Summary: %s\n", path.c_str());
}

int RunSession(const verikit::config::RunConfig& config) {
  verikit::config::TaskCatalog catalog;
  if (config.catalog_path.empty()) {
    catalog = verikit::config::DefaultCatalog();
  } else {
    verikit::api::Result<verikit::config::TaskCatalog> loaded =
        verikit::config::LoadTaskCatalog(config.catalog_path);
    if (!loaded.ok()) return Fail("catalog", loaded.status());
    catalog = loaded.value();
  }

  verikit::api::Result<verikit::task::TaskGraph> graph =
      verikit::task::TaskGraph::Build(catalog.tasks);
  if (!graph.ok()) return Fail("task graph", graph.status());

  if (config.list) {
    PrintTaskList(graph.value());
    return 0;
  }

  verikit::verifier::ProcessVerifierOptions verifier_options;
  verifier_options.invocations = catalog.invocations;
  verifier_options.log_dir = config.log_dir;
  verifier_options.workdir = config.workdir;
  std::shared_ptr<verikit::verifier::ProcessVerifier> verifier(
      new verikit::verifier::ProcessVerifier(verifier_options));

  verikit::task::TaskExecutorOptions executor_options;
  executor_options.grace_period_ms = config.grace_period_ms;
  executor_options.max_attempts = config.max_retries + 1;
  verikit::task::TaskExecutor executor(verifier, executor_options);

  verikit::task::SchedulerOptions scheduler_options;
  scheduler_options.max_concurrency = config.parallel;
  scheduler_options.task_timeout_seconds = config.timeout_seconds;
  scheduler_options.fail_fast = config.fail_fast;
  verikit::task::Scheduler scheduler(graph.value(), executor, scheduler_options);

  const std::vector<std::string> requested(1, config.target);
  if (config.dry_run) {
    verikit::api::Result<verikit::task::ExecutionSession> plan = scheduler.Plan(requested);
    if (!plan.ok()) return Fail("plan", plan.status());
    PrintPlan(plan.value(), graph.value(), *verifier);
    return 0;
  }

  ConsoleObserver observer;
  scheduler.SetObserver(&observer);
  verikit::api::Result<verikit::task::ExecutionSession> session = scheduler.Run(requested);
  if (!session.ok()) return Fail("run", session.status());

  verikit::api::Result<verikit::task::SessionSummary> summary =
      verikit::task::ResultAggregator::Summarize(session.value());
  if (!summary.ok()) return Fail("aggregate", summary.status());

  verikit::report::IReporter* reporter =
      verikit_create_json_summary_reporter(config.summary_path.c_str());
  if (reporter == NULL) {
    std::fprintf(stderr, "cannot create summary reporter for '%s'\n", config.summary_path.c_str());
    return kExitInternalError;
  }
  const verikit::api::Status written = reporter->Report(summary.value());
  verikit_destroy_reporter(reporter);
  if (!written.ok()) {
    std::fprintf(stderr, "summary: %s\n", written.ToString().c_str());
    return kExitInternalError;
  }

  PrintSummary(summary.value(), config.summary_path);
  if (executor.abandoned_count() > 0) {
    std::fprintf(stderr, "warning: %llu verifier invocation(s) ignored cancellation\n",
                 static_cast<unsigned long long>(executor.abandoned_count()));
  }
  return verikit::task::ExitCodeFor(summary.value().overall);
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program = argc > 0 ? argv[0] : "verikit_run";

  verikit::config::RunConfig config;
  verikit::api::Status st = verikit::config::BuildRunConfig(argc, argv, &config);
  if (st.ok()) st = verikit::config::ValidateRunConfig(config);
  if (!st.ok()) {
    std::fprintf(stderr, "error: %s\n\n%s", st.message().c_str(),
                 verikit::config::UsageText(program).c_str());
    return kExitConfigError;
  }
  if (config.show_help) {
    std::printf("%s", verikit::config::UsageText(program).c_str());
    return 0;
  }
  if (config.show_version) {
    std::printf("verikit_run %s\n", verikit::api::kVersionString);
    return 0;
  }

  verikit::log::ILogManager* logger = verikit_create_log_manager();
  if (logger == NULL) {
    std::fprintf(stderr, "create logger failed\n");
    return kExitInternalError;
  }
  st = logger->Init(program, config.log_config);
  if (!st.ok()) {
    std::fprintf(stderr, "logging init failed: %s\n", st.ToString().c_str());
    verikit_destroy_log_manager(logger);
    return kExitConfigError;
  }
  if (config.verbose) {
    st = logger->SetVerbosity(1);
    if (!st.ok()) std::fprintf(stderr, "verbose logging unavailable: %s\n", st.ToString().c_str());
  }

  const int code = RunSession(config);

  st = logger->Shutdown();
  if (!st.ok()) std::fprintf(stderr, "logging shutdown failed: %s\n", st.ToString().c_str());
  verikit_destroy_log_manager(logger);
  return code;
}
