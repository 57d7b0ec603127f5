#include "verikit/verikit.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>

namespace {

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  return left[left.size() - 1] == '/' ? left + right : left + "/" + right;
}

std::string UniqueTestDir(const std::string& name) {
  const char* tmp = std::getenv("TMPDIR");
  const std::string base = (tmp != NULL && *tmp) ? tmp : "/tmp";
  const long long now =
      static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count());
  const std::string dir = JoinPath(base, "verikit_config_" + name + "_" + std::to_string(now));
  errno = 0;
  if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) return std::string();
  return dir;
}

void RemoveTree(const std::string& path) {
  const std::string cmd = "rm -rf \"" + path + "\"";
  if (std::system(cmd.c_str()) != 0) {
    std::fprintf(stderr, "cleanup of %s failed\n", path.c_str());
  }
}

bool WriteTextFile(const std::string& path, const std::string& content) {
  std::ofstream out(path.c_str());
  if (!out.is_open()) return false;
  out << content;
  return out.good();
}

bool FileExists(const std::string& path) {
  struct stat info;
  return stat(path.c_str(), &info) == 0;
}

bool IsConfigError(const verikit::api::Status& st, std::uint32_t detail_id) {
  return st.Is(verikit::api::ErrorModule::kConfig, detail_id);
}

verikit::json::Json MustParse(const std::string& text) {
  verikit::api::Result<verikit::json::Json> parsed = verikit::json::JsonCodec::Parse(text);
  return parsed.ok() ? parsed.value() : verikit::json::Json();
}

}  // namespace

bool TestRunConfigDefaults() {
  const verikit::config::RunConfig config;
  return config.target == "all" && config.parallel == 0 && config.timeout_seconds == 0 &&
         config.grace_period_ms == 2000 && !config.fail_fast &&
         config.summary_path == "verikit-summary.json" && config.log_dir == "logs" &&
         verikit::config::ValidateRunConfig(config).ok();
}

bool TestParseRunConfigFile() {
  std::istringstream input(
      "# run configuration\n"
      "target = Safety\n"
      "PARALLEL = 4   # trailing comment\n"
      "timeout: 600\n"
      "grace_ms = 500\n"
      "max_retries = 2\n"
      "fail_fast = yes\n"
      "summary = out/summary.json\n"
      "unknown_key = ignored\n"
      "\n"
      "// also a comment\n"
      "verbose = on\n");
  verikit::config::RunConfig config;
  if (!verikit::config::ParseRunConfig(input, &config).ok()) return false;
  return config.target == "Safety" && config.parallel == 4 && config.timeout_seconds == 600 &&
         config.grace_period_ms == 500 && config.max_retries == 2 && config.fail_fast &&
         config.summary_path == "out/summary.json" && config.verbose;
}

bool TestParseRunConfigRejectsBadValues() {
  const char* const bad_inputs[] = {"parallel = 0\n", "parallel = 5000\n", "timeout = -1\n",
                                    "timeout = ten\n", "fail_fast = maybe\n", "max_retries = 101\n",
                                    "target = Types\nno separator here\n"};
  for (std::size_t i = 0; i < sizeof(bad_inputs) / sizeof(bad_inputs[0]); ++i) {
    std::istringstream input(bad_inputs[i]);
    verikit::config::RunConfig config;
    const verikit::api::Status st = verikit::config::ParseRunConfig(input, &config);
    if (st.ok() || !IsConfigError(st, verikit::api::detail::kConfigInvalidOption)) return false;
  }

  std::istringstream second_line("target = Types\ntimeout = x\n");
  verikit::config::RunConfig config;
  const verikit::api::Status st = verikit::config::ParseRunConfig(second_line, &config);
  return !st.ok() && st.message().find("line 2") != std::string::npos;
}

bool TestParseCommandLine() {
  const char* argv[] = {"verikit_run", "-t", "30", "--parallel", "2", "--fail-fast",
                        "--max-retries", "3", "--log-dir", "out/logs", "--dry-run", "Liveness"};
  verikit::config::RunConfig config;
  const verikit::api::Status st = verikit::config::ParseCommandLine(
      static_cast<int>(sizeof(argv) / sizeof(argv[0])), argv, &config);
  if (!st.ok()) return false;
  return config.target == "Liveness" && config.timeout_seconds == 30 && config.parallel == 2 &&
         config.max_retries == 3 && config.fail_fast && config.log_dir == "out/logs" && config.dry_run && !config.list;
}

bool TestParseCommandLineErrors() {
  verikit::config::RunConfig config;
  const char* unknown[] = {"verikit_run", "--frobnicate"};
  verikit::api::Status st = verikit::config::ParseCommandLine(2, unknown, &config);
  if (st.ok() || !IsConfigError(st, verikit::api::detail::kConfigInvalidOption)) return false;

  const char* missing_value[] = {"verikit_run", "--timeout"};
  st = verikit::config::ParseCommandLine(2, missing_value, &config);
  if (st.ok()) return false;

  const char* two_targets[] = {"verikit_run", "Safety", "Liveness"};
  st = verikit::config::ParseCommandLine(3, two_targets, &config);
  if (st.ok()) return false;

  const char* zero_parallel[] = {"verikit_run", "-p", "0"};
  st = verikit::config::ParseCommandLine(3, zero_parallel, &config);
  return !st.ok() && IsConfigError(st, verikit::api::detail::kConfigInvalidOption);
}

bool TestCommandLineOverridesConfigFile() {
  const std::string root = UniqueTestDir("merge");
  if (root.empty()) return false;
  const std::string path = JoinPath(root, "verikit.conf");
  if (!WriteTextFile(path, "target = Resilience\nparallel = 8\ntimeout = 120\nfail_fast = true\n")) {
    RemoveTree(root);
    return false;
  }

  const char* argv[] = {"verikit_run", "-p", "3", "-c", path.c_str()};
  verikit::config::RunConfig config;
  const verikit::api::Status st = verikit::config::BuildRunConfig(5, argv, &config);
  RemoveTree(root);
  if (!st.ok()) return false;
  // File values survive unless the command line names them.
  return config.target == "Resilience" && config.parallel == 3 && config.timeout_seconds == 120 &&
         config.fail_fast && config.config_path == path;
}

bool TestBuildRunConfigMissingFile() {
  const char* argv[] = {"verikit_run", "--config", "/nonexistent/verikit.conf"};
  verikit::config::RunConfig config;
  const verikit::api::Status st = verikit::config::BuildRunConfig(3, argv, &config);
  return !st.ok() && IsConfigError(st, verikit::api::detail::kConfigInvalidOption);
}

bool TestUsageMentionsExitCodes() {
  const std::string usage = verikit::config::UsageText("verikit_run");
  return usage.find("Usage: verikit_run") != std::string::npos &&
         usage.find("--fail-fast") != std::string::npos &&
         usage.find("2 timeout") != std::string::npos;
}

bool TestParseTaskCatalog() {
  const verikit::json::Json document = MustParse(
      "{"
      "  \"invocations\": {\"custom\": {\"program\": \"/bin/sh\", \"args\": [\"-c\", \"{target}\"]}},"
      "  \"tasks\": ["
      "    {\"name\": \"lint\", \"kind\": \"custom\", \"target\": \"exit 0\"},"
      "    {\"name\": \"Types\", \"kind\": \"proof\", \"target\": \"proofs/Types.tla\"},"
      "    {\"name\": \"model_Small\", \"kind\": \"model\", \"target\": \"models/Small.cfg\","
      "     \"deps\": [\"Types\"], \"params\": {\"spec\": \"specs/Alpenglow.tla\"},"
      "     \"args\": [\"-deadlock\"], \"timeout\": 900}"
      "  ]"
      "}");
  verikit::api::Result<verikit::config::TaskCatalog> catalog =
      verikit::config::ParseTaskCatalog(document);
  if (!catalog.ok() || catalog.value().tasks.size() != 3) return false;

  const verikit::task::TaskDeclaration& model = catalog.value().tasks[2];
  if (model.kind != verikit::task::TaskKind::kModelCheck || model.dependencies.size() != 1 ||
      model.dependencies[0] != "Types" || model.params.at("spec") != "specs/Alpenglow.tla" ||
      model.extra_args.size() != 1 || model.timeout_seconds != 900 ||
      catalog.value().tasks[0].timeout_seconds != 0) {
    return false;
  }

  // Overridden kind replaced, others keep the built-in command lines.
  const verikit::config::InvocationTable& table = catalog.value().invocations;
  return table.at(verikit::task::TaskKind::kCustom).program == "/bin/sh" &&
         table.at(verikit::task::TaskKind::kProof).program == "tlapm" &&
         table.at(verikit::task::TaskKind::kModelCheck).program == "java";
}

bool TestMalformedCatalog() {
  const char* const documents[] = {
      "[]",
      "{\"tasks\": {}}",
      "{\"tasks\": [{\"kind\": \"proof\"}]}",
      "{\"tasks\": [{\"name\": \"A\", \"kind\": \"theorem\"}]}",
      "{\"tasks\": [{\"name\": \"A\", \"deps\": \"B\"}]}",
      "{\"tasks\": [{\"name\": \"A\", \"params\": {\"n\": 3}}]}",
      "{\"tasks\": [{\"name\": \"A\", \"timeout\": -5}]}",
      "{\"tasks\": [{\"name\": \"A\", \"timeout\": \"600\"}]}",
      "{\"invocations\": {\"fuzz\": {\"program\": \"x\"}}, \"tasks\": []}",
      "{\"invocations\": {\"proof\": {\"args\": []}}, \"tasks\": []}",
  };
  for (std::size_t i = 0; i < sizeof(documents) / sizeof(documents[0]); ++i) {
    verikit::api::Result<verikit::config::TaskCatalog> catalog =
        verikit::config::ParseTaskCatalog(MustParse(documents[i]));
    if (catalog.ok() ||
        !IsConfigError(catalog.status(), verikit::api::detail::kConfigCatalogMalformed)) {
      std::cout << "  accepted: " << documents[i] << "\n";
      return false;
    }
  }
  return true;
}

bool TestLoadTaskCatalogFile() {
  const std::string root = UniqueTestDir("catalog");
  if (root.empty()) return false;
  const std::string good = JoinPath(root, "tasks.json");
  const std::string broken = JoinPath(root, "broken.json");
  const bool written =
      WriteTextFile(good, "{\"tasks\": [{\"name\": \"A\"}, {\"name\": \"B\", \"deps\": [\"A\"]}]}") &&
      WriteTextFile(broken, "{\"tasks\": [");
  if (!written) {
    RemoveTree(root);
    return false;
  }

  verikit::api::Result<verikit::config::TaskCatalog> loaded = verikit::config::LoadTaskCatalog(good);
  verikit::api::Result<verikit::config::TaskCatalog> parse_error =
      verikit::config::LoadTaskCatalog(broken);
  verikit::api::Result<verikit::config::TaskCatalog> missing =
      verikit::config::LoadTaskCatalog(JoinPath(root, "missing.json"));
  RemoveTree(root);

  if (!loaded.ok() || loaded.value().tasks.size() != 2) return false;
  if (loaded.value().tasks[0].kind != verikit::task::TaskKind::kCustom) return false;
  return !parse_error.ok() &&
         IsConfigError(parse_error.status(), verikit::api::detail::kConfigCatalogMalformed) &&
         !missing.ok() &&
         IsConfigError(missing.status(), verikit::api::detail::kConfigCatalogMalformed);
}

bool TestDefaultCatalogContents() {
  const verikit::config::TaskCatalog catalog = verikit::config::DefaultCatalog();
  std::size_t proofs = 0;
  std::size_t models = 0;
  std::size_t harnesses = 0;
  for (std::size_t i = 0; i < catalog.tasks.size(); ++i) {
    switch (catalog.tasks[i].kind) {
      case verikit::task::TaskKind::kProof:
        ++proofs;
        break;
      case verikit::task::TaskKind::kModelCheck:
        ++models;
        break;
      case verikit::task::TaskKind::kTestHarness:
        ++harnesses;
        break;
      default:
        break;
    }
  }
  if (proofs != 6 || models != 6 || harnesses != 5 || catalog.invocations.size() != 4) return false;

  std::map<std::string, std::uint32_t> caps;
  for (std::size_t i = 0; i < catalog.tasks.size(); ++i) {
    caps[catalog.tasks[i].name] = catalog.tasks[i].timeout_seconds;
  }
  return caps["model_Small"] == 600 && caps["model_Medium"] == 1800 &&
         caps["model_LargeScale"] == 3600 && caps["model_Adversarial"] == 3600 &&
         caps["model_Boundary"] == 0 && caps["Types"] == 0;
}

bool TestJsonCodec() {
  verikit::api::Result<verikit::json::Json> bad = verikit::json::JsonCodec::Parse("{\"a\": ");
  if (bad.ok() ||
      !bad.status().Is(verikit::api::ErrorModule::kJson, verikit::api::detail::kJsonParseFailed)) {
    return false;
  }

  const std::string root = UniqueTestDir("json");
  if (root.empty()) return false;
  const std::string path = JoinPath(root, "value.json");
  verikit::json::Json value = {{"name", "Safety"}, {"deps", {"Utils"}}};
  const verikit::api::Status saved = verikit::json::JsonCodec::SaveFile(path, value);
  verikit::api::Result<verikit::json::Json> loaded = verikit::json::JsonCodec::LoadFile(path);
  const verikit::api::Status unwritable =
      verikit::json::JsonCodec::SaveFile(JoinPath(root, "no/such/dir.json"), value);
  RemoveTree(root);

  if (!saved.ok() || !loaded.ok() || loaded.value() != value || unwritable.ok() ||
      !unwritable.Is(verikit::api::ErrorModule::kJson, verikit::api::detail::kJsonWriteFailed)) {
    return false;
  }

  // A log path taken from the command line need not be valid UTF-8.
  const std::string root2 = UniqueTestDir("json_utf8");
  if (root2.empty()) return false;
  const std::string summary_path = JoinPath(root2, "summary.json");
  const verikit::json::Json raw = {{"log_path", std::string("logs/\xff\xfe/Types.log")}};
  const verikit::api::Status raw_saved = verikit::json::JsonCodec::SaveFile(summary_path, raw);
  verikit::api::Result<verikit::json::Json> reread = verikit::json::JsonCodec::LoadFile(summary_path);
  const bool tmp_left = FileExists(summary_path + ".tmp");
  RemoveTree(root2);
  return raw_saved.ok() && reread.ok() && reread.value().at("log_path").is_string() && !tmp_left;
}

verikit::task::SessionSummary SampleSummary() {
  verikit::task::SessionSummary summary;
  summary.requested.push_back("Utils");
  summary.max_concurrency = 2;
  summary.task_timeout_seconds = 60;
  summary.overall = verikit::task::OverallStatus::kFailure;
  summary.total_duration_seconds = 1.5;
  summary.started_at = std::chrono::system_clock::now();
  summary.finished_at = summary.started_at;

  verikit::task::TaskSummary types;
  types.name = "Types";
  types.status = verikit::task::TaskStatus::kFailed;
  types.duration_seconds = 1.25;
  types.exit_code = 2;
  types.log_path = "logs/Types.log";
  types.launched = true;
  types.attempts = 2;
  summary.tasks.push_back(types);

  verikit::task::TaskSummary utils;
  utils.name = "Utils";
  utils.status = verikit::task::TaskStatus::kFailed;
  utils.dependencies.push_back("Types");
  utils.requested = true;
  utils.note = "dependency 'Types' failed";
  summary.tasks.push_back(utils);

  summary.counts.total = 2;
  summary.counts.failed = 2;
  summary.counts.propagated = 1;
  return summary;
}

bool TestSummaryJsonFields() {
  const verikit::json::Json doc =
      verikit::report::JsonSummaryReporter::ToJson(SampleSummary());
  if (doc.at("overall_status") != "failure" || doc.at("exit_code") != 1) return false;
  if (doc.at("counts").at("propagated") != 1 || doc.at("counts").at("total") != 2) return false;
  if (doc.at("max_concurrency") != 2 || doc.at("task_timeout_seconds") != 60) return false;
  if (!doc.at("started_at").is_string() || doc.at("started_at").get<std::string>().empty()) {
    return false;
  }

  const verikit::json::Json& tasks = doc.at("tasks");
  if (!tasks.is_array() || tasks.size() != 2) return false;
  const verikit::json::Json& types = tasks[0];
  const verikit::json::Json& utils = tasks[1];
  return types.at("id") == "Types" && types.at("status") == "failed" &&
         types.at("exit_code") == 2 && types.at("log_path") == "logs/Types.log" &&
         types.at("attempts") == 2 && utils.find("exit_code") == utils.end() &&
         utils.find("attempts") == utils.end() &&
         utils.at("note") == "dependency 'Types' failed" && utils.at("requested") == true &&
         utils.at("dependencies").size() == 1;
}

bool TestReporterWritesFile() {
  const std::string root = UniqueTestDir("report");
  if (root.empty()) return false;
  const std::string path = JoinPath(root, "summary.json");

  if (verikit_create_json_summary_reporter("") != NULL) {
    RemoveTree(root);
    return false;
  }
  verikit::report::IReporter* reporter = verikit_create_json_summary_reporter(path.c_str());
  if (reporter == NULL) {
    RemoveTree(root);
    return false;
  }
  const bool named = std::string(reporter->Name()) == "verikit.report.json_summary";
  const verikit::api::Status st = reporter->Report(SampleSummary());
  verikit_destroy_reporter(reporter);

  verikit::report::JsonSummaryReporter broken(JoinPath(root, "missing/dir/summary.json"));
  const verikit::api::Status failed = broken.Report(SampleSummary());

  verikit::api::Result<verikit::json::Json> written = verikit::json::JsonCodec::LoadFile(path);
  RemoveTree(root);
  return named && st.ok() && written.ok() && written.value().at("overall_status") == "failure" &&
         !failed.ok() &&
         failed.Is(verikit::api::ErrorModule::kReport, verikit::api::detail::kReportWriteFailed);
}

bool TestStatusToString() {
  const verikit::api::Status cycle = verikit::api::Status::FromModule(
      verikit::api::StatusCode::kInvalidArgument, "A -> B -> A", verikit::api::ErrorModule::kGraph,
      verikit::api::detail::kGraphCycleDetected);
  const std::string text = cycle.ToString();
  if (text.find("GRAPH_CYCLE_DETECTED") != 0 || text.find("A -> B -> A") == std::string::npos) {
    return false;
  }
  const verikit::api::Status unknown = verikit::api::Status::FromModule(
      verikit::api::StatusCode::kNotFound, "unknown task 'X'", verikit::api::ErrorModule::kConfig,
      verikit::api::detail::kConfigUnknownTask);
  return unknown.ToString().find("CONFIG_UNKNOWN_TASK") == 0 &&
         verikit::api::Status::Ok().ok();
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"run_config_defaults", TestRunConfigDefaults},
      {"parse_run_config_file", TestParseRunConfigFile},
      {"parse_run_config_rejects_bad_values", TestParseRunConfigRejectsBadValues},
      {"parse_command_line", TestParseCommandLine},
      {"parse_command_line_errors", TestParseCommandLineErrors},
      {"command_line_overrides_config_file", TestCommandLineOverridesConfigFile},
      {"build_run_config_missing_file", TestBuildRunConfigMissingFile},
      {"usage_mentions_exit_codes", TestUsageMentionsExitCodes},
      {"parse_task_catalog", TestParseTaskCatalog},
      {"malformed_catalog", TestMalformedCatalog},
      {"load_task_catalog_file", TestLoadTaskCatalogFile},
      {"default_catalog_contents", TestDefaultCatalogContents},
      {"json_codec", TestJsonCodec},
      {"summary_json_fields", TestSummaryJsonFields},
      {"reporter_writes_file", TestReporterWritesFile},
      {"status_to_string", TestStatusToString},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
