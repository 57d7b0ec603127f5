#include "verikit/verikit.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <sys/stat.h>
#include <sys/types.h>

namespace {

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  return left[left.size() - 1] == '/' ? left + right : left + "/" + right;
}

bool CreateDirectory(const std::string& path) {
  errno = 0;
  if (mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) return true;
  return false;
}

void RemoveTree(const std::string& path) {
  const std::string cmd = "rm -rf \"" + path + "\"";
  if (std::system(cmd.c_str()) != 0) {
    std::fprintf(stderr, "cleanup of %s failed\n", path.c_str());
  }
}

std::string TempDirectory() {
  const char* tmp = std::getenv("TMPDIR");
  if (tmp && *tmp) return tmp;
  return "/tmp";
}

std::string UniqueTestDir(const std::string& name) {
  const long long now =
      static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count());
  return JoinPath(TempDirectory(), "verikit_log_" + name + "_" + std::to_string(now));
}

bool WriteTextFile(const std::string& path, const std::string& content) {
  std::ofstream out(path.c_str());
  if (!out.is_open()) return false;
  out << content;
  return out.good();
}

std::string ReadTextFile(const std::string& path) {
  std::ifstream in(path.c_str());
  if (!in.is_open()) return std::string();
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool TestReloadBeforeInitFails() { return !verikit::log::LogManager::Reload("not_used.conf"); }

bool TestParseOptions() {
  std::istringstream input(
      "# comment\n"
      "log_dir = /var/log/verikit\n"
      "FORMAT = json   # trailing comment\n"
      "async_sink: on\n"
      "minloglevel = warning\n"
      "unknown_key = ignored\n"
      "v = 2\n");
  bool ok = false;
  const verikit::log::LoggingOptions opts = verikit::log::LogManager::ParseOptions(input, &ok);
  if (!ok) return false;
  if (opts.log_dir != "/var/log/verikit" || opts.format != verikit::log::LogFormat::kJson) {
    return false;
  }
  if (!opts.async_sink || opts.min_log_level != 1 || opts.verbosity != 2) return false;

  std::istringstream bad("async_queue_size = 0\nv = 3\n");
  const verikit::log::LoggingOptions partial = verikit::log::LogManager::ParseOptions(bad, &ok);
  return !ok && partial.verbosity == 3;
}

bool TestJsonAsyncSinkWritesFile() {
  const std::string root = UniqueTestDir("json_async");
  const std::string logs_dir = JoinPath(root, "logs");
  const std::string cfg = JoinPath(root, "logging.conf");
  if (!CreateDirectory(root)) return false;

  const std::string config =
      "log_dir = " + logs_dir + "\n" + "session_subdir = false\n" + "format = json\n" +
      "async_sink = true\n" + "async_queue_size = 256\n" + "async_drop_when_full = false\n" +
      "install_failure_signal_handler = false\n" + "logtostderr = false\n";
  if (!WriteTextFile(cfg, config)) return false;

  if (!verikit::log::LogManager::Init("log_tests", cfg)) return false;
  const verikit::log::LoggingOptions opts = verikit::log::LogManager::CurrentOptions();
  if (opts.format != verikit::log::LogFormat::kJson || !opts.async_sink ||
      opts.async_queue_size != 256) {
    verikit::log::LogManager::Shutdown();
    return false;
  }

  verikit::log::LogManager::Log(verikit::log::LogSeverity::kInfo, "hello-json");
  verikit::log::LogManager::Log(verikit::log::LogSeverity::kError, "error-json");
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  verikit::log::LogManager::Shutdown();

  const std::string body = ReadTextFile(JoinPath(logs_dir, "verikit.jsonl"));
  const bool ok = body.find("\"message\":\"hello-json\"") != std::string::npos &&
                  body.find("\"level\":\"E\"") != std::string::npos;
  RemoveTree(root);
  return ok;
}

bool TestReloadInvalidConfigKeepsOptions() {
  const std::string root = UniqueTestDir("reload_invalid");
  const std::string logs_dir = JoinPath(root, "logs");
  const std::string good_cfg = JoinPath(root, "good.conf");
  const std::string bad_cfg = JoinPath(root, "bad.conf");
  if (!CreateDirectory(root)) return false;

  const std::string good = "log_dir = " + logs_dir + "\n" + "session_subdir = true\n" +
                           "format = simple\n" + "v = 2\n" +
                           "install_failure_signal_handler = false\n";
  const std::string bad = "v = not_a_number\n";
  if (!WriteTextFile(good_cfg, good) || !WriteTextFile(bad_cfg, bad)) return false;

  if (!verikit::log::LogManager::Init("log_tests", good_cfg)) return false;
  const verikit::log::LoggingOptions before = verikit::log::LogManager::CurrentOptions();
  const bool reload_ok = verikit::log::LogManager::Reload(bad_cfg);
  const verikit::log::LoggingOptions after = verikit::log::LogManager::CurrentOptions();
  verikit::log::LogManager::Shutdown();

  RemoveTree(root);
  if (reload_ok) return false;
  return before.verbosity == after.verbosity && before.format == after.format &&
         after.verbosity == 2;
}

bool TestSetVerbosity() {
  if (!verikit::log::LogManager::Init("log_tests")) return false;
  verikit::log::LogManager::SetVerbosity(1);
  const int level = verikit::log::LogManager::CurrentOptions().verbosity;
  verikit::log::LogManager::SetVerbosity(-5);
  const int clamped = verikit::log::LogManager::CurrentOptions().verbosity;
  verikit::log::LogManager::Shutdown();
  return level == 1 && clamped == 0;
}

bool TestFactoryLogManager() {
  if (verikit_get_api_version() != verikit::api::kApiVersion) return false;
  verikit::log::ILogManager* logger = verikit_create_log_manager();
  if (logger == NULL) return false;
  bool ok = logger->ApiVersion() == verikit::api::kApiVersion &&
            std::string(logger->Name()) == "verikit.log.glog_manager";

  const verikit::api::Status empty_app = logger->Init("", "");
  ok = ok && !empty_app.ok() && empty_app.code() == verikit::api::StatusCode::kInvalidArgument;

  const verikit::api::Status missing = logger->Init("log_tests", "/nonexistent/verikit.conf");
  ok = ok && missing.code() == verikit::api::StatusCode::kNotFound;
  ok = ok && !logger->Reload("/nonexistent/verikit.conf").ok();

  const verikit::api::Status st = logger->Init("log_tests", "");
  ok = ok && st.ok();
  ok = ok && logger->SetVerbosity(2).ok();
  verikit::api::Result<verikit::log::LoggingOptions> current = logger->CurrentOptions();
  ok = ok && current.ok() && current.value().verbosity == 2;
  ok = ok && logger->Log(verikit::log::LogSeverity::kInfo, "factory logger").ok();
  ok = ok && logger->Shutdown().ok() && logger->Shutdown().ok();
  verikit_destroy_log_manager(logger);
  return ok;
}

}  // namespace

int main() {
  struct Case {
    const char* name;
    bool (*fn)();
  };
  const Case cases[] = {{"reload_before_init", TestReloadBeforeInitFails},
                        {"parse_options", TestParseOptions},
                        {"json_async_sink", TestJsonAsyncSinkWritesFile},
                        {"reload_invalid_keep_options", TestReloadInvalidConfigKeepsOptions},
                        {"set_verbosity", TestSetVerbosity},
                        {"factory_log_manager", TestFactoryLogManager}};

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
    const bool ok = cases[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << cases[i].name << '\n';
    if (!ok) ++failed;
  }
  return failed == 0 ? 0 : 1;
}
