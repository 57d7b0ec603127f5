#include "verikit/verifier/process_verifier.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace verikit {
namespace verifier {

#define VK_SPAWN_STATUS(message)                                                      \
  api::Status::FromModule(api::StatusCode::kIoError, (message), api::ErrorModule::kExec, \
                          api::detail::kExecSpawnFailed)

namespace {

const int kTimeoutExitCode = 124;

typedef std::map<std::string, std::string> Placeholders;

bool IsDirectory(const std::string& path) {
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
  return S_ISDIR(info.st_mode);
}

bool MakeDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (IsDirectory(path)) return true;
  std::string current;
  std::istringstream parts(path);
  std::string part;
  if (path[0] == '/') current = "/";
  while (std::getline(parts, part, '/')) {
    if (part.empty()) continue;
    current = current.empty() || current[current.size() - 1] == '/' ? current + part
                                                                     : current + "/" + part;
    errno = 0;
    if (!IsDirectory(current) && mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
      return false;
    }
  }
  return IsDirectory(path);
}

// Percent-escapes path separators and other awkward bytes. '%' is escaped
// too, so distinct task ids never share a log file.
std::string SafeFileName(const std::string& task_id) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(task_id.size());
  for (std::size_t i = 0; i < task_id.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(task_id[i]);
    if (c == '/' || c == '\\' || c == ' ' || c == ':' || c == '%' || c < 0x20 || c == 0x7F) {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

bool IsPlaceholderChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

// Replaces every {name} whose name is in `values`. A {name} with no value is
// reported through *missing.
std::string Substitute(const std::string& text, const Placeholders& values, std::string* missing) {
  std::string out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('{', pos);
    if (open == std::string::npos) break;
    const std::size_t close = text.find('}', open + 1);
    if (close == std::string::npos) break;
    const std::string name = text.substr(open + 1, close - open - 1);
    bool is_name = !name.empty();
    for (std::size_t i = 0; i < name.size() && is_name; ++i) is_name = IsPlaceholderChar(name[i]);
    out.append(text, pos, open - pos);
    if (!is_name) {
      out.push_back('{');
      pos = open + 1;
      continue;
    }
    Placeholders::const_iterator it = values.find(name);
    if (it == values.end()) {
      if (missing != NULL && missing->empty()) *missing = name;
      out.append(text, open, close - open + 1);
    } else {
      out += it->second;
    }
    pos = close + 1;
  }
  if (pos < text.size()) out.append(text, pos, std::string::npos);
  return out;
}

bool ReapWithin(pid_t pid, std::chrono::milliseconds window, int* status) {
  const std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + window;
  for (;;) {
    const pid_t done = waitpid(pid, status, WNOHANG);
    if (done == pid) return true;
    if (done < 0 && errno != EINTR) return true;
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void WriteAll(int fd, const std::string& text) {
  std::size_t written = 0;
  while (written < text.size()) {
    const ssize_t n = write(fd, text.data() + written, text.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    written += static_cast<std::size_t>(n);
  }
}

}  // namespace

const char* ProcessVerifier::Name() const { return "verikit.verifier.process"; }

std::uint32_t ProcessVerifier::ApiVersion() const { return api::kApiVersion; }

std::string ProcessVerifier::LogPathFor(const std::string& task_id) const {
  const std::string file = SafeFileName(task_id) + ".log";
  if (options_.log_dir.empty()) return file;
  return options_.log_dir[options_.log_dir.size() - 1] == '/' ? options_.log_dir + file
                                                              : options_.log_dir + "/" + file;
}

api::Result<std::vector<std::string> > ProcessVerifier::BuildCommand(
    const task::VerifierRequest& request) const {
  config::InvocationTable::const_iterator entry = options_.invocations.find(request.kind);
  if (entry == options_.invocations.end()) {
    return api::Result<std::vector<std::string> >(VK_SPAWN_STATUS(std::string("no invocation configured for kind ") + task::TaskKindName(request.kind)));
  }

  Placeholders values(request.params.begin(), request.params.end());
  values["target"] = request.target;
  values["task"] = request.task_id;
  values["timeout"] = std::to_string(request.timeout_seconds);
  values["log_dir"] = options_.log_dir;

  std::string missing;
  std::vector<std::string> argv;
  argv.push_back(Substitute(entry->second.program, values, &missing));
  for (std::size_t i = 0; i < entry->second.args.size(); ++i) {
    argv.push_back(Substitute(entry->second.args[i], values, &missing));
  }
  for (std::size_t i = 0; i < request.extra_args.size(); ++i) {
    argv.push_back(Substitute(request.extra_args[i], values, &missing));
  }

  if (!missing.empty()) {
    return api::Result<std::vector<std::string> >(VK_SPAWN_STATUS("task " + request.task_id + ": no value for placeholder {" + missing + "}"));
  }
  if (argv[0].empty()) {
    return api::Result<std::vector<std::string> >(VK_SPAWN_STATUS("task " + request.task_id + ": empty program"));
  }
  return api::Result<std::vector<std::string> >(argv);
}

api::Result<task::VerifierResult> ProcessVerifier::Execute(const task::VerifierRequest& request,
                                                           const task::CancellationToken* cancel) {
  api::Result<std::vector<std::string> > command = BuildCommand(request);
  if (!command.ok()) return api::Result<task::VerifierResult>(command.status());
  const std::vector<std::string>& args = command.value();

  if (!options_.log_dir.empty() && !MakeDirectories(options_.log_dir)) {
    return api::Result<task::VerifierResult>(VK_SPAWN_STATUS("cannot create log dir: " + options_.log_dir));
  }

  task::VerifierResult result;
  result.log_path = LogPathFor(request.task_id);
  const int log_fd = open(result.log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (log_fd < 0) {
    return api::Result<task::VerifierResult>(
        VK_SPAWN_STATUS("cannot open log " + result.log_path + ": " + std::strerror(errno)));
  }

  std::string header = "$";
  for (std::size_t i = 0; i < args.size(); ++i) header += " " + args[i];
  header += "\n";
  WriteAll(log_fd, header);

  // Everything the child touches is prepared before fork.
  std::vector<char*> argv;
  for (std::size_t i = 0; i < args.size(); ++i) argv.push_back(const_cast<char*>(args[i].c_str()));
  argv.push_back(NULL);
  const char* workdir = options_.workdir.empty() ? NULL : options_.workdir.c_str();
  static const char kChdirFailed[] = "verikit: chdir failed\n";
  static const char kExecFailed[] = "verikit: exec failed\n";

  const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close(log_fd);
    return api::Result<task::VerifierResult>(VK_SPAWN_STATUS(std::string("fork failed: ") + std::strerror(err)));
  }
  if (pid == 0) {
    setpgid(0, 0);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) dup2(null_fd, STDIN_FILENO);
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    if (workdir != NULL && chdir(workdir) != 0) {
      if (write(STDERR_FILENO, kChdirFailed, sizeof(kChdirFailed) - 1) < 0) _exit(127);
      _exit(127);
    }
    execvp(argv[0], &argv[0]);
    if (write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1) < 0) _exit(127);
    _exit(127);
  }

  setpgid(pid, pid);
  close(log_fd);
  VLOG(1) << "task " << request.task_id << " started pid " << pid << ": " << header.substr(2);

  const std::chrono::milliseconds poll(options_.poll_interval_ms == 0 ? 50
                                                                      : options_.poll_interval_ms);
  int status = 0;
  bool reaped = false;
  for (;;) {
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      reaped = true;
      break;
    }
    if (done < 0 && errno != EINTR) {
      const int err = errno;
      kill(-pid, SIGKILL);
      LOG(ERROR) << "waitpid on task " << request.task_id << " (pid " << pid
                 << ") failed, killed its process group";
      return api::Result<task::VerifierResult>(VK_SPAWN_STATUS(std::string("waitpid failed: ") + std::strerror(err)));
    }
    const bool expired =
        request.timeout_seconds > 0 &&
        std::chrono::steady_clock::now() - start >= std::chrono::seconds(request.timeout_seconds);
    bool cancelled = false;
    if (!expired) {
      if (cancel != NULL) {
        cancelled = cancel->WaitFor(poll);
      } else {
        std::this_thread::sleep_for(poll);
      }
    }
    if (expired || cancelled) {
      result.terminated = true;
      break;
    }
  }

  if (!reaped) {
    LOG(WARNING) << "terminating task " << request.task_id << " (pid " << pid << ")";
    kill(-pid, SIGTERM);
    if (!ReapWithin(pid, std::chrono::milliseconds(options_.kill_grace_ms), &status)) {
      kill(-pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
    }
  }

  result.duration_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  if (result.terminated) {
    result.exit_code = kTimeoutExitCode;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }
  return api::Result<task::VerifierResult>(result);
}

#undef VK_SPAWN_STATUS

}  // namespace verifier
}  // namespace verikit
