#include "verikit/log/log_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace verikit {
namespace log {
namespace {

struct LogState {
  std::mutex mu;
  LoggingOptions options;
  std::string base_dir;
  std::string session_dir;
  std::string output_dir;
  std::unique_ptr<google::LogSink> sink;
  bool initialized = false;
  bool failure_handler_installed = false;
};

LogState& State() {
  static LogState state;
  return state;
}

std::string BaseName(const std::string& path) {
  const size_t end = path.find_last_not_of('/');
  if (end == std::string::npos) return std::string();
  const size_t pos = path.find_last_of('/', end);
  return pos == std::string::npos ? path.substr(0, end + 1) : path.substr(pos + 1, end - pos);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  return left[left.size() - 1] == '/' ? left + right : left + "/" + right;
}

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
    current = JoinPath(current, part);
    errno = 0;
    if (!IsDirectory(current) && mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
      return false;
    }
  }
  return IsDirectory(path);
}

std::string Trim(const std::string& s) {
  const size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return std::string();
  const size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseBool(const std::string& value, bool* out) {
  const std::string v = ToLower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& value, int* out) {
  if (value.empty()) return false;
  char* end = NULL;
  errno = 0;
  const long parsed = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || end == NULL || *end != '\0') return false;
  *out = static_cast<int>(parsed);
  return true;
}

bool ParseLevel(const std::string& value, int* out) {
  const std::string v = ToLower(value);
  if (v == "info") {
    *out = google::GLOG_INFO;
  } else if (v == "warning" || v == "warn") {
    *out = google::GLOG_WARNING;
  } else if (v == "error") {
    *out = google::GLOG_ERROR;
  } else if (v == "fatal") {
    *out = google::GLOG_FATAL;
  } else if (!ParseInt(v, out) || *out < 0 || *out > 3) {
    return false;
  }
  return true;
}

bool ParseFormat(const std::string& value, LogFormat* out) {
  const std::string v = ToLower(value);
  if (v == "glog" || v == "default") {
    *out = LogFormat::kGlog;
  } else if (v == "simple" || v == "text") {
    *out = LogFormat::kSimple;
  } else if (v == "json" || v == "jsonl") {
    *out = LogFormat::kJson;
  } else {
    return false;
  }
  return true;
}

typedef bool (*OptionSetter)(const std::string& value, LoggingOptions* options);

#define VK_BOOL_SETTER(field)                                                 \
  [](const std::string& v, LoggingOptions* o) { return ParseBool(v, &o->field); }

struct OptionKey {
  const char* key;
  OptionSetter set;
};

const OptionKey kOptionKeys[] = {
    {"log_dir", [](const std::string& v, LoggingOptions* o) {
       o->log_dir = v;
       return true;
     }},
    {"session_subdir", VK_BOOL_SETTER(session_subdir)},
    {"format", [](const std::string& v, LoggingOptions* o) { return ParseFormat(v, &o->format); }},
    {"async_sink", VK_BOOL_SETTER(async_sink)},
    {"async_queue_size", [](const std::string& v, LoggingOptions* o) {
       int n = 0;
       if (!ParseInt(v, &n) || n <= 0) return false;
       o->async_queue_size = n;
       return true;
     }},
    {"async_drop_when_full", VK_BOOL_SETTER(async_drop_when_full)},
    {"logtostderr", VK_BOOL_SETTER(logtostderr)},
    {"colorlogtostderr", VK_BOOL_SETTER(colorlogtostderr)},
    {"install_failure_signal_handler", VK_BOOL_SETTER(install_failure_signal_handler)},
    {"minloglevel", [](const std::string& v, LoggingOptions* o) {
       return ParseLevel(v, &o->min_log_level);
     }},
    {"v", [](const std::string& v, LoggingOptions* o) {
       int n = 0;
       if (!ParseInt(v, &n) || n < 0) return false;
       o->verbosity = n;
       return true;
     }},
};

#undef VK_BOOL_SETTER

std::tm LocalTime(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

std::string SessionDirName() {
  const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  const std::tm tm = LocalTime(t);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
  return std::string(buf);
}

std::string LinePrefixTime() {
  using namespace std::chrono;
  const system_clock::time_point now = system_clock::now();
  const std::tm tm = LocalTime(system_clock::to_time_t(now));
  const long long micros =
      duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000LL;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
  return std::string(buf);
}

char SeverityChar(google::LogSeverity severity) {
  static const char kLevels[] = {'I', 'W', 'E', 'F'};
  const int idx = std::max(0, std::min(3, static_cast<int>(severity)));
  return kLevels[idx];
}

std::string EscapeJson(const std::string& input) {
  std::ostringstream out;
  for (std::string::const_iterator it = input.begin(); it != input.end(); ++it) {
    const unsigned char c = static_cast<unsigned char>(*it);
    if (c == '\\' || c == '"') {
      out << '\\' << static_cast<char>(c);
    } else if (c == '\n') {
      out << "\\n";
    } else if (c == '\t') {
      out << "\\t";
    } else if (c < 0x20) {
      out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
          << std::dec;
    } else {
      out << static_cast<char>(c);
    }
  }
  return out.str();
}

// Writes one line per glog message to a file, optionally through a bounded
// background queue.
class LineSink : public google::LogSink {
 public:
  LineSink(const std::string& file_path, LogFormat format, bool async_mode, int queue_size,
           bool drop_when_full)
      : stream_(file_path.c_str(), std::ios::app),
        format_(format),
        async_mode_(async_mode),
        queue_size_(static_cast<size_t>(std::max(1, queue_size))),
        drop_when_full_(drop_when_full),
        stopping_(false),
        dropped_(0) {
    if (async_mode_) {
      writer_ = std::thread(&LineSink::DrainLoop, this);
    }
  }

  ~LineSink() override {
    if (!async_mode_) return;
    {
      std::lock_guard<std::mutex> lock(queue_mu_);
      stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    if (writer_.joinable()) writer_.join();
  }

  void send(google::LogSeverity severity, const char*, const char* base_filename, int line,
            const std::tm*, const char* message, size_t message_len) override {
    if (!stream_.is_open()) return;
    std::string text(message != NULL ? message : "", message != NULL ? message_len : 0);
    while (!text.empty() && (text[text.size() - 1] == '\n' || text[text.size() - 1] == '\r')) {
      text.erase(text.size() - 1);
    }
    std::string formatted = Format(severity, base_filename, line, text);
    if (!async_mode_) {
      WriteLine(formatted);
      return;
    }

    std::unique_lock<std::mutex> lock(queue_mu_);
    if (queue_.size() >= queue_size_) {
      if (drop_when_full_) {
        ++dropped_;
        return;
      }
      not_full_.wait(lock, [this] { return stopping_ || queue_.size() < queue_size_; });
      if (stopping_) return;
    }
    queue_.push_back(std::move(formatted));
    lock.unlock();
    not_empty_.notify_one();
  }

 private:
  std::string Format(google::LogSeverity severity, const char* file, int line,
                     const std::string& text) const {
    std::ostringstream out;
    if (format_ == LogFormat::kJson) {
      out << "{\"ts\":\"" << LinePrefixTime() << "\",\"level\":\"" << SeverityChar(severity)
          << "\",\"src\":\"" << (file != NULL ? file : "") << ":" << line
          << "\",\"message\":\"" << EscapeJson(text) << "\"}";
    } else {
      out << LinePrefixTime() << " [" << SeverityChar(severity) << "] " << text;
    }
    return out.str();
  }

  void WriteLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(stream_mu_);
    stream_ << line << '\n';
    stream_.flush();
  }

  void DrainLoop() {
    for (;;) {
      std::string line;
      {
        std::unique_lock<std::mutex> lock(queue_mu_);
        not_empty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) break;
        line = std::move(queue_.front());
        queue_.pop_front();
      }
      not_full_.notify_one();
      WriteLine(line);
    }
    if (dropped_ > 0) {
      std::ostringstream note;
      note << "log sink dropped " << dropped_ << " messages (queue full)";
      WriteLine(Format(google::GLOG_WARNING, "log_manager.cpp", 0, note.str()));
    }
  }

  std::ofstream stream_;
  LogFormat format_;
  bool async_mode_;
  size_t queue_size_;
  bool drop_when_full_;

  std::mutex stream_mu_;
  std::mutex queue_mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<std::string> queue_;
  std::thread writer_;
  bool stopping_;
  size_t dropped_;
};

void DetachSinkLocked(LogState* state) {
  if (state->sink) {
    google::RemoveLogSink(state->sink.get());
    state->sink.reset();
  }
}

}  // namespace

LoggingOptions LogManager::ParseOptions(std::istream& input, bool* ok) {
  LoggingOptions options;
  bool success = true;
  std::string line;
  while (std::getline(input, line)) {
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 2, "//") == 0) continue;

    const size_t sep = trimmed.find_first_of("=:");
    if (sep == std::string::npos) continue;
    const std::string key = ToLower(Trim(trimmed.substr(0, sep)));
    std::string value = Trim(trimmed.substr(sep + 1));
    const size_t comment = std::min(value.find('#'), value.find("//"));
    if (comment != std::string::npos) value = Trim(value.substr(0, comment));

    for (size_t i = 0; i < sizeof(kOptionKeys) / sizeof(kOptionKeys[0]); ++i) {
      if (key == kOptionKeys[i].key) {
        if (!kOptionKeys[i].set(value, &options)) success = false;
        break;
      }
    }
  }
  if (ok != NULL) *ok = success;
  return options;
}

LoggingOptions LogManager::LoadFromFile(const std::string& path, bool* ok) {
  if (path.empty()) {
    if (ok != NULL) *ok = true;
    return LoggingOptions();
  }
  std::ifstream input(path.c_str());
  if (!input.is_open()) {
    if (ok != NULL) *ok = false;
    return LoggingOptions();
  }
  return ParseOptions(input, ok);
}

bool LogManager::Init(const std::string& app_name, const std::string& config_path) {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (state.initialized) return true;

  bool ok = true;
  const LoggingOptions options = LoadFromFile(config_path, &ok);
  if (!ok) return false;

  // Boot diagnostics go to stderr until the sinks are in place.
  FLAGS_logtostderr = true;
  const std::string program = BaseName(app_name).empty() ? "verikit" : BaseName(app_name);
  google::InitGoogleLogging(program.c_str());

  if (!ApplyOptions(options)) {
    DetachSinkLocked(&state);
    state.base_dir.clear();
    state.session_dir.clear();
    state.output_dir.clear();
    google::ShutdownGoogleLogging();
    return false;
  }
  state.initialized = true;
  return true;
}

bool LogManager::Reload(const std::string& config_path) {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return false;

  bool ok = true;
  const LoggingOptions options = LoadFromFile(config_path, &ok);
  if (!ok) return false;
  return ApplyOptions(options);
}

LoggingOptions LogManager::CurrentOptions() {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.options;
}

void LogManager::SetVerbosity(int level) {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  state.options.verbosity = std::max(0, level);
  FLAGS_v = state.options.verbosity;
}

void LogManager::Shutdown() {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return;
  DetachSinkLocked(&state);
  google::ShutdownGoogleLogging();
  state.base_dir.clear();
  state.session_dir.clear();
  state.output_dir.clear();
  state.initialized = false;
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  const int level = std::max(0, std::min(3, static_cast<int>(severity)));
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
}

bool LogManager::ApplyOptions(const LoggingOptions& options) {
  LogState& state = State();

  std::string output_dir;
  if (!options.log_dir.empty()) {
    output_dir = options.log_dir;
    if (options.session_subdir) {
      // Reuse the session directory across reloads pointing at the same base.
      if (state.session_dir.empty() || state.base_dir != options.log_dir) {
        state.session_dir = JoinPath(options.log_dir, SessionDirName());
      }
      output_dir = state.session_dir;
    } else {
      state.session_dir.clear();
    }
    if (!MakeDirectories(output_dir)) return false;
    state.base_dir = options.log_dir;
  } else {
    state.base_dir.clear();
    state.session_dir.clear();
  }
  state.output_dir = output_dir;

  // glog's own per-severity files are only written in kGlog mode with a log_dir.
  const bool glog_files = options.format == LogFormat::kGlog && !output_dir.empty();
  FLAGS_log_dir = glog_files ? output_dir : std::string();
  // Without glog files, stderr stays on so glog never falls back to /tmp.
  FLAGS_logtostderr = !glog_files;
  FLAGS_alsologtostderr = glog_files && options.logtostderr;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_v = options.verbosity;
  if (options.install_failure_signal_handler && !state.failure_handler_installed) {
    google::InstallFailureSignalHandler();
    state.failure_handler_installed = true;
  }

  DetachSinkLocked(&state);
  if (options.format != LogFormat::kGlog) {
    const bool json = options.format == LogFormat::kJson;
    const std::string file =
        JoinPath(output_dir.empty() ? "." : output_dir, json ? "verikit.jsonl" : "verikit.log");
    state.sink.reset(new LineSink(file, options.format, options.async_sink,
                                  options.async_queue_size, options.async_drop_when_full));
    google::AddLogSink(state.sink.get());
  }

  state.options = options;
  return true;
}

}  // namespace log
}  // namespace verikit
