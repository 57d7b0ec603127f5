#pragma once

#include <string>

namespace verikit {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

enum class LogFormat { kGlog = 0, kSimple = 1, kJson = 2 };

// Options parsed from a logging config file and applied to glog flags.
struct LoggingOptions {
  std::string log_dir;
  bool session_subdir = true;  // <log_dir>/<timestamp>/ per run
  LogFormat format = LogFormat::kGlog;
  bool async_sink = false;
  int async_queue_size = 8192;
  bool async_drop_when_full = true;
  bool logtostderr = true;
  bool colorlogtostderr = true;
  bool install_failure_signal_handler = true;
  int min_log_level = 0;  // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int verbosity = 0;      // VLOG level
};

}  // namespace log
}  // namespace verikit
