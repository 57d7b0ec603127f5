#pragma once

#include <istream>
#include <string>

#include "verikit/api/export.hpp"
#include "verikit/log/log_types.hpp"

namespace verikit {
namespace log {

class VERIKIT_API LogManager {
 public:
  // Initialize glog with an application name and optional config file.
  // A second call without Shutdown in between is a no-op returning true.
  static bool Init(const std::string& app_name, const std::string& config_path = std::string());

  // Reload configuration at runtime. On failure the applied options are kept.
  static bool Reload(const std::string& config_path);

  static LoggingOptions CurrentOptions();

  // Raise the VLOG level without touching the rest of the options.
  static void SetVerbosity(int level);

  static void Shutdown();

  // Log without exposing glog headers to callers.
  static void Log(LogSeverity severity, const std::string& message);

  // Parse "key = value" lines. Unknown keys are ignored; a malformed value
  // clears *ok but parsing continues.
  static LoggingOptions ParseOptions(std::istream& input, bool* ok);

 private:
  static bool ApplyOptions(const LoggingOptions& options);
  static LoggingOptions LoadFromFile(const std::string& path, bool* ok);
};

}  // namespace log
}  // namespace verikit
