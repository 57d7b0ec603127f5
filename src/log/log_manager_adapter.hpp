#pragma once

#include "verikit/log/ilog_manager.hpp"

namespace verikit {
namespace log {

// ILogManager over the process-wide LogManager. Instances share one glog
// state, so at most one should be initialized at a time.
class LogManagerAdapter : public ILogManager {
 public:
  LogManagerAdapter() : initialized_(false) {}
  ~LogManagerAdapter() override;

  const char* Name() const override;
  std::uint32_t ApiVersion() const override;
  void Release() override;

  api::Status Init(const std::string& app_name, const std::string& config_path) override;
  api::Status Reload(const std::string& config_path) override;
  api::Status SetVerbosity(int level) override;
  api::Status Log(LogSeverity severity, const std::string& message) override;
  api::Result<LoggingOptions> CurrentOptions() const override;
  api::Status Shutdown() override;

 private:
  bool initialized_;
};

}  // namespace log
}  // namespace verikit
