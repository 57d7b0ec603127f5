#include "log/log_manager_adapter.hpp"

#include <fstream>

#include "verikit/api/version.hpp"
#include "verikit/log/log_manager.hpp"

namespace verikit {
namespace log {

#define VK_LOG_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kLog)

namespace {

bool Readable(const std::string& path) {
  std::ifstream in(path.c_str());
  return in.is_open();
}

}  // namespace

LogManagerAdapter::~LogManagerAdapter() {
  if (initialized_) LogManager::Shutdown();
}

const char* LogManagerAdapter::Name() const { return "verikit.log.glog_manager"; }

std::uint32_t LogManagerAdapter::ApiVersion() const { return api::kApiVersion; }

void LogManagerAdapter::Release() { delete this; }

api::Status LogManagerAdapter::Init(const std::string& app_name,
                                    const std::string& config_path) {
  if (app_name.empty()) {
    return VK_LOG_STATUS(api::StatusCode::kInvalidArgument, "app_name is empty");
  }
  if (!config_path.empty() && !Readable(config_path)) {
    return VK_LOG_STATUS(api::StatusCode::kNotFound, "logging config not found: " + config_path);
  }
  if (!LogManager::Init(app_name, config_path)) {
    return VK_LOG_STATUS(api::StatusCode::kInvalidArgument,
                         "logging config rejected: " + config_path);
  }
  initialized_ = true;
  return api::Status::Ok();
}

api::Status LogManagerAdapter::Reload(const std::string& config_path) {
  if (!initialized_) {
    return VK_LOG_STATUS(api::StatusCode::kInvalidArgument, "reload before init");
  }
  if (config_path.empty() || !Readable(config_path)) {
    return VK_LOG_STATUS(api::StatusCode::kNotFound, "logging config not found: " + config_path);
  }
  if (!LogManager::Reload(config_path)) {
    return VK_LOG_STATUS(api::StatusCode::kInvalidArgument,
                         "logging reload rejected: " + config_path);
  }
  return api::Status::Ok();
}

api::Status LogManagerAdapter::SetVerbosity(int level) {
  LogManager::SetVerbosity(level);
  return api::Status::Ok();
}

api::Status LogManagerAdapter::Log(LogSeverity severity, const std::string& message) {
  LogManager::Log(severity, message);
  return api::Status::Ok();
}

api::Result<LoggingOptions> LogManagerAdapter::CurrentOptions() const {
  return api::Result<LoggingOptions>(LogManager::CurrentOptions());
}

api::Status LogManagerAdapter::Shutdown() {
  if (!initialized_) return api::Status::Ok();
  LogManager::Shutdown();
  initialized_ = false;
  return api::Status::Ok();
}

#undef VK_LOG_STATUS

}  // namespace log
}  // namespace verikit
