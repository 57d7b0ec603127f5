#pragma once

#include <cstdint>
#include <string>

#include "verikit/api/status.hpp"
#include "verikit/api/version.hpp"
#include "verikit/log/log_types.hpp"

namespace verikit {
namespace log {

class ILogManager {
 public:
  virtual ~ILogManager() {}

  virtual const char* Name() const = 0;
  virtual std::uint32_t ApiVersion() const = 0;
  virtual void Release() = 0;

  // 初始化 verikit_run 的日志。
  // 参数：
  // - app_name: 程序名，作为 glog 文件名前缀，不能为空。
  // - config_path: logging.conf 路径；为空时输出到 stderr。
  // 返回：kOk 后调度器与验证器的日志才会落盘；
  //      文件不存在返回 kNotFound，内容非法返回 kInvalidArgument。
  virtual api::Status Init(const std::string& app_name,
                           const std::string& config_path) = 0;

  // 会话进行中重载配置。失败时保留原配置。
  virtual api::Status Reload(const std::string& config_path) = 0;

  // 调整 VLOG 级别（任务状态迁移在级别 1 输出）。负数按 0 处理。
  virtual api::Status SetVerbosity(int level) = 0;

  // 写一条日志。线程安全，可在工作线程中调用。
  virtual api::Status Log(LogSeverity severity, const std::string& message) = 0;

  virtual api::Result<LoggingOptions> CurrentOptions() const = 0;

  // 刷新异步队列并关闭。重复调用返回 kOk。
  virtual api::Status Shutdown() = 0;
};

}  // namespace log
}  // namespace verikit
