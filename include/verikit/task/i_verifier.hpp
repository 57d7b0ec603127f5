#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "verikit/api/status.hpp"
#include "verikit/api/version.hpp"
#include "verikit/task/cancellation.hpp"
#include "verikit/task/task_types.hpp"

namespace verikit {
namespace task {

struct VerifierRequest {
  std::string task_id;
  TaskKind kind = TaskKind::kCustom;
  std::string target;
  std::vector<std::string> extra_args;
  std::map<std::string, std::string> params;
  std::uint32_t timeout_seconds = 0;  // 0 means no deadline.
};

struct VerifierResult {
  int exit_code = 0;
  double duration_seconds = 0.0;
  std::string log_path;
  // True when the Verifier terminated the check itself because of the
  // deadline or a cancellation request.
  bool terminated = false;
};

class IVerifier {
 public:
  virtual ~IVerifier() {}

  // 返回实现名称，便于日志中定位使用的是哪种验证后端。
  virtual const char* Name() const = 0;

  // 返回当前对象遵循的接口版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 执行一个任务的验证。
  // 参数：
  // - request: 任务标识、类型、目标以及超时秒数（0 表示不限时）。
  // - cancel: 取消令牌，不为空。被取消后实现必须尽快终止底层检查并返回，
  //   此时 terminated = true。
  // 返回：
  // - kOk：value 为进程风格的退出码（0 表示通过）、耗时与日志路径。
  // - 其他：验证器自身无法执行（例如进程无法启动）。
  // 线程安全：必须允许多个线程同时调用。
  virtual api::Result<VerifierResult> Execute(const VerifierRequest& request,
                                              const CancellationToken* cancel) = 0;
};

}  // namespace task
}  // namespace verikit
