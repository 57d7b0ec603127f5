#pragma once

#include <cstdint>

#include "verikit/api/status.hpp"
#include "verikit/task/result_aggregator.hpp"

namespace verikit {
namespace report {

class IReporter {
 public:
  virtual ~IReporter() {}

  // 返回实现名称。
  virtual const char* Name() const = 0;

  // 返回实现遵循的 API 版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放对象本身。调用后指针失效。
  virtual void Release() = 0;

  // 输出一次会话的汇总结果。不修改 summary。
  // 返回：写入失败时返回 kIoError。
  virtual api::Status Report(const task::SessionSummary& summary) = 0;
};

}  // namespace report
}  // namespace verikit
